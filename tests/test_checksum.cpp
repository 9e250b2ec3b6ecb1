/**
 * @file test_checksum.cpp
 * @brief Checksum and line framing unit tests
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <cstring>
#include <string>

#include "checksum.hpp"
#include "frame.hpp"
#include "mcascii/reader.h"
#include "mcascii/reply.hpp"

using namespace mc::ascii;

/* ========================================================================= */
/* LRC Tests                                                                 */
/* ========================================================================= */

TEST_CASE("LRC calculation")
{
  SUBCASE("Empty data")
  {
    CHECK(internal::calc_lrc("", 0) == 0x00);
  }

  SUBCASE("Single byte")
  {
    // 0x30 -> ~0x30 + 1 = 0xD0
    CHECK(internal::calc_lrc("0", 1) == 0xD0);
  }

  SUBCASE("Sum wraps to one byte")
  {
    const char data[] = {'\xFF', '\x02'};
    // 0x101 & 0xFF = 0x01 -> 0xFF
    CHECK(internal::calc_lrc(data, 2) == 0xFF);
  }

  SUBCASE("Known reply bodies")
  {
    const char* body = "01 2 OK IDLE -- DONE";
    CHECK(internal::calc_lrc(body, std::strlen(body)) == 0x95);

    body = "01 2 05 OK IDLE -- DONE";
    CHECK(internal::calc_lrc(body, std::strlen(body)) == 0x10);

    body = "01 1 IDLE --";
    CHECK(internal::calc_lrc(body, std::strlen(body)) == 0x96);
  }

  SUBCASE("Body plus checksum sums to zero")
  {
    const std::string body = "02 1 12 RJ BUSY -- BADDATA";
    unsigned int sum = internal::calc_lrc(body.data(), body.size());
    for (const char c : body)
    {
      sum += static_cast<uint8_t>(c);
    }
    CHECK((sum & 0xFF) == 0);
  }

  SUBCASE("Different data produces different checksum")
  {
    CHECK(internal::calc_lrc("01 1 A", 6) != internal::calc_lrc("01 1 B", 6));
  }
}

TEST_CASE("Checksum formatting")
{
  CHECK(internal::format_checksum(0x00) == "00");
  CHECK(internal::format_checksum(0x0A) == "0A");
  CHECK(internal::format_checksum(0x95) == "95");
  CHECK(internal::format_checksum(0xFF) == "FF");
  CHECK(compute_checksum("01 0 ") == "2F");
}

TEST_CASE("C API checksum")
{
  char out[3] = {'x', 'x', 'x'};
  mcascii_checksum("01 2 OK IDLE -- DONE", 20, out);
  CHECK(std::string(out) == "95");
}

/* ========================================================================= */
/* Framing Tests                                                             */
/* ========================================================================= */

TEST_CASE("Terminator stripping")
{
  CHECK(internal::strip_terminator("@01 1 OK IDLE -- 0\r\n") == "@01 1 OK IDLE -- 0");
  CHECK(internal::strip_terminator("@01 1 OK IDLE -- 0\n") == "@01 1 OK IDLE -- 0");
  CHECK(internal::strip_terminator("#01 0 \n") == "#01 0 ");
  CHECK(internal::strip_terminator("\r\n") == "");
  CHECK(internal::strip_terminator("") == "");
}

TEST_CASE("Checksum suffix extraction")
{
  SUBCASE("No suffix")
  {
    const internal::Frame frame = internal::split_checksum("@01 2 OK IDLE -- DONE");
    CHECK(frame.body == "@01 2 OK IDLE -- DONE");
    CHECK_FALSE(frame.checksum.has_value());
  }

  SUBCASE("Suffix present")
  {
    const internal::Frame frame = internal::split_checksum("@01 2 OK IDLE -- DONE:95");
    CHECK(frame.body == "@01 2 OK IDLE -- DONE");
    REQUIRE(frame.checksum.has_value());
    CHECK(*frame.checksum == "95");
  }

  SUBCASE("Colon elsewhere in data")
  {
    const internal::Frame frame = internal::split_checksum("#01 0 a:b");
    CHECK(frame.body == "#01 0 a:b");
    CHECK_FALSE(frame.checksum.has_value());
  }

  SUBCASE("Too short for a suffix")
  {
    const internal::Frame frame = internal::split_checksum("@1");
    CHECK(frame.body == "@1");
    CHECK_FALSE(frame.checksum.has_value());
  }
}

TEST_CASE("Checksum verification")
{
  std::string expected;

  SUBCASE("Valid checksum")
  {
    const internal::Frame frame = internal::split_checksum("@01 2 OK IDLE -- DONE:95");
    CHECK(internal::verify_checksum(frame, expected));
    CHECK(expected == "95");
  }

  SUBCASE("Lower case hex accepted")
  {
    const internal::Frame frame = internal::split_checksum("#01 0 :2f");
    CHECK(internal::verify_checksum(frame, expected));
    CHECK(expected == "2F");
  }

  SUBCASE("Corrupted checksum")
  {
    const internal::Frame frame = internal::split_checksum("@01 2 OK IDLE -- DONE:96");
    CHECK_FALSE(internal::verify_checksum(frame, expected));
    CHECK(expected == "95");
  }

  SUBCASE("Corrupted body")
  {
    const internal::Frame frame = internal::split_checksum("@01 2 OK IDLE -- DONF:95");
    CHECK_FALSE(internal::verify_checksum(frame, expected));
  }

  SUBCASE("Type tag is not covered")
  {
    const internal::Frame frame = internal::split_checksum("!01 2 OK IDLE -- DONE:95");
    CHECK(internal::verify_checksum(frame, expected));
  }
}

TEST_CASE("Decimal fields")
{
  int value = -1;

  CHECK(internal::parse_decimal("01", 2, value));
  CHECK(value == 1);

  CHECK(internal::parse_decimal("255", 3, value));
  CHECK(value == 255);

  CHECK_FALSE(internal::parse_decimal("", 2, value));
  CHECK_FALSE(internal::parse_decimal("123", 2, value));
  CHECK_FALSE(internal::parse_decimal("1a", 2, value));
  CHECK_FALSE(internal::parse_decimal("-1", 2, value));
}

TEST_CASE("Field cursor")
{
  internal::FieldCursor cursor("01 2 hello world");
  std::string_view field;

  REQUIRE(cursor.take(field));
  CHECK(field == "01");

  CHECK(cursor.peek() == "2");
  CHECK(cursor.peek_delimited());
  REQUIRE(cursor.take(field));
  CHECK(field == "2");

  CHECK(cursor.take_rest() == "hello world");
  CHECK(cursor.take_rest() == "");
  CHECK_FALSE(cursor.take(field));

  internal::FieldCursor last("IDLE");
  CHECK(last.peek() == "IDLE");
  CHECK_FALSE(last.peek_delimited());
  CHECK_FALSE(last.take(field));
}
