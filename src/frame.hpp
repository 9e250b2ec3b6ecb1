/**
 * @file frame.hpp
 * @brief Line framing utilities (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "mcascii/protocol.hpp"

namespace mc
{
namespace ascii
{
namespace internal
{

/**
 * @brief A line split into body and optional checksum text
 *
 * body starts with the type tag and excludes the ":CC" suffix.
 */
struct Frame
{
  std::string_view body;
  std::optional<std::string> checksum;
};

/**
 * @brief Remove trailing CR/LF characters
 */
std::string_view strip_terminator(std::string_view line);

/**
 * @brief Split off a ":CC" suffix
 *
 * A checksum is present when the third character from the end is the
 * checksum delimiter. The suffix is not verified here.
 *
 * @param line Line without terminator
 */
Frame split_checksum(std::string_view line);

/**
 * @brief Verify the checksum of a frame
 *
 * Computes the LRC over body without its type tag and compares it with
 * the claimed text, ignoring hex digit case.
 *
 * @param frame    Frame with checksum set
 * @param expected Receives the computed checksum text
 * @return true if the checksum matches
 */
bool verify_checksum(const Frame& frame, std::string& expected);

/**
 * @brief Parse an unsigned decimal field
 *
 * @param field      Field text
 * @param max_digits Maximum number of digits accepted
 * @param out        Receives the value
 * @return false if field is empty, too long or not all digits
 */
bool parse_decimal(std::string_view field, size_t max_digits, int& out);

/**
 * @brief Sequential reader of space separated fields
 */
class FieldCursor
{
 public:
  explicit FieldCursor(std::string_view text) : text_(text), pos_(0) {}

  /**
   * @brief Take the next field and the delimiter behind it
   *
   * @return false if no delimiter follows the field
   */
  bool take(std::string_view& field);

  /**
   * @brief Next field without consuming it
   *
   * Runs up to the next delimiter or the end of the text.
   */
  std::string_view peek() const;

  /**
   * @brief True if the field returned by peek() is followed by a delimiter
   */
  bool peek_delimited() const;

  /**
   * @brief Take everything that is left, delimiters included
   */
  std::string_view take_rest();

 private:
  std::string_view text_;
  size_t pos_;
};

}  // namespace internal
}  // namespace ascii
}  // namespace mc
