/**
 * @file reply.cpp
 * @brief Reply message model and codec implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "mcascii/reply.hpp"

#include <ostream>
#include <utility>

#include <fmt/core.h>

#include "checksum.hpp"
#include "frame.hpp"

namespace mc
{
namespace ascii
{

namespace
{

using internal::FieldCursor;

constexpr size_t ADDRESS_DIGITS = 2;
constexpr size_t AXIS_DIGITS = 1;
constexpr size_t MESSAGE_ID_DIGITS = 3;
constexpr size_t FLAG_LENGTH = 2;

ParseResult failure(ErrorCode code, std::string detail, std::string_view text)
{
  ParseError error;
  error.code = code;
  error.detail = std::move(detail);
  error.text = std::string(text);
  return ParseResult::failure(std::move(error));
}

bool is_reply_flag(std::string_view field)
{
  return field == "OK" || field == "RJ";
}

bool is_device_status(std::string_view field)
{
  return field == "BUSY" || field == "IDLE";
}

bool is_warning_flag(std::string_view field)
{
  return field.size() == FLAG_LENGTH;
}

/**
 * Reads "DD A " and an optional "MM " message id.
 * The id is only taken when a numeric field is followed by a delimiter.
 */
bool take_header(FieldCursor& cursor, MessageHeader& header)
{
  std::string_view field;
  int address = 0;
  int axis = 0;

  if (!cursor.take(field) || !internal::parse_decimal(field, ADDRESS_DIGITS, address) ||
      address < MIN_DEVICE_ADDRESS || address > MAX_DEVICE_ADDRESS)
  {
    return false;
  }

  if (!cursor.take(field) || !internal::parse_decimal(field, AXIS_DIGITS, axis) ||
      axis > MAX_AXIS_NUMBER)
  {
    return false;
  }

  header.device_address = address;
  header.axis_number = axis;

  int id = 0;
  if (cursor.peek_delimited() && internal::parse_decimal(cursor.peek(), MESSAGE_ID_DIGITS, id))
  {
    if (id > MAX_MESSAGE_ID || !cursor.take(field))
    {
      return false;
    }
    header.message_id = id;
  }

  return true;
}

// @DD A [MM ]FF SSSS WW DATA
ParseResult parse_reply(std::string_view body)
{
  FieldCursor cursor(body.substr(1));
  MessageHeader header;
  std::string_view flag;
  std::string_view status;
  std::string_view warning;

  if (!take_header(cursor, header) || !cursor.take(flag) || !cursor.take(status) ||
      !cursor.take(warning) || !is_reply_flag(flag) || !is_device_status(status) ||
      !is_warning_flag(warning))
  {
    return failure(ErrorCode::MALFORMED_MESSAGE, "failed to parse reply", body);
  }

  ReplyFields fields{std::string(flag), std::string(status), std::string(warning)};
  return ParseResult::success(
      ReplyMessage::make_reply(header, std::move(fields), std::string(cursor.take_rest())));
}

// #DD A [MM ]DATA
ParseResult parse_info(std::string_view body)
{
  FieldCursor cursor(body.substr(1));
  MessageHeader header;

  if (!take_header(cursor, header))
  {
    return failure(ErrorCode::MALFORMED_MESSAGE, "failed to parse info message", body);
  }

  return ParseResult::success(ReplyMessage::make_info(header, std::string(cursor.take_rest())));
}

// !DD A [MM ]SSSS WW[ DATA]
ParseResult parse_alert(std::string_view body)
{
  FieldCursor cursor(body.substr(1));
  MessageHeader header;
  std::string_view status;
  std::string_view warning;
  std::string_view data;

  if (!take_header(cursor, header) || !cursor.take(status))
  {
    return failure(ErrorCode::MALFORMED_MESSAGE, "failed to parse alert", body);
  }

  if (cursor.peek_delimited())
  {
    if (!cursor.take(warning))
    {
      return failure(ErrorCode::MALFORMED_MESSAGE, "failed to parse alert", body);
    }
    data = cursor.take_rest();
  }
  else
  {
    warning = cursor.take_rest();
  }

  if (!is_device_status(status) || !is_warning_flag(warning))
  {
    return failure(ErrorCode::MALFORMED_MESSAGE, "failed to parse alert", body);
  }

  AlertFields fields{std::string(status), std::string(warning)};
  return ParseResult::success(
      ReplyMessage::make_alert(header, std::move(fields), std::string(data)));
}

struct BodyEncoder
{
  const std::string& prefix;
  const std::string& data;

  std::string operator()(const ReplyFields& f) const
  {
    return fmt::format("@{} {} {} {} {}", prefix, f.reply_flag, f.device_status,
                       f.warning_flag, data);
  }

  std::string operator()(const AlertFields& f) const
  {
    if (data.empty())
    {
      return fmt::format("!{} {} {}", prefix, f.device_status, f.warning_flag);
    }
    return fmt::format("!{} {} {} {}", prefix, f.device_status, f.warning_flag, data);
  }

  std::string operator()(const InfoFields&) const
  {
    return fmt::format("#{} {}", prefix, data);
  }
};

std::string default_warning(std::string warning)
{
  return warning.empty() ? std::string(NO_WARNING) : warning;
}

}  // namespace

/* ========================================================================= */
/* ReplyMessage                                                              */
/* ========================================================================= */

bool operator==(const ReplyFields& a, const ReplyFields& b)
{
  return a.reply_flag == b.reply_flag && a.device_status == b.device_status &&
         a.warning_flag == b.warning_flag;
}

bool operator==(const AlertFields& a, const AlertFields& b)
{
  return a.device_status == b.device_status && a.warning_flag == b.warning_flag;
}

bool operator==(const InfoFields&, const InfoFields&)
{
  return true;
}

ReplyMessage::ReplyMessage(const MessageHeader& header, Body body, std::string data,
                           std::optional<std::string> checksum)
    : header_(header), body_(std::move(body)), data_(std::move(data)), checksum_(std::move(checksum))
{
}

ReplyMessage ReplyMessage::make_reply(const MessageHeader& header, ReplyFields fields,
                                      std::string data, std::optional<std::string> checksum)
{
  fields.warning_flag = default_warning(std::move(fields.warning_flag));
  return ReplyMessage(header, std::move(fields), std::move(data), std::move(checksum));
}

ReplyMessage ReplyMessage::make_alert(const MessageHeader& header, AlertFields fields,
                                      std::string data, std::optional<std::string> checksum)
{
  fields.warning_flag = default_warning(std::move(fields.warning_flag));
  return ReplyMessage(header, std::move(fields), std::move(data), std::move(checksum));
}

ReplyMessage ReplyMessage::make_info(const MessageHeader& header, std::string data,
                                     std::optional<std::string> checksum)
{
  return ReplyMessage(header, InfoFields{}, std::move(data), std::move(checksum));
}

MessageType ReplyMessage::message_type() const
{
  if (std::holds_alternative<ReplyFields>(body_))
  {
    return MessageType::REPLY;
  }
  if (std::holds_alternative<AlertFields>(body_))
  {
    return MessageType::ALERT;
  }
  return MessageType::INFO;
}

std::optional<std::string> ReplyMessage::reply_flag() const
{
  if (const auto* reply = std::get_if<ReplyFields>(&body_))
  {
    return reply->reply_flag;
  }
  return std::nullopt;
}

std::optional<std::string> ReplyMessage::device_status() const
{
  if (const auto* reply = std::get_if<ReplyFields>(&body_))
  {
    return reply->device_status;
  }
  if (const auto* alert = std::get_if<AlertFields>(&body_))
  {
    return alert->device_status;
  }
  return std::nullopt;
}

std::optional<std::string> ReplyMessage::warning_flag() const
{
  if (const auto* reply = std::get_if<ReplyFields>(&body_))
  {
    return reply->warning_flag;
  }
  if (const auto* alert = std::get_if<AlertFields>(&body_))
  {
    return alert->warning_flag;
  }
  return std::nullopt;
}

bool ReplyMessage::rejected() const
{
  return reply_flag() == std::optional<std::string>("RJ");
}

bool ReplyMessage::idle() const
{
  return device_status() == std::optional<std::string>("IDLE");
}

bool ReplyMessage::busy() const
{
  return device_status() == std::optional<std::string>("BUSY");
}

bool ReplyMessage::has_warning() const
{
  const auto warning = warning_flag();
  return warning && *warning != NO_WARNING;
}

ReplyMessage ReplyMessage::with_checksum(std::optional<std::string> checksum) const
{
  ReplyMessage copy(*this);
  copy.checksum_ = std::move(checksum);
  return copy;
}

bool operator==(const ReplyMessage& a, const ReplyMessage& b)
{
  return a.header_.device_address == b.header_.device_address &&
         a.header_.axis_number == b.header_.axis_number &&
         a.header_.message_id == b.header_.message_id && a.body_ == b.body_ &&
         a.data_ == b.data_ && a.checksum_ == b.checksum_;
}

/* ========================================================================= */
/* Codec                                                                     */
/* ========================================================================= */

ParseResult parse(std::string_view line)
{
  const std::string_view stripped = internal::strip_terminator(line);
  if (stripped.size() < MIN_FRAME_SIZE)
  {
    return failure(ErrorCode::TOO_SHORT, "reply string too short to be a valid reply", stripped);
  }

  internal::Frame frame = internal::split_checksum(stripped);
  if (frame.checksum)
  {
    std::string expected;
    if (!internal::verify_checksum(frame, expected))
    {
      ParseError error;
      error.code = ErrorCode::CHECKSUM_MISMATCH;
      error.detail = "possible data corruption detected";
      error.text = std::string(stripped);
      error.found = *frame.checksum;
      error.expected = expected;
      return ParseResult::failure(std::move(error));
    }
  }

  if (frame.body.empty())
  {
    return failure(ErrorCode::TOO_SHORT, "no message body before checksum", stripped);
  }

  ParseResult result = [&frame]() -> ParseResult
  {
    switch (static_cast<MessageType>(frame.body.front()))
    {
      case MessageType::REPLY:
        return parse_reply(frame.body);

      case MessageType::INFO:
        return parse_info(frame.body);

      case MessageType::ALERT:
        return parse_alert(frame.body);
    }

    ParseError error;
    error.code = ErrorCode::UNKNOWN_MESSAGE_TYPE;
    error.detail = "invalid response type";
    error.text = std::string(frame.body);
    error.found = std::string(1, frame.body.front());
    return ParseResult::failure(std::move(error));
  }();

  if (!result.ok() || !frame.checksum)
  {
    return result;
  }

  return ParseResult::success(result.value().with_checksum(std::move(frame.checksum)));
}

std::string encode(const ReplyMessage& message)
{
  const MessageHeader& header = message.header();
  const std::string prefix =
      header.message_id
          ? fmt::format("{:02d} {:d} {:02d}", header.device_address, header.axis_number,
                        *header.message_id)
          : fmt::format("{:02d} {:d}", header.device_address, header.axis_number);

  std::string line = std::visit(BodyEncoder{prefix, message.data()}, message.body());

  if (message.checksum())
  {
    line += CHECKSUM_DELIMITER;
    line += *message.checksum();
  }

  line += LINE_TERMINATOR;
  return line;
}

std::string to_string(const ReplyMessage& message)
{
  return encode(message);
}

std::ostream& operator<<(std::ostream& os, const ReplyMessage& message)
{
  return os << encode(message);
}

std::string compute_checksum(std::string_view body)
{
  return internal::format_checksum(internal::calc_lrc(body.data(), body.size()));
}

ReplyMessage seal(const ReplyMessage& message)
{
  std::string line = encode(message.with_checksum(std::nullopt));
  line.pop_back();  // terminator

  // Skip the type tag
  return message.with_checksum(compute_checksum(std::string_view(line).substr(1)));
}

}  // namespace ascii
}  // namespace mc
