/**
 * @file reader.cpp
 * @brief mcascii line receiver implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "mcascii/reader.hpp"

#include <utility>

#include <fmt/core.h>

#include "frame.hpp"

namespace mc
{
namespace ascii
{

const char* to_string(LogLevel level)
{
  switch (level)
  {
    case LogLevel::DEBUG:
      return "debug";
    case LogLevel::INFO:
      return "info";
    case LogLevel::WARN:
      return "warn";
    case LogLevel::ERROR:
      return "error";
  }
  return "info";
}

Reader::Reader(ReplyFn on_reply, size_t max_line)
    : on_reply_(std::move(on_reply)),
      log_(),
      buffer_(),
      max_line_(max_line == 0 ? MAX_LINE_SIZE : max_line),
      discarded_(0),
      state_(State::WAIT_START)
{
  buffer_.reserve(max_line_);
}

void Reader::feed_byte(uint8_t byte)
{
  const char c = static_cast<char>(byte);

  switch (state_)
  {
    case State::WAIT_START:
      // Skip CR/LF left over from the previous line and line noise
      if (c == '\r' || c == LINE_TERMINATOR || c == '\0')
      {
        break;
      }
      buffer_.clear();
      buffer_.push_back(c);
      state_ = State::IN_LINE;
      break;

    case State::IN_LINE:
      if (c == LINE_TERMINATOR)
      {
        handle_line();
        state_ = State::WAIT_START;
        break;
      }

      // One CR past the limit is the first half of a CRLF terminator
      if (buffer_.size() > max_line_ || (buffer_.size() == max_line_ && c != '\r'))
      {
        discarded_ = buffer_.size() + 1;
        buffer_.clear();
        state_ = State::DISCARD;
        break;
      }

      buffer_.push_back(c);
      break;

    case State::DISCARD:
      if (c == LINE_TERMINATOR)
      {
        handle_overflow();
        state_ = State::WAIT_START;
        break;
      }
      discarded_++;
      break;
  }
}

void Reader::feed(const char* data, size_t len)
{
  for (size_t i = 0; i < len; ++i)
  {
    feed_byte(static_cast<uint8_t>(data[i]));
  }
}

void Reader::handle_line()
{
  log(LogLevel::DEBUG, fmt::format("< {}", internal::strip_terminator(buffer_)));

  const ParseResult result = parse(buffer_);
  buffer_.clear();

  if (!result.ok())
  {
    log(LogLevel::WARN, result.error().message());
  }

  if (on_reply_)
  {
    on_reply_(result);
  }
}

void Reader::handle_overflow()
{
  ParseError error;
  error.code = ErrorCode::LINE_TOO_LONG;
  error.detail = fmt::format("dropped {} bytes, limit is {}", discarded_, max_line_);
  discarded_ = 0;

  log(LogLevel::WARN, error.message());

  if (on_reply_)
  {
    on_reply_(ParseResult::failure(std::move(error)));
  }
}

void Reader::reset()
{
  buffer_.clear();
  discarded_ = 0;
  state_ = State::WAIT_START;
}

void Reader::set_log_handler(LogFn log)
{
  log_ = std::move(log);
}

void Reader::log(LogLevel level, const std::string& message) const
{
  if (log_)
  {
    log_(level, message);
  }
}

}  // namespace ascii
}  // namespace mc
