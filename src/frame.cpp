/**
 * @file frame.cpp
 * @brief Line framing implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "frame.hpp"

#include <cctype>

#include "checksum.hpp"

namespace mc
{
namespace ascii
{
namespace internal
{

std::string_view strip_terminator(std::string_view line)
{
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
  {
    line.remove_suffix(1);
  }
  return line;
}

Frame split_checksum(std::string_view line)
{
  Frame frame;
  frame.body = line;

  // [BODY][:][C][C]
  if (line.size() >= CHECKSUM_DIGITS + 1 &&
      line[line.size() - CHECKSUM_DIGITS - 1] == CHECKSUM_DELIMITER)
  {
    frame.checksum = std::string(line.substr(line.size() - CHECKSUM_DIGITS));
    frame.body = line.substr(0, line.size() - CHECKSUM_DIGITS - 1);
  }

  return frame;
}

bool verify_checksum(const Frame& frame, std::string& expected)
{
  // Checksum covers everything after the type tag
  const std::string_view covered = frame.body.empty() ? frame.body : frame.body.substr(1);
  expected = format_checksum(calc_lrc(covered.data(), covered.size()));

  if (!frame.checksum || frame.checksum->size() != expected.size())
  {
    return false;
  }

  for (size_t i = 0; i < expected.size(); ++i)
  {
    const auto claimed = static_cast<unsigned char>((*frame.checksum)[i]);
    if (std::toupper(claimed) != expected[i])
    {
      return false;
    }
  }

  return true;
}

bool parse_decimal(std::string_view field, size_t max_digits, int& out)
{
  if (field.empty() || field.size() > max_digits)
  {
    return false;
  }

  int value = 0;
  for (const char c : field)
  {
    if (c < '0' || c > '9')
    {
      return false;
    }
    value = value * 10 + (c - '0');
  }

  out = value;
  return true;
}

bool FieldCursor::take(std::string_view& field)
{
  const size_t end = text_.find(FIELD_DELIMITER, pos_);
  if (end == std::string_view::npos)
  {
    return false;
  }

  field = text_.substr(pos_, end - pos_);
  pos_ = end + 1;
  return true;
}

std::string_view FieldCursor::peek() const
{
  const size_t end = text_.find(FIELD_DELIMITER, pos_);
  if (end == std::string_view::npos)
  {
    return text_.substr(pos_);
  }
  return text_.substr(pos_, end - pos_);
}

bool FieldCursor::peek_delimited() const
{
  return text_.find(FIELD_DELIMITER, pos_) != std::string_view::npos;
}

std::string_view FieldCursor::take_rest()
{
  const std::string_view rest = text_.substr(pos_);
  pos_ = text_.size();
  return rest;
}

}  // namespace internal
}  // namespace ascii
}  // namespace mc
