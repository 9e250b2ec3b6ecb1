/**
 * @file errors.cpp
 * @brief Error strings
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <fmt/core.h>

#include "mcascii/protocol.hpp"
#include "mcascii/result.hpp"

namespace mc
{
namespace ascii
{

const char* strerror(ErrorCode code)
{
  switch (code)
  {
#define ERR(name, val, msg) \
  case ErrorCode::name:     \
    return msg;
#include "mcascii/errors.def"
#undef ERR
  }
  return "unknown error";
}

std::string ParseError::message() const
{
  std::string out = strerror(code);

  if (!detail.empty())
  {
    out += fmt::format(": {}", detail);
  }

  if (code == ErrorCode::CHECKSUM_MISMATCH)
  {
    out += fmt::format(" (found {}, expected {})", found, expected);
  }
  else if (!found.empty())
  {
    out += fmt::format(" (found {})", found);
  }

  if (!text.empty())
  {
    out += fmt::format(" [{}]", text);
  }

  return out;
}

}  // namespace ascii
}  // namespace mc
