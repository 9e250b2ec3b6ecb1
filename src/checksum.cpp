/**
 * @file checksum.cpp
 * @brief LRC checksum implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "checksum.hpp"

#include <fmt/core.h>

namespace mc
{
namespace ascii
{
namespace internal
{

uint8_t calc_lrc(const char* data, size_t len)
{
  unsigned int sum = 0;

  for (size_t i = 0; i < len; ++i)
  {
    sum += static_cast<uint8_t>(data[i]);
  }

  return static_cast<uint8_t>(((sum & 0xFF) ^ 0xFF) + 1);
}

std::string format_checksum(uint8_t value)
{
  return fmt::format("{:02X}", value);
}

}  // namespace internal
}  // namespace ascii
}  // namespace mc
