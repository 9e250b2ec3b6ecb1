/**
 * @file checksum.hpp
 * @brief LRC checksum calculation (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace mc
{
namespace ascii
{
namespace internal
{

/**
 * @brief Calculate longitudinal redundancy check
 *
 * Sum of all bytes truncated to 8 bits, inverted, plus one
 * (two's complement of the byte sum).
 *
 * @param data Pointer to data buffer
 * @param len  Length of data in bytes
 * @return LRC value
 */
uint8_t calc_lrc(const char* data, size_t len);

/**
 * @brief Render a checksum as two uppercase hex digits
 */
std::string format_checksum(uint8_t value);

}  // namespace internal
}  // namespace ascii
}  // namespace mc
