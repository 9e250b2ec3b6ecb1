/**
 * @file protocol.hpp
 * @brief mcascii protocol definitions
 *
 * Line-oriented ASCII protocol spoken by motion controllers.
 * One message per line, fields separated by single spaces.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace mc
{
namespace ascii
{

/* ========================================================================= */
/* Line format constants                                                     */
/* ========================================================================= */

/**
 * @brief Minimum line length after the terminator is stripped
 *
 * A type tag followed by at least one character. Anything shorter
 * cannot be dispatched and is rejected as TOO_SHORT.
 */
constexpr size_t MIN_FRAME_SIZE = 2;

/**
 * @brief Default receive line limit in bytes (terminator excluded)
 *
 * Controllers never send replies longer than this; a longer line
 * means the stream lost its terminator.
 */
constexpr size_t MAX_LINE_SIZE = 256;

/** @brief Separates the message body from the checksum */
constexpr char CHECKSUM_DELIMITER = ':';

/** @brief Number of hex digits in a checksum */
constexpr size_t CHECKSUM_DIGITS = 2;

/** @brief Field separator */
constexpr char FIELD_DELIMITER = ' ';

/** @brief Terminator appended by encode() */
constexpr char LINE_TERMINATOR = '\n';

/** @brief Warning flag meaning "no warning" */
constexpr const char* NO_WARNING = "--";

/* ========================================================================= */
/* Field ranges                                                              */
/* ========================================================================= */

constexpr int MIN_DEVICE_ADDRESS = 1;
constexpr int MAX_DEVICE_ADDRESS = 99;
constexpr int MAX_AXIS_NUMBER = 9;
constexpr int MAX_MESSAGE_ID = 255;

/**
 * Line formats:
 *
 * Reply: @DD A [MM ]FF SSSS WW DATA[:CC]
 * Info:  #DD A [MM ]DATA[:CC]
 * Alert: !DD A [MM ]SSSS WW[ DATA][:CC]
 *
 * - DD:   device address, 1-2 digits (1-99)
 * - A:    axis number, 1 digit (0 = whole device)
 * - MM:   optional message id, 1-3 digits (0-255)
 * - FF:   reply flag, OK or RJ
 * - SSSS: device status, BUSY or IDLE
 * - WW:   warning flag, "--" or a two letter warning code
 * - DATA: rest of the line, may contain spaces
 * - CC:   optional checksum, two hex digits
 */

/* ========================================================================= */
/* Message types                                                             */
/* ========================================================================= */

/**
 * @brief Message categories, keyed by their leading tag character
 */
enum class MessageType : char
{
  /**
   * @brief Reply to a command
   *
   * Carries reply flag, device status and warning flag.
   */
  REPLY = '@',

  /**
   * @brief Unsolicited alert
   *
   * Sent by a device when an axis finishes a movement or a warning
   * condition arises. Carries device status and warning flag.
   */
  ALERT = '!',

  /**
   * @brief Informational message
   *
   * Extra lines of a multi-line reply, or help text. Data only.
   */
  INFO = '#',
};

/* ========================================================================= */
/* Error codes                                                               */
/* ========================================================================= */

/**
 * @brief Parse and receive error codes
 *
 * Defined via errors.def for consistency with the C API.
 */
enum class ErrorCode : uint8_t
{
#define ERR(name, val, msg) name = val,
#include "mcascii/errors.def"
#undef ERR
};

/**
 * @brief Get the static message string of an error code
 */
const char* strerror(ErrorCode code);

}  // namespace ascii
}  // namespace mc
