/**
 * @file reader.hpp
 * @brief mcascii line receiver
 *
 * Splits a received byte stream into lines and decodes each line.
 * Performs no I/O: the transport feeds bytes in, decoded replies come
 * out through a callback.
 *
 * Example usage:
 * @code
 * Reader reader([](const ParseResult& result) {
 *   if (result.ok()) {
 *     handle(result.value());
 *   }
 * });
 *
 * reader.set_log_handler([](LogLevel level, const std::string& msg) {
 *   std::fprintf(stderr, "%s\n", msg.c_str());
 * });
 *
 * // Main loop: feed incoming serial bytes
 * while (serial_has_data()) {
 *   reader.feed_byte(serial_read_byte());
 * }
 * @endcode
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "mcascii/protocol.hpp"
#include "mcascii/reply.hpp"

namespace mc
{
namespace ascii
{

/**
 * @brief Severity passed to the log hook
 */
enum class LogLevel
{
  DEBUG,
  INFO,
  WARN,
  ERROR,
};

/**
 * @brief Get the lower case name of a log level
 */
const char* to_string(LogLevel level);

/**
 * @brief Byte-fed reply line receiver
 */
class Reader
{
 public:
  /**
   * @brief Reply callback
   *
   * Invoked once per received line with the parse result, and with
   * LINE_TOO_LONG for lines that overflowed the buffer.
   */
  using ReplyFn = std::function<void(const ParseResult&)>;

  /**
   * @brief Log hook
   */
  using LogFn = std::function<void(LogLevel, const std::string&)>;

  /**
   * @brief Construct Reader instance
   *
   * @param on_reply  Callback receiving every decoded line
   * @param max_line  Maximum line length in bytes (0 selects MAX_LINE_SIZE)
   */
  explicit Reader(ReplyFn on_reply, size_t max_line = MAX_LINE_SIZE);

  /**
   * @brief Process one received byte
   *
   * A complete line is decoded and reported as soon as its '\n' arrives.
   *
   * @param byte Received byte
   */
  void feed_byte(uint8_t byte);

  /**
   * @brief Process a chunk of received bytes
   */
  void feed(const char* data, size_t len);

  /**
   * @brief Drop any partially received line
   */
  void reset();

  /**
   * @brief Install the log hook
   *
   * Without a hook the reader is silent.
   */
  void set_log_handler(LogFn log);

  /**
   * @brief Get maximum line length
   */
  size_t buffer_capacity() const
  {
    return max_line_;
  }

 private:
  /**
   * @brief Line reception state machine
   */
  enum class State
  {
    WAIT_START,  // Skipping terminators between lines
    IN_LINE,     // Accumulating line bytes
    DISCARD,     // Line overflowed, dropping until '\n'
  };

  void handle_line();
  void handle_overflow();
  void log(LogLevel level, const std::string& message) const;

  ReplyFn on_reply_;    ///< Reply callback
  LogFn log_;           ///< Optional log hook
  std::string buffer_;  ///< Line reception buffer
  size_t max_line_;     ///< Line length limit
  size_t discarded_;    ///< Bytes dropped from an overflowing line
  State state_;         ///< State machine state
};

}  // namespace ascii
}  // namespace mc
