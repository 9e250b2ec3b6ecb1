/**
 * @file reply.hpp
 * @brief Reply message model and codec
 *
 * Converts raw lines received from a motion controller into typed
 * ReplyMessage values and back.
 *
 * Example usage:
 * @code
 * auto result = mc::ascii::parse("@01 2 OK IDLE -- 0\n");
 * if (!result.ok()) {
 *   log(result.error().message());
 *   return;
 * }
 * const ReplyMessage& reply = result.value();
 * if (reply.rejected()) { ... }
 * @endcode
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "mcascii/protocol.hpp"
#include "mcascii/result.hpp"

namespace mc
{
namespace ascii
{

/**
 * @brief Fields common to every message type
 */
struct MessageHeader
{
  int device_address = 0;
  int axis_number = 0;
  std::optional<int> message_id;
};

/**
 * @brief Type specific fields of a Reply ('@') message
 */
struct ReplyFields
{
  std::string reply_flag;     ///< "OK" or "RJ"
  std::string device_status;  ///< "BUSY" or "IDLE"
  std::string warning_flag;   ///< "--" or a warning code
};

/**
 * @brief Type specific fields of an Alert ('!') message
 */
struct AlertFields
{
  std::string device_status;
  std::string warning_flag;
};

/**
 * @brief Info ('#') messages carry no type specific fields
 */
struct InfoFields
{
};

bool operator==(const ReplyFields& a, const ReplyFields& b);
bool operator==(const AlertFields& a, const AlertFields& b);
bool operator==(const InfoFields& a, const InfoFields& b);

/**
 * @brief One message received from, or destined to, a device
 *
 * Immutable once constructed. The message type is the active
 * alternative of body(); flat accessors return nullopt for fields the
 * type does not carry.
 */
class ReplyMessage
{
 public:
  using Body = std::variant<ReplyFields, AlertFields, InfoFields>;

  /**
   * @brief Build a Reply message
   *
   * An empty warning flag is replaced by "--".
   */
  static ReplyMessage make_reply(const MessageHeader& header, ReplyFields fields,
                                 std::string data,
                                 std::optional<std::string> checksum = std::nullopt);

  /**
   * @brief Build an Alert message
   *
   * An empty warning flag is replaced by "--".
   */
  static ReplyMessage make_alert(const MessageHeader& header, AlertFields fields,
                                 std::string data = std::string(),
                                 std::optional<std::string> checksum = std::nullopt);

  /**
   * @brief Build an Info message
   *
   * Without a message id, data must not start with 1-3 digits followed
   * by a space: "#01 0 12 34" reads back as message id 12, data "34".
   * Such data cannot be told apart from an id on the wire.
   */
  static ReplyMessage make_info(const MessageHeader& header, std::string data,
                                std::optional<std::string> checksum = std::nullopt);

  MessageType message_type() const;

  int device_address() const
  {
    return header_.device_address;
  }

  int axis_number() const
  {
    return header_.axis_number;
  }

  const std::optional<int>& message_id() const
  {
    return header_.message_id;
  }

  const MessageHeader& header() const
  {
    return header_;
  }

  const Body& body() const
  {
    return body_;
  }

  std::optional<std::string> reply_flag() const;
  std::optional<std::string> device_status() const;
  std::optional<std::string> warning_flag() const;

  const std::string& data() const
  {
    return data_;
  }

  const std::optional<std::string>& checksum() const
  {
    return checksum_;
  }

  bool is_reply() const
  {
    return message_type() == MessageType::REPLY;
  }

  bool is_alert() const
  {
    return message_type() == MessageType::ALERT;
  }

  bool is_info() const
  {
    return message_type() == MessageType::INFO;
  }

  /** @brief True for a Reply whose flag is "RJ" */
  bool rejected() const;

  /** @brief True when the device status is "IDLE" */
  bool idle() const;

  /** @brief True when the device status is "BUSY" */
  bool busy() const;

  /** @brief True when a warning flag other than "--" is set */
  bool has_warning() const;

  /**
   * @brief Copy of this message carrying another checksum
   *
   * The checksum text is taken as is; it is not recomputed.
   */
  ReplyMessage with_checksum(std::optional<std::string> checksum) const;

  friend bool operator==(const ReplyMessage& a, const ReplyMessage& b);
  friend bool operator!=(const ReplyMessage& a, const ReplyMessage& b)
  {
    return !(a == b);
  }

 private:
  ReplyMessage(const MessageHeader& header, Body body, std::string data,
               std::optional<std::string> checksum);

  MessageHeader header_;
  Body body_;
  std::string data_;
  std::optional<std::string> checksum_;
};

using ParseResult = Result<ReplyMessage>;

/* ========================================================================= */
/* Codec                                                                     */
/* ========================================================================= */

/**
 * @brief Parse one received line
 *
 * The line may end with any number of CR/LF characters. A trailing
 * ":CC" suffix is verified against the body checksum.
 *
 * @param line Raw line as received
 * @return The parsed message, or TOO_SHORT, CHECKSUM_MISMATCH,
 *         MALFORMED_MESSAGE or UNKNOWN_MESSAGE_TYPE
 */
ParseResult parse(std::string_view line);

/**
 * @brief Encode a message into its wire form
 *
 * The stored checksum is appended verbatim, never recomputed.
 *
 * @return Wire line terminated by a single '\n'
 */
std::string encode(const ReplyMessage& message);

/**
 * @brief Same as encode()
 */
std::string to_string(const ReplyMessage& message);

std::ostream& operator<<(std::ostream& os, const ReplyMessage& message);

/**
 * @brief Checksum of a message body
 *
 * @param body Characters after the type tag and before ':'
 * @return Two uppercase hex digits
 */
std::string compute_checksum(std::string_view body);

/**
 * @brief Copy of a message with a freshly computed checksum
 */
ReplyMessage seal(const ReplyMessage& message);

}  // namespace ascii
}  // namespace mc
