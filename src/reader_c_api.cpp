/**
 * @file reader_c_api.cpp
 * @brief mcascii C API implementation
 *
 * C wrapper for the C++ Reader class.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <cstring>
#include <new>
#include <string>

#include "mcascii/reader.h"
#include "mcascii/reader.hpp"

using namespace mc::ascii;

/* ========================================================================= */
/* Internal wrapper structure                                                */
/* ========================================================================= */

namespace
{

void dispatch(mcascii_reply_fn on_reply, void* user, const ParseResult& result)
{
  if (!result.ok())
  {
    on_reply(user, static_cast<mcascii_error_t>(result.code()), nullptr);
    return;
  }

  const ReplyMessage& message = result.value();
  const std::string reply_flag = message.reply_flag().value_or("");
  const std::string device_status = message.device_status().value_or("");
  const std::string warning_flag = message.warning_flag().value_or("");
  const std::string checksum = message.checksum().value_or("");

  mcascii_reply_t view;
  view.message_type = static_cast<char>(message.message_type());
  view.device_address = message.device_address();
  view.axis_number = message.axis_number();
  view.message_id = message.message_id().value_or(MCASCII_NO_MESSAGE_ID);
  view.reply_flag = reply_flag.c_str();
  view.device_status = device_status.c_str();
  view.warning_flag = warning_flag.c_str();
  view.data = message.data().c_str();
  view.checksum = checksum.c_str();

  on_reply(user, MCASCII_ERR_OK, &view);
}

}  // namespace

struct McasciiReader
{
  Reader* cpp_reader;
  void* user;
  mcascii_reply_fn on_reply;

  McasciiReader(mcascii_reply_fn reply_fn, void* user_ctx, size_t max_line)
      : cpp_reader(nullptr), user(user_ctx), on_reply(reply_fn)
  {
    // Create C++ Reader with lambda that wraps the C callback
    cpp_reader = new (std::nothrow) Reader(
        [this](const ParseResult& result)
        {
          if (on_reply)
          {
            dispatch(on_reply, user, result);
          }
        },
        max_line);
  }

  ~McasciiReader()
  {
    delete cpp_reader;
  }

  McasciiReader(const McasciiReader&) = delete;
  McasciiReader& operator=(const McasciiReader&) = delete;
};

/* ========================================================================= */
/* Error message strings                                                     */
/* ========================================================================= */

const char* mcascii_strerror(mcascii_error_t err)
{
  switch (err)
  {
#define ERR(name, val, msg) \
  case MCASCII_ERR_##name:  \
    return msg;
#include "mcascii/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

void mcascii_checksum(const char* body, size_t len, char out[3])
{
  if (out == nullptr)
  {
    return;
  }

  const std::string checksum =
      compute_checksum(body == nullptr ? std::string_view() : std::string_view(body, len));
  std::memcpy(out, checksum.c_str(), 3);
}

/* ========================================================================= */
/* Lifecycle functions                                                       */
/* ========================================================================= */

McasciiReader* mcascii_reader_create(mcascii_reply_fn on_reply, void* user, size_t max_line)
{
  if (on_reply == nullptr)
  {
    return nullptr;
  }

  if (max_line == 0)
  {
    max_line = MCASCII_MAX_LINE_SIZE;
  }

  McasciiReader* reader = new (std::nothrow) McasciiReader(on_reply, user, max_line);
  if (reader == nullptr || reader->cpp_reader == nullptr)
  {
    delete reader;
    return nullptr;
  }

  return reader;
}

void mcascii_reader_destroy(McasciiReader* reader)
{
  delete reader;
}

/* ========================================================================= */
/* Operation functions                                                       */
/* ========================================================================= */

void mcascii_reader_feed_byte(McasciiReader* reader, uint8_t byte)
{
  if (reader && reader->cpp_reader)
  {
    reader->cpp_reader->feed_byte(byte);
  }
}

void mcascii_reader_reset(McasciiReader* reader)
{
  if (reader && reader->cpp_reader)
  {
    reader->cpp_reader->reset();
  }
}

size_t mcascii_reader_buffer_capacity(const McasciiReader* reader)
{
  if (reader && reader->cpp_reader)
  {
    return reader->cpp_reader->buffer_capacity();
  }
  return 0;
}
