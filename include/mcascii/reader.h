/**
 * @file reader.h
 * @brief mcascii C API
 *
 * C-compatible interface for the mcascii reply receiver.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /* ========================================================================= */
  /* Protocol constants                                                        */
  /* ========================================================================= */

  /** @brief Default maximum line length */
#define MCASCII_MAX_LINE_SIZE 256

  /** @brief Value of mcascii_reply_t::message_id when no id was received */
#define MCASCII_NO_MESSAGE_ID (-1)

  /* ========================================================================= */
  /* Error codes                                                               */
  /* ========================================================================= */

  typedef enum
  {
#define ERR(name, val, msg) MCASCII_ERR_##name = val,
#include "mcascii/errors.def"
#undef ERR
  } mcascii_error_t;

  /**
   * @brief Get error message string
   * @param err Error code
   * @return Error message (static string)
   */
  const char* mcascii_strerror(mcascii_error_t err);

  /* ========================================================================= */
  /* Reply view                                                                */
  /* ========================================================================= */

  /**
   * @brief Decoded reply passed to the reply callback
   *
   * Fields a message type does not carry are empty strings. All
   * pointers are valid only during the callback.
   */
  typedef struct
  {
    char message_type;     /**< '@', '!' or '#' */
    int device_address;    /**< 1-99 */
    int axis_number;       /**< 0-9 */
    int message_id;        /**< 0-255 or MCASCII_NO_MESSAGE_ID */
    const char* reply_flag;
    const char* device_status;
    const char* warning_flag;
    const char* data;
    const char* checksum;  /**< Empty if none was received */
  } mcascii_reply_t;

  /**
   * @brief Compute the checksum of a message body
   *
   * @param body Characters after the type tag and before ':'
   * @param len  Body length in bytes
   * @param out  Receives two hex digits and a terminating NUL (3 bytes)
   */
  void mcascii_checksum(const char* body, size_t len, char out[3]);

  /* ========================================================================= */
  /* Reader handle                                                             */
  /* ========================================================================= */

  /** @brief Opaque handle to Reader instance */
  typedef struct McasciiReader McasciiReader;

  /**
   * @brief Reply callback function type
   *
   * @param user  User-defined context pointer
   * @param err   MCASCII_ERR_OK or the reason the line was rejected
   * @param reply Decoded reply, NULL unless err is MCASCII_ERR_OK
   */
  typedef void (*mcascii_reply_fn)(void* user, mcascii_error_t err,
                                   const mcascii_reply_t* reply);

  /* ========================================================================= */
  /* Lifecycle functions                                                       */
  /* ========================================================================= */

  /**
   * @brief Create a new Reader instance
   *
   * @param on_reply  Reply callback function
   * @param user      User context pointer (passed to on_reply)
   * @param max_line  Maximum line length (0 selects the default)
   * @return Pointer to Reader instance, or NULL on allocation failure
   */
  McasciiReader* mcascii_reader_create(mcascii_reply_fn on_reply, void* user,
                                       size_t max_line);

  /**
   * @brief Destroy Reader instance and free resources
   * @param reader Reader instance (NULL-safe)
   */
  void mcascii_reader_destroy(McasciiReader* reader);

  /* ========================================================================= */
  /* Operation functions                                                       */
  /* ========================================================================= */

  /**
   * @brief Process one received byte
   *
   * @param reader Reader instance
   * @param byte   Received byte
   */
  void mcascii_reader_feed_byte(McasciiReader* reader, uint8_t byte);

  /**
   * @brief Drop any partially received line
   *
   * @param reader Reader instance
   */
  void mcascii_reader_reset(McasciiReader* reader);

  /**
   * @brief Get maximum line length
   *
   * @param reader Reader instance
   * @return Maximum line length in bytes
   */
  size_t mcascii_reader_buffer_capacity(const McasciiReader* reader);

#ifdef __cplusplus
} /* extern "C" */
#endif
