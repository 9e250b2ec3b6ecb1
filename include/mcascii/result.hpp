/**
 * @file result.hpp
 * @brief Value-or-error return type
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <string>
#include <utility>
#include <variant>

#include "mcascii/protocol.hpp"

namespace mc
{
namespace ascii
{

/**
 * @brief Error value returned by a failed operation
 *
 * found/expected are filled for CHECKSUM_MISMATCH (claimed and computed
 * checksum) and UNKNOWN_MESSAGE_TYPE (offending tag). detail holds the
 * type-specific diagnostic, text the offending line.
 */
struct ParseError
{
  ErrorCode code = ErrorCode::OK;
  std::string detail;
  std::string text;
  std::string found;
  std::string expected;

  /**
   * @brief Human readable description
   *
   * strerror() of the code followed by detail, found/expected and text
   * where present.
   */
  std::string message() const;
};

/**
 * @brief Holds either a value of type T or a ParseError
 */
template <typename T>
class Result
{
 public:
  bool ok() const
  {
    return std::holds_alternative<T>(data_);
  }

  explicit operator bool() const
  {
    return ok();
  }

  const T& value() const
  {
    return std::get<T>(data_);
  }

  const T* value_if() const
  {
    return std::get_if<T>(&data_);
  }

  const ParseError& error() const
  {
    return std::get<ParseError>(data_);
  }

  /**
   * @brief Error code, ErrorCode::OK on success
   */
  ErrorCode code() const
  {
    return ok() ? ErrorCode::OK : error().code;
  }

  static Result success(T value)
  {
    return Result(std::move(value));
  }

  static Result failure(ParseError error)
  {
    return Result(std::move(error));
  }

 private:
  std::variant<T, ParseError> data_;

  explicit Result(T value) : data_(std::move(value)) {}
  explicit Result(ParseError error) : data_(std::move(error)) {}
};

}  // namespace ascii
}  // namespace mc
