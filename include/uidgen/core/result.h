#pragma once

#include <utility>
#include <variant>

namespace uidgen::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).

// ParseError describes why a canonical identifier string was rejected.
enum class ParseError {
  kInvalidFormat,  // unexpected character, trailing text, or empty field
  kMissingField,   // input ended before all three fields were read
  kOutOfRange,     // field does not fit its integer type, or negative sequence
};

[[nodiscard]] constexpr const char* parse_error_to_string(const ParseError error) {
  switch (error) {
    case ParseError::kInvalidFormat:
      return "invalid format";
    case ParseError::kMissingField:
      return "missing field";
    case ParseError::kOutOfRange:
      return "field out of range";
  }
  return "unknown parse error";
}

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::move(value)); }
  static Result err(E error) { return Result(std::move(error)); }

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }
  [[nodiscard]] const T& value() const { return std::get<T>(data_); }
  [[nodiscard]] const E& error() const { return std::get<E>(data_); }

 private:
  explicit Result(T value) : data_(std::move(value)) {}
  explicit Result(E error) : data_(std::move(error)) {}

  std::variant<T, E> data_;
};

}  // namespace uidgen::core
