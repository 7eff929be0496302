#pragma once

#include <utility>
#include <variant>

namespace snowid::core {

// DecodeError enumerates why a textual ID was rejected.
enum class DecodeError {
  kInvalidLength,  // input is not exactly 13 bytes
  kInvalidSymbol,  // a byte outside the 32-symbol alphabet
  kOutOfRange,     // leading symbol encodes more than 64 bits
};

// Result<T, E> encodes success (T) or failure (E) explicitly so that a failed
// decode cannot be mistaken for a valid value.
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

}  // namespace snowid::core
