#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <variant>

namespace flakeid::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).
// Each kind maps to one failure class of the identifier generator.
enum class ErrorKind {
  kConfiguration,     // bad bit widths, out-of-range machine id, bad epoch
  kInvalidTimestamp,  // boundary query before the epoch or beyond the 41-bit range
  kInvalidId,         // decode input is not a decimal unsigned 64-bit integer
};

// Error pairs a kind with a human-readable message for diagnostics.
struct Error {
  ErrorKind kind;       // NOLINT(readability-identifier-naming)
  std::string message;  // NOLINT(readability-identifier-naming)
};

[[nodiscard]] inline const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kConfiguration:
      return "ConfigurationError";
    case ErrorKind::kInvalidTimestamp:
      return "InvalidTimestampError";
    case ErrorKind::kInvalidId:
      return "InvalidIdError";
  }
  return "UnknownError";
}

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
// The has_value() check makes error handling mandatory and visible at call sites.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] T& value() { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

// Convenience for the common case of an Error-typed failure.
template <typename T>
[[nodiscard]] Result<T, Error> fail(ErrorKind kind, std::string message) {
  return Result<T, Error>::err(Error{kind, std::move(message)});
}

}  // namespace flakeid::core
