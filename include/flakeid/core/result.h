#pragma once

#include <cstddef>
#include <utility>
#include <variant>

namespace flakeid::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).
// These domain-specific errors carry semantic meaning beyond built-in error codes.

// CreateError explains why a generator was not created.
enum class CreateError {
  kStartTimeInFuture,
  kMachineIdUnavailable,
  kServiceIdUnavailable,
  kMachineIdRejected,
  kServiceIdRejected,
  kMachineIdOutOfRange,
  kServiceIdOutOfRange,
};

// IssueError is the only runtime failure of ID issuance.
enum class IssueError {
  kOverTimeLimit,
};

enum class ParseError {
  kInvalidFormat,
  kOutOfRange,
};

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
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  // Index-based construction keeps Result<std::string, std::string> unambiguous.
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

// error_message returns a stable English description for diagnostics.
[[nodiscard]] const char* error_message(CreateError error);
[[nodiscard]] const char* error_message(IssueError error);
[[nodiscard]] const char* error_message(ParseError error);

}  // namespace flakeid::core
