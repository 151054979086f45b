#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace prodsim::core {

// Error taxonomy shared by every module.
// kIndexStaleness is a warning code: it is attached to successful query results,
// never returned as the error alternative of a Result.
enum class ErrorCode {
  kNotFound,
  kDimensionMismatch,
  kInvalidConfig,
  kExternalServiceError,
  kIndexStaleness,
  kCancelled,
};

struct Error {
  ErrorCode code;
  std::string message;
};

[[nodiscard]] std::string_view to_string(ErrorCode code);

inline Error make_error(ErrorCode code, std::string message) {
  return Error{code, std::move(message)};
}

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// Usage: return Result<Value, Error>::ok(val) or Result<Value, Error>::err(error).
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

}  // namespace prodsim::core
