#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace idforge::core {

// Error vocabularies following E.14 (use purpose-designed types as error indicators).

// ConfigErrorCode classifies construction-time misconfiguration.
// These are fatal at startup and never retried automatically.
enum class ConfigErrorCode {
  kWorkerIdOutOfRange,
  kDatacenterIdOutOfRange,
  kNotSet,
  kInvalidFormat,
};

struct ConfigError {
  ConfigErrorCode code;  // NOLINT(readability-identifier-naming)
  std::string message;   // NOLINT(readability-identifier-naming)
};

// ClockError reports a wall clock observed to move backwards relative to the
// last timestamp a generator issued an id for. The caller decides whether to
// retry, alert or fail the request.
struct ClockError {
  std::int64_t regression_ms{0};  // NOLINT(readability-identifier-naming)

  [[nodiscard]] std::string message() const {
    return "clock moved backwards, refusing to generate id for " + std::to_string(regression_ms) +
           " milliseconds";
  }
};

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
// The has_value() check makes error handling mandatory and visible at call sites.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
  [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

// Status<E> is a Result with nothing to return on success.
template <typename E>
using Status = Result<std::monostate, E>;

template <typename E>
[[nodiscard]] Status<E> ok_status() {
  return Status<E>::ok(std::monostate{});
}

}  // namespace idforge::core
