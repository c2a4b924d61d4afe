#pragma once

#include <strata/common/error_code.hpp>

#include <string>
#include <utility>

namespace strata::common {

/// Outcome envelope for workspace operations that can fail recoverably.
///
/// `code == error_code::ok` means `value` is valid. On failure `log` holds a
/// human-readable reason and `value` is value-initialized.
template <typename T>
struct result final {
  error_code code{error_code::ok};
  std::string log;
  T value{};

  bool ok() const { return code == error_code::ok; }
  explicit operator bool() const { return ok(); }
};

template <typename T>
result<T> make_result(T value) {
  return result<T>{.code = error_code::ok, .log = {}, .value = std::move(value)};
}

template <typename T>
result<T> make_error(const error_code code, std::string log) {
  return result<T>{.code = code, .log = std::move(log), .value = T{}};
}

}  // namespace strata::common
