#pragma once

#include <warden/schema/error_code.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Schema type: operation result.
// Envelope returned by every engine, registry and chain operation. `value` is
// engaged iff `code == ok`.
namespace warden::schema {

template <typename T>
struct operation_result final {
  error_code_t code{error_code_t::ok};
  std::string log;
  std::string codespace;
  std::optional<T> value;

  bool ok() const { return code == error_code_t::ok; }
  explicit operator bool() const { return ok(); }
};

template <typename T>
operation_result<T> make_success(T value) {
  auto result = operation_result<T>{};
  result.value = std::move(value);
  return result;
}

template <typename T>
operation_result<T> make_failure(const error_code_t code,
                                 std::string log,
                                 const std::string_view codespace) {
  auto result = operation_result<T>{};
  result.code = code;
  result.log = std::move(log);
  result.codespace = std::string{codespace};
  return result;
}

/// Re-type a failed result, keeping code, log and codespace.
template <typename T, typename U>
operation_result<T> forward_failure(const operation_result<U>& failed) {
  return make_failure<T>(failed.code, failed.log, failed.codespace);
}

}  // namespace warden::schema
