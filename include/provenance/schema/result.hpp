#pragma once

#include <provenance/schema/error_code.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Schema type: result.
// Outcome envelope for registry and ledger operations: a value on success,
// otherwise an error code with a log line and the component codespace.
namespace provenance::schema {

/// Payload of operations that only report success or failure.
struct void_t final {};

template <typename T>
struct result final {
  error_code code{error_code::ok};
  std::string log;
  std::string codespace;
  std::optional<T> value;

  bool ok() const { return code == error_code::ok; }
  error_kind kind() const { return kind_of(code); }
};

template <typename T>
result<T> success(T value) {
  auto out = result<T>{};
  out.value = std::move(value);
  return out;
}

inline result<void_t> success() {
  return success(void_t{});
}

template <typename T>
result<T> failure(const error_code code,
                  const std::string_view codespace,
                  std::string log) {
  auto out = result<T>{};
  out.code = code;
  out.log = std::move(log);
  out.codespace = std::string{codespace};
  return out;
}

/// Re-type a failed result, keeping code, log and codespace.
template <typename T, typename U>
result<T> forward_failure(const result<U>& source) {
  auto out = result<T>{};
  out.code = source.code;
  out.log = source.log;
  out.codespace = source.codespace;
  return out;
}

}  // namespace provenance::schema
