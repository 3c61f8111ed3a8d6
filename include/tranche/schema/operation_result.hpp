#pragma once

#include <tranche/schema/error_code.hpp>
#include <tranche/schema/transaction_event.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

// Schema type: operation result.
// Treasury workflow: envelope returned by every engine call. `value` is set
// exactly when `code` is ok; `log` carries a human-readable reason on failure.
namespace tranche::schema {

template <typename T>
struct operation_result final {
  error_code code{error_code::ok};
  std::optional<T> value{};
  std::string log;
  std::vector<transaction_event_t> events;

  bool ok() const { return code == error_code::ok; }
};

template <typename T>
operation_result<T> make_success(T value,
                                 std::vector<transaction_event_t> events = {}) {
  return operation_result<T>{.code = error_code::ok,
                             .value = std::move(value),
                             .log = {},
                             .events = std::move(events)};
}

template <typename T>
operation_result<T> make_failure(const error_code code, std::string log) {
  return operation_result<T>{
      .code = code, .value = std::nullopt, .log = std::move(log), .events = {}};
}

}  // namespace tranche::schema
