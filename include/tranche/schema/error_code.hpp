#pragma once

#include <tranche/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: error code.
// Treasury workflow: stable numeric failure codes returned by every engine
// operation. Values are part of the external contract and never reused.
namespace tranche::schema {

enum class error_code : uint32_t {
  ok = 0,
  not_initialized = 1,
  already_initialized = 2,
  unauthorized = 3,
  invalid_amount = 4,
  invalid_duration = 5,
  invalid_schedule = 6,
  invalid_start_time = 7,
  invalid_recipient = 8,
  schedule_not_found = 9,
  already_terminal = 10,
  nothing_to_claim = 11,
  transfer_failed = 12,
};

inline constexpr auto kErrorCodeNames = std::array{
    enum_name_t<error_code>{"ok", error_code::ok},
    enum_name_t<error_code>{"not_initialized", error_code::not_initialized},
    enum_name_t<error_code>{"already_initialized",
                            error_code::already_initialized},
    enum_name_t<error_code>{"unauthorized", error_code::unauthorized},
    enum_name_t<error_code>{"invalid_amount", error_code::invalid_amount},
    enum_name_t<error_code>{"invalid_duration", error_code::invalid_duration},
    enum_name_t<error_code>{"invalid_schedule", error_code::invalid_schedule},
    enum_name_t<error_code>{"invalid_start_time",
                            error_code::invalid_start_time},
    enum_name_t<error_code>{"invalid_recipient", error_code::invalid_recipient},
    enum_name_t<error_code>{"schedule_not_found",
                            error_code::schedule_not_found},
    enum_name_t<error_code>{"already_terminal", error_code::already_terminal},
    enum_name_t<error_code>{"nothing_to_claim", error_code::nothing_to_claim},
    enum_name_t<error_code>{"transfer_failed", error_code::transfer_failed}};

inline constexpr std::string_view to_string(const error_code value) {
  return lookup_name(value, kErrorCodeNames).value_or("unknown");
}

}  // namespace tranche::schema
