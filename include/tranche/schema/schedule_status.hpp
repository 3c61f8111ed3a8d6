#pragma once

#include <tranche/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: schedule status.
// Treasury workflow: forward-only lifecycle. Streams end completed or
// cancelled, vesting grants end completed or revoked.
namespace tranche::schema {

enum class schedule_status_t : uint8_t {
  active = 0,
  completed = 1,
  cancelled = 2,
  revoked = 3
};

inline constexpr auto kScheduleStatusNames = std::array{
    enum_name_t<schedule_status_t>{"active", schedule_status_t::active},
    enum_name_t<schedule_status_t>{"completed", schedule_status_t::completed},
    enum_name_t<schedule_status_t>{"cancelled", schedule_status_t::cancelled},
    enum_name_t<schedule_status_t>{"revoked", schedule_status_t::revoked}};

template <>
inline std::optional<schedule_status_t> try_from_string<schedule_status_t>(
    const std::string_view value) {
  return lookup_enum(value, kScheduleStatusNames);
}

inline constexpr std::string_view to_string(const schedule_status_t value) {
  return lookup_name(value, kScheduleStatusNames).value_or("unknown");
}

inline constexpr bool is_terminal(const schedule_status_t value) {
  return value != schedule_status_t::active;
}

}  // namespace tranche::schema
