#pragma once

#include <tranche/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: schedule kind.
// Treasury workflow: selects the release book (salary stream or vesting
// grant). Each book has its own id counter and index lists.
namespace tranche::schema {

enum class schedule_kind_t : uint8_t { stream = 0, vesting = 1 };

inline constexpr auto kScheduleKindNames =
    std::array{enum_name_t<schedule_kind_t>{"stream", schedule_kind_t::stream},
               enum_name_t<schedule_kind_t>{"vesting",
                                            schedule_kind_t::vesting}};

template <>
inline std::optional<schedule_kind_t> try_from_string<schedule_kind_t>(
    const std::string_view value) {
  return lookup_enum(value, kScheduleKindNames);
}

inline constexpr std::string_view to_string(const schedule_kind_t value) {
  return lookup_name(value, kScheduleKindNames).value_or("unknown");
}

}  // namespace tranche::schema
