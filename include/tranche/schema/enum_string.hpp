#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

// Name <-> value tables for the closed enums persisted by the engine. The
// names are what the CLI accepts and what events carry.
namespace tranche::schema {

template <typename Enum>
using enum_name_t = std::pair<std::string_view, Enum>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> lookup_enum(
    const std::string_view name,
    const std::array<enum_name_t<Enum>, N>& names) {
  for (const auto& [candidate, value] : names) {
    if (candidate == name) {
      return value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> lookup_name(
    const Enum value,
    const std::array<enum_name_t<Enum>, N>& names) {
  for (const auto& [name, candidate] : names) {
    if (candidate == value) {
      return name;
    }
  }
  return std::nullopt;
}

/// Specialised next to each enum; the primary template knows no names.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace tranche::schema
