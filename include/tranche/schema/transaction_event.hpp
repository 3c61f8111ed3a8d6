#pragma once

#include <tranche/schema/transaction_event_attribute.hpp>
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Schema type: transaction event.
// Treasury workflow: notification emitted after a successful mutation
// (creation, claim, cancellation, revocation). Events are delivered to the
// host's sink and returned in the operation result; they are not persisted.
namespace tranche::schema {

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

inline transaction_event_t make_event(
    std::string type,
    std::vector<transaction_event_attribute_t> attributes) {
  return transaction_event_t{.type = std::move(type),
                             .attributes = std::move(attributes)};
}

/// Value of the first attribute named `key`.
inline std::optional<std::string> find_attribute(
    const transaction_event_t& event,
    const std::string_view key) {
  auto it = std::find_if(
      std::begin(event.attributes), std::end(event.attributes),
      [&](const transaction_event_attribute_t& attribute) {
        return attribute.key == key;
      });
  if (it == std::end(event.attributes)) {
    return std::nullopt;
  }
  return it->value;
}

}  // namespace tranche::schema
