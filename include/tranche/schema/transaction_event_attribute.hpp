#pragma once

#include <cstdint>
#include <string>
#include <utility>

// Schema type: transaction event attribute.
// Treasury workflow: key/value pair attached to an emitted event; `index`
// marks attributes an indexer should key on (ids and parties), amounts and
// terms are carried unindexed.
namespace tranche::schema {

template <uint16_t Version>
struct transaction_event_attribute;

template <>
struct transaction_event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using transaction_event_attribute_t = transaction_event_attribute<1>;

inline transaction_event_attribute_t make_attribute(std::string key,
                                                    std::string value,
                                                    const bool index = true) {
  return transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

}  // namespace tranche::schema
