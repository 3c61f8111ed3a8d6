#pragma once
#include <tranche/schema/primitives.hpp>

#include <string>

namespace tranche::schema {

template <uint16_t Version>
struct create_vesting;

template <>
struct create_vesting<1> final {
  account_id_t beneficiary{};
  token_id_t token{};
  amount_t total_amount{};
  timestamp_seconds_t start_time{};
  duration_seconds_t cliff_duration{};
  amount_t cliff_amount{};
  duration_seconds_t total_duration{};
  std::string label;
  bool revocable{true};
};

using create_vesting_t = create_vesting<1>;

}  // namespace tranche::schema
