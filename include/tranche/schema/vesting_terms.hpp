#pragma once
#include <tranche/schema/primitives.hpp>

// Schema type: vesting terms.
// Treasury workflow: nothing vests before start_time + cliff_duration,
// cliff_amount unlocks at the cliff, the remainder vests linearly until
// start_time + total_duration.
namespace tranche::schema {

template <uint16_t Version>
struct vesting_terms;

template <>
struct vesting_terms<1> final {
  timestamp_seconds_t start_time{};
  duration_seconds_t cliff_duration{};
  amount_t cliff_amount{};
  duration_seconds_t total_duration{};
};

using vesting_terms_t = vesting_terms<1>;

}  // namespace tranche::schema
