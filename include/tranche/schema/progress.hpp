#pragma once
#include <tranche/schema/primitives.hpp>
#include <tranche/schema/schedule_status.hpp>

// Schema type: progress.
// Treasury workflow: read-only projection of a schedule at the current block
// time.
namespace tranche::schema {

template <uint16_t Version>
struct progress;

template <>
struct progress<1> final {
  amount_t total_amount{};
  amount_t accrued_amount{};
  amount_t claimed_amount{};
  amount_t claimable_amount{};
  amount_t refunded_amount{};
  schedule_status_t status{schedule_status_t::active};

  bool operator==(const progress<1>&) const = default;
};

using progress_t = progress<1>;

}  // namespace tranche::schema
