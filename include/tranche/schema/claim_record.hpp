#pragma once
#include <tranche/schema/primitives.hpp>

// Schema type: claim record.
// Treasury workflow: append-only audit row written once per successful claim.
namespace tranche::schema {

template <uint16_t Version>
struct claim_record;

template <>
struct claim_record<1> final {
  amount_t amount{};
  timestamp_seconds_t timestamp{};
};

using claim_record_t = claim_record<1>;

}  // namespace tranche::schema
