#pragma once
#include <tranche/schema/error_code.hpp>
#include <tranche/schema/primitives.hpp>
#include <tranche/schema/schedule.hpp>

// Release arithmetic shared by both schedule kinds. Everything here is pure
// and integer-only; the same inputs always produce the same amount.
namespace tranche::accrual {

/// total * elapsed / duration, truncating, formed in 256-bit precision.
tranche::schema::amount_t prorate(const tranche::schema::amount_t& total,
                                  uint64_t elapsed,
                                  uint64_t duration);

/// Amount released by a stream at `now`, clamped to [0, total].
tranche::schema::amount_t accrued(const tranche::schema::stream_terms_t& terms,
                                  const tranche::schema::amount_t& total,
                                  tranche::schema::timestamp_seconds_t now);

/// Amount vested by a cliff grant at `now`, clamped to [0, total].
tranche::schema::amount_t accrued(const tranche::schema::vesting_terms_t& terms,
                                  const tranche::schema::amount_t& total,
                                  tranche::schema::timestamp_seconds_t now);

tranche::schema::amount_t accrued(const tranche::schema::schedule_terms_t& terms,
                                  const tranche::schema::amount_t& total,
                                  tranche::schema::timestamp_seconds_t now);

/// accrued - claimed, never negative.
tranche::schema::amount_t claimable(const tranche::schema::amount_t& accrued,
                                    const tranche::schema::amount_t& claimed);

tranche::schema::error_code validate(
    const tranche::schema::stream_terms_t& terms,
    const tranche::schema::amount_t& total);

tranche::schema::error_code validate(
    const tranche::schema::vesting_terms_t& terms,
    const tranche::schema::amount_t& total);

tranche::schema::error_code validate(
    const tranche::schema::schedule_terms_t& terms,
    const tranche::schema::amount_t& total);

/// Lifecycle table: active may move to completed, or to cancelled (streams)
/// or revoked (vesting). Terminal states never move.
bool can_transition(tranche::schema::schedule_kind_t kind,
                    tranche::schema::schedule_status_t from,
                    tranche::schema::schedule_status_t to);

}  // namespace tranche::accrual
