#pragma once
#include <tranche/schema/primitives.hpp>
#include <tranche/schema/schedule_kind.hpp>
#include <tranche/schema/schedule_status.hpp>
#include <tranche/schema/stream_terms.hpp>
#include <tranche/schema/vesting_terms.hpp>

#include <optional>
#include <string>
#include <variant>

// Schema type: schedule.
// Treasury workflow: one persisted record per stream or vesting grant. The
// record is never deleted; terminal records stay queryable for audit.
namespace tranche::schema {

using schedule_terms_t = std::variant<stream_terms_t, vesting_terms_t>;

template <uint16_t Version>
struct schedule;

template <>
struct schedule<1> final {
  uint16_t version{1};
  schedule_id_t id{};
  account_id_t sender{};
  account_id_t recipient{};
  token_id_t token{};
  amount_t total_amount{};
  amount_t claimed_amount{};
  amount_t refunded_amount{};
  schedule_terms_t terms{};
  schedule_status_t status{schedule_status_t::active};
  timestamp_seconds_t created_at{};
  timestamp_seconds_t last_update_time{};
  std::optional<timestamp_seconds_t> terminated_at{};
  std::string label;
  bool revocable{true};
};

using schedule_t = schedule<1>;

inline schedule_kind_t kind_of(const schedule_terms_t& terms) {
  return std::holds_alternative<stream_terms_t>(terms)
             ? schedule_kind_t::stream
             : schedule_kind_t::vesting;
}

inline schedule_kind_t kind_of(const schedule_t& value) {
  return kind_of(value.terms);
}

}  // namespace tranche::schema
