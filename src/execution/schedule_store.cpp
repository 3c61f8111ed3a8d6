#include <spdlog/spdlog.h>
#include <tranche/accrual/accrual.hpp>
#include <tranche/common/critical.hpp>
#include <tranche/execution/schedule_store.hpp>
#include <tranche/schema/key/engine_keys.hpp>
#include <limits>

namespace tranche::execution {

namespace key = tranche::schema::key;

using tranche::schema::amount_t;
using tranche::schema::bytes_t;
using tranche::schema::schedule_id_t;
using tranche::schema::schedule_kind_t;
using tranche::schema::schedule_status_t;
using tranche::schema::schedule_t;

schedule_store::schedule_store(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

std::optional<bytes_t> schedule_store::load(const bytes_t& row_key,
                                            const change_set* pending) const {
  auto view = tranche::schema::make_bytes_view(row_key);
  if (pending != nullptr) {
    if (auto staged = pending->find(view)) {
      return staged;
    }
  }
  return storage_.load(view);
}

std::optional<tranche::schema::account_id_t> schedule_store::admin(
    const change_set* pending) const {
  auto raw = load(key::make_admin_key(encoder_), pending);
  if (!raw) {
    return std::nullopt;
  }
  return encoder_.decode<tranche::schema::account_id_t>(
      tranche::schema::make_bytes_view(*raw));
}

void schedule_store::stage_admin(change_set& pending,
                                 const tranche::schema::account_id_t& admin) {
  pending.stage(key::make_admin_key(encoder_), encoder_.encode(admin));
}

std::optional<schedule_t> schedule_store::get(const schedule_kind_t kind,
                                              const schedule_id_t id,
                                              const change_set* pending) const {
  auto raw = load(key::make_schedule_key(encoder_, kind, id), pending);
  if (!raw) {
    return std::nullopt;
  }
  return encoder_.decode<schedule_t>(tranche::schema::make_bytes_view(*raw));
}

void schedule_store::stage(change_set& pending, const schedule_t& value) {
  pending.stage(key::make_schedule_key(encoder_, kind_of(value), value.id),
                encoder_.encode(value));
}

uint32_t schedule_store::schedule_count(const schedule_kind_t kind,
                                        const change_set* pending) const {
  auto raw = load(key::make_schedule_count_key(encoder_, kind), pending);
  if (!raw) {
    return 0;
  }
  return encoder_.decode<uint32_t>(tranche::schema::make_bytes_view(*raw));
}

schedule_id_t schedule_store::next_id(change_set& pending,
                                      const schedule_kind_t kind) {
  auto id = schedule_count(kind, &pending);
  if (id == std::numeric_limits<uint32_t>::max()) {
    tranche::common::critical("schedule id space exhausted");
  }
  pending.stage(key::make_schedule_count_key(encoder_, kind),
                encoder_.encode(uint32_t{id + 1}));
  return id;
}

std::vector<schedule_id_t> schedule_store::load_ids(
    const bytes_t& row_key,
    const change_set* pending) const {
  auto raw = load(row_key, pending);
  if (!raw) {
    return {};
  }
  return encoder_.decode<std::vector<schedule_id_t>>(
      tranche::schema::make_bytes_view(*raw));
}

void schedule_store::append_id(change_set& pending,
                               const bytes_t& row_key,
                               const schedule_id_t id) {
  auto ids = load_ids(row_key, &pending);
  ids.push_back(id);
  pending.stage(row_key, encoder_.encode(ids));
}

void schedule_store::stage_indexes(change_set& pending,
                                   const schedule_t& value) {
  auto kind = kind_of(value);
  append_id(pending, key::make_by_sender_key(encoder_, kind, value.sender),
            value.id);
  append_id(pending,
            key::make_by_recipient_key(encoder_, kind, value.recipient),
            value.id);
}

std::vector<schedule_id_t> schedule_store::by_sender(
    const schedule_kind_t kind,
    const tranche::schema::account_id_t& sender,
    const change_set* pending) const {
  return load_ids(key::make_by_sender_key(encoder_, kind, sender), pending);
}

std::vector<schedule_id_t> schedule_store::by_recipient(
    const schedule_kind_t kind,
    const tranche::schema::account_id_t& recipient,
    const change_set* pending) const {
  return load_ids(key::make_by_recipient_key(encoder_, kind, recipient),
                  pending);
}

void schedule_store::stage_claim(change_set& pending,
                                 const schedule_kind_t kind,
                                 const schedule_id_t id,
                                 const tranche::schema::claim_record_t& record) {
  auto rows = claim_history(kind, id, &pending);
  rows.push_back(record);
  pending.stage(key::make_claim_history_key(encoder_, kind, id),
                encoder_.encode(rows));
}

std::vector<tranche::schema::claim_record_t> schedule_store::claim_history(
    const schedule_kind_t kind,
    const schedule_id_t id,
    const change_set* pending) const {
  auto raw = load(key::make_claim_history_key(encoder_, kind, id), pending);
  if (!raw) {
    return {};
  }
  return encoder_.decode<std::vector<tranche::schema::claim_record_t>>(
      tranche::schema::make_bytes_view(*raw));
}

amount_t schedule_store::accrued(
    const schedule_t& value,
    const tranche::schema::timestamp_seconds_t now) const {
  if (is_terminal(value.status)) {
    return value.claimed_amount;
  }
  return tranche::accrual::accrued(value.terms, value.total_amount, now);
}

amount_t schedule_store::claimable(
    const schedule_t& value,
    const tranche::schema::timestamp_seconds_t now) const {
  if (is_terminal(value.status)) {
    return 0;
  }
  return tranche::accrual::claimable(accrued(value, now), value.claimed_amount);
}

void schedule_store::transition(schedule_t& value,
                                const schedule_status_t status) const {
  auto kind = kind_of(value);
  if (!tranche::accrual::can_transition(kind, value.status, status)) {
    tranche::common::critical("illegal schedule status transition",
                              "Illegal {} {} transition {} -> {}",
                              to_string(kind), value.id,
                              to_string(value.status), to_string(status));
  }
  value.status = status;
}

void schedule_store::commit(change_set& pending) {
  if (pending.empty()) {
    return;
  }
  spdlog::debug("Committing {} staged row(s)", pending.size());
  storage_.write(pending.entries());
  pending.clear();
}

}  // namespace tranche::execution
