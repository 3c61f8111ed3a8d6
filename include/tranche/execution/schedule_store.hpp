#pragma once

#include <tranche/execution/backend.hpp>
#include <tranche/execution/change_set.hpp>
#include <tranche/schema/claim_record.hpp>
#include <tranche/schema/primitives.hpp>
#include <tranche/schema/schedule.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace tranche::execution {

/// Persisted schedule books: records, id counters, sender/recipient indexes
/// and claim history, one set per schedule kind.
///
/// Writes are staged into a change_set; reads that are given a change_set see
/// its staged rows before the committed ones. Nothing reaches RocksDB until
/// commit().
class schedule_store final {
 public:
  schedule_store(encoder_t& encoder, storage_t& storage);

  std::optional<tranche::schema::account_id_t> admin(
      const change_set* pending = nullptr) const;
  void stage_admin(change_set& pending,
                   const tranche::schema::account_id_t& admin);

  std::optional<tranche::schema::schedule_t> get(
      tranche::schema::schedule_kind_t kind,
      tranche::schema::schedule_id_t id,
      const change_set* pending = nullptr) const;

  /// Full-record replace.
  void stage(change_set& pending, const tranche::schema::schedule_t& value);

  /// Reserve the next id of `kind` and stage the bumped counter.
  tranche::schema::schedule_id_t next_id(change_set& pending,
                                         tranche::schema::schedule_kind_t kind);

  uint32_t schedule_count(tranche::schema::schedule_kind_t kind,
                          const change_set* pending = nullptr) const;

  /// Append the record's id to its sender and recipient lists.
  void stage_indexes(change_set& pending,
                     const tranche::schema::schedule_t& value);

  std::vector<tranche::schema::schedule_id_t> by_sender(
      tranche::schema::schedule_kind_t kind,
      const tranche::schema::account_id_t& sender,
      const change_set* pending = nullptr) const;

  std::vector<tranche::schema::schedule_id_t> by_recipient(
      tranche::schema::schedule_kind_t kind,
      const tranche::schema::account_id_t& recipient,
      const change_set* pending = nullptr) const;

  void stage_claim(change_set& pending,
                   tranche::schema::schedule_kind_t kind,
                   tranche::schema::schedule_id_t id,
                   const tranche::schema::claim_record_t& record);

  std::vector<tranche::schema::claim_record_t> claim_history(
      tranche::schema::schedule_kind_t kind,
      tranche::schema::schedule_id_t id,
      const change_set* pending = nullptr) const;

  /// Accrued amount at `now`; frozen at claimed_amount once terminal.
  tranche::schema::amount_t accrued(
      const tranche::schema::schedule_t& value,
      tranche::schema::timestamp_seconds_t now) const;

  tranche::schema::amount_t claimable(
      const tranche::schema::schedule_t& value,
      tranche::schema::timestamp_seconds_t now) const;

  /// Move `value` to `status`; an illegal move terminates the process.
  void transition(tranche::schema::schedule_t& value,
                  tranche::schema::schedule_status_t status) const;

  /// Write every staged row in one batch and clear the change_set.
  void commit(change_set& pending);

 private:
  std::optional<tranche::schema::bytes_t> load(
      const tranche::schema::bytes_t& key,
      const change_set* pending) const;

  std::vector<tranche::schema::schedule_id_t> load_ids(
      const tranche::schema::bytes_t& key,
      const change_set* pending) const;

  void append_id(change_set& pending,
                 const tranche::schema::bytes_t& key,
                 tranche::schema::schedule_id_t id);

  encoder_t& encoder_;
  storage_t& storage_;
};

}  // namespace tranche::execution
