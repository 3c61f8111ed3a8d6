#pragma once

#include <tranche/execution/authorizer.hpp>
#include <tranche/execution/backend.hpp>
#include <tranche/execution/change_set.hpp>
#include <tranche/execution/schedule_store.hpp>
#include <tranche/execution/transfer_executor.hpp>
#include <tranche/schema/claim_record.hpp>
#include <tranche/schema/create_stream.hpp>
#include <tranche/schema/create_vesting.hpp>
#include <tranche/schema/operation_result.hpp>
#include <tranche/schema/primitives.hpp>
#include <tranche/schema/progress.hpp>
#include <tranche/schema/schedule.hpp>
#include <tranche/schema/transaction_event.hpp>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace tranche::execution {

struct engine_options final {
  /// When false every caller is treated as authenticated. Intended for
  /// single-operator tooling only.
  bool require_authorization{true};
};

/// Time-based release engine for salary streams and cliff vesting grants.
///
/// Every mutating call checks initialization, authenticates the caller,
/// validates, stages its record changes, hands all value movements to the
/// transfer executor in one call, and commits the staged rows only after the
/// executor accepted them. A failed call leaves storage untouched.
class engine final {
 public:
  explicit engine(encoder_t& encoder,
                  storage_t& storage,
                  engine_options options = {});

  /// Record the administrator. Allowed exactly once.
  tranche::schema::operation_result<tranche::schema::account_id_t> initialize(
      const tranche::schema::account_id_t& admin);

  tranche::schema::operation_result<tranche::schema::account_id_t> admin()
      const;

  /// Install the authentication check. Without one every caller is denied
  /// unless authorization is disabled in the options.
  void set_authorizer(authorizer_t authorizer);
  void set_transfer_executor(transfer_executor_t executor);
  /// The sink runs under the engine lock and must not call back into it.
  void set_event_sink(event_sink_t sink);

  /// Ledger clock. Every operation evaluates at this instant.
  void set_block_time(tranche::schema::timestamp_seconds_t now);

  /// Account that holds the value backing every open schedule.
  static const tranche::schema::account_id_t& escrow_account();

  tranche::schema::operation_result<tranche::schema::schedule_id_t>
  create_stream(const tranche::schema::account_id_t& sender,
                const tranche::schema::create_stream_t& params);

  /// All-or-nothing: one invalid entry rejects the whole batch.
  tranche::schema::operation_result<std::vector<tranche::schema::schedule_id_t>>
  create_streams(const tranche::schema::account_id_t& sender,
                 const std::vector<tranche::schema::create_stream_t>& params);

  tranche::schema::operation_result<tranche::schema::schedule_id_t>
  create_vesting(const tranche::schema::account_id_t& grantor,
                 const tranche::schema::create_vesting_t& params);

  /// Pay out everything accrued and unclaimed. Returns the amount paid.
  tranche::schema::operation_result<tranche::schema::amount_t> claim_stream(
      const tranche::schema::account_id_t& recipient,
      tranche::schema::schedule_id_t id);

  tranche::schema::operation_result<tranche::schema::amount_t> claim_vesting(
      const tranche::schema::account_id_t& beneficiary,
      tranche::schema::schedule_id_t id);

  /// Settle the accrued balance to the recipient and refund the rest to the
  /// sender. Returns the refund.
  tranche::schema::operation_result<tranche::schema::amount_t> cancel_stream(
      const tranche::schema::account_id_t& sender,
      tranche::schema::schedule_id_t id);

  /// Same settlement as cancel_stream; the grant's total is capped to what
  /// had vested.
  tranche::schema::operation_result<tranche::schema::amount_t> revoke_vesting(
      const tranche::schema::account_id_t& grantor,
      tranche::schema::schedule_id_t id);

  tranche::schema::operation_result<tranche::schema::schedule_t> get(
      tranche::schema::schedule_kind_t kind,
      tranche::schema::schedule_id_t id) const;

  tranche::schema::operation_result<tranche::schema::amount_t> claimable(
      tranche::schema::schedule_kind_t kind,
      tranche::schema::schedule_id_t id) const;

  tranche::schema::operation_result<tranche::schema::progress_t> progress(
      tranche::schema::schedule_kind_t kind,
      tranche::schema::schedule_id_t id) const;

  std::vector<tranche::schema::schedule_id_t> schedules_by_sender(
      tranche::schema::schedule_kind_t kind,
      const tranche::schema::account_id_t& sender) const;

  std::vector<tranche::schema::schedule_id_t> schedules_by_recipient(
      tranche::schema::schedule_kind_t kind,
      const tranche::schema::account_id_t& recipient) const;

  tranche::schema::operation_result<
      std::vector<tranche::schema::claim_record_t>>
  claim_history(tranche::schema::schedule_kind_t kind,
                tranche::schema::schedule_id_t id) const;

  uint32_t schedule_count(tranche::schema::schedule_kind_t kind) const;

 private:
  bool initialized() const;
  bool authorized(const tranche::schema::account_id_t& account) const;

  /// Checks shared by every creation path; ok when the entry may be staged.
  tranche::schema::error_code validate_stream(
      const tranche::schema::account_id_t& sender,
      const tranche::schema::create_stream_t& params,
      std::string& log) const;

  /// Stage a new record and its indexes; returns the staged record.
  tranche::schema::schedule_t stage_schedule(
      change_set& pending,
      tranche::schema::schedule_t value);

  tranche::schema::operation_result<tranche::schema::amount_t> claim(
      tranche::schema::schedule_kind_t kind,
      const tranche::schema::account_id_t& caller,
      tranche::schema::schedule_id_t id);

  tranche::schema::operation_result<tranche::schema::amount_t> terminate(
      tranche::schema::schedule_kind_t kind,
      const tranche::schema::account_id_t& caller,
      tranche::schema::schedule_id_t id);

  /// Run transfers, then commit. False when the executor rejected the list;
  /// nothing is committed in that case.
  bool settle(change_set& pending,
              const std::vector<tranche::schema::transfer_instruction_t>&
                  transfers);

  void emit(const std::vector<tranche::schema::transaction_event_t>& events)
      const;

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  schedule_store store_;
  engine_options options_;
  authorizer_t authorizer_;
  transfer_executor_t transfer_executor_;
  event_sink_t event_sink_;
  tranche::schema::timestamp_seconds_t now_{};
};

}  // namespace tranche::execution
