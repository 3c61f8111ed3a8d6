#pragma once

#include <tranche/execution/backend.hpp>
#include <tranche/execution/change_set.hpp>
#include <tranche/execution/transfer_executor.hpp>
#include <tranche/schema/error_code.hpp>
#include <tranche/schema/primitives.hpp>
#include <tranche/schema/transfer_instruction.hpp>
#include <mutex>
#include <vector>

namespace tranche::execution {

/// Per-(token, account) balances kept in the engine's RocksDB store. This is
/// the transfer executor the CLI and tests install; a host that settles value
/// elsewhere installs its own transfer_executor_t instead.
///
/// Calls into the ledger are serialized by its own mutex. Rows staged into an
/// engine's change_set reach storage with that engine's commit, so a mint to
/// an account must not overlap an engine operation that moves the same
/// account's balance.
class balance_ledger final {
 public:
  balance_ledger(encoder_t& encoder, storage_t& storage);

  tranche::schema::amount_t balance_of(
      const tranche::schema::token_id_t& token,
      const tranche::schema::account_id_t& account) const;

  /// Credit `amount` to `account`. Fails with invalid_amount when the amount
  /// is not positive or the balance would leave the amount range.
  tranche::schema::error_code mint(const tranche::schema::token_id_t& token,
                                   const tranche::schema::account_id_t& account,
                                   const tranche::schema::amount_t& amount);

  /// Stage the closing balances of every transfer into `pending`, or nothing.
  /// Debits are summed per (token, account) and checked against the opening
  /// balance, read through `pending` first. Storage is not touched.
  bool execute(
      const std::vector<tranche::schema::transfer_instruction_t>& transfers,
      change_set& pending);

  /// Apply every transfer or none, writing the balances in one batch.
  bool execute(
      const std::vector<tranche::schema::transfer_instruction_t>& transfers);

  /// Adapter for engine::set_transfer_executor. The ledger must outlive it.
  transfer_executor_t executor();

 private:
  tranche::schema::amount_t load_balance(
      const tranche::schema::token_id_t& token,
      const tranche::schema::account_id_t& account,
      const change_set* pending) const;

  bool stage(
      const std::vector<tranche::schema::transfer_instruction_t>& transfers,
      change_set& pending);

  encoder_t& encoder_;
  storage_t& storage_;
  mutable std::mutex mutex_;
};

}  // namespace tranche::execution
