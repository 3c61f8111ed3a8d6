#include <spdlog/spdlog.h>
#include <tranche/execution/balance_ledger.hpp>
#include <tranche/schema/key/engine_keys.hpp>
#include <map>
#include <mutex>
#include <utility>

namespace tranche::execution {

using tranche::schema::amount_t;

namespace {

using balance_slot_t =
    std::pair<tranche::schema::token_id_t, tranche::schema::account_id_t>;

}  // namespace

balance_ledger::balance_ledger(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

amount_t balance_ledger::balance_of(
    const tranche::schema::token_id_t& token,
    const tranche::schema::account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return load_balance(token, account, nullptr);
}

amount_t balance_ledger::load_balance(
    const tranche::schema::token_id_t& token,
    const tranche::schema::account_id_t& account,
    const change_set* pending) const {
  auto row_key = tranche::schema::key::make_balance_key(encoder_, token, account);
  auto view = tranche::schema::make_bytes_view(row_key);
  if (pending) {
    if (auto staged = pending->find(view)) {
      return encoder_.decode<amount_t>(tranche::schema::make_bytes_view(*staged));
    }
  }
  return storage_.get<amount_t>(encoder_, view).value_or(0);
}

tranche::schema::error_code balance_ledger::mint(
    const tranche::schema::token_id_t& token,
    const tranche::schema::account_id_t& account,
    const amount_t& amount) {
  if (amount <= 0) {
    return tranche::schema::error_code::invalid_amount;
  }
  auto lock = std::scoped_lock{mutex_};
  auto current = load_balance(token, account, nullptr);
  if (current > tranche::schema::kMaxAmount - amount) {
    spdlog::warn("Mint of {} to {} would overflow the balance",
                 tranche::schema::to_string(amount),
                 tranche::schema::to_hex(account));
    return tranche::schema::error_code::invalid_amount;
  }
  auto row_key = tranche::schema::key::make_balance_key(encoder_, token, account);
  storage_.put(encoder_, tranche::schema::make_bytes_view(row_key),
               amount_t{current + amount});
  spdlog::info("Minted {} of token {} to {}", tranche::schema::to_string(amount),
               tranche::schema::to_hex(token), tranche::schema::to_hex(account));
  return tranche::schema::error_code::ok;
}

bool balance_ledger::execute(
    const std::vector<tranche::schema::transfer_instruction_t>& transfers,
    change_set& pending) {
  auto lock = std::scoped_lock{mutex_};
  return stage(transfers, pending);
}

bool balance_ledger::execute(
    const std::vector<tranche::schema::transfer_instruction_t>& transfers) {
  auto lock = std::scoped_lock{mutex_};
  auto pending = change_set{};
  if (!stage(transfers, pending)) {
    return false;
  }
  storage_.write(pending.entries());
  return true;
}

bool balance_ledger::stage(
    const std::vector<tranche::schema::transfer_instruction_t>& transfers,
    change_set& pending) {
  auto debits = std::map<balance_slot_t, amount_t>{};
  auto balances = std::map<balance_slot_t, amount_t>{};
  auto opening = [&](const balance_slot_t& slot) -> amount_t& {
    auto it = balances.find(slot);
    if (it == std::end(balances)) {
      it = balances
               .emplace(slot, load_balance(slot.first, slot.second, &pending))
               .first;
    }
    return it->second;
  };

  for (const auto& transfer : transfers) {
    if (transfer.amount <= 0) {
      spdlog::warn("Rejecting transfer list: non-positive amount {}",
                   tranche::schema::to_string(transfer.amount));
      return false;
    }
    auto slot = balance_slot_t{transfer.token, transfer.from};
    debits[slot] += transfer.amount;
    if (debits[slot] > opening(slot)) {
      spdlog::warn("Rejecting transfer list: {} holds {} of token {}, needs {}",
                   tranche::schema::to_hex(transfer.from),
                   tranche::schema::to_string(opening(slot)),
                   tranche::schema::to_hex(transfer.token),
                   tranche::schema::to_string(debits[slot]));
      return false;
    }
  }

  for (const auto& transfer : transfers) {
    opening({transfer.token, transfer.from}) -= transfer.amount;
    auto& credit = opening({transfer.token, transfer.to});
    if (credit > tranche::schema::kMaxAmount - transfer.amount) {
      spdlog::warn("Rejecting transfer list: balance of {} would overflow",
                   tranche::schema::to_hex(transfer.to));
      return false;
    }
    credit += transfer.amount;
  }

  for (const auto& [slot, balance] : balances) {
    pending.stage(tranche::schema::key::make_balance_key(encoder_, slot.first,
                                                         slot.second),
                  encoder_.encode(balance));
  }
  spdlog::debug("Staged {} transfer(s)", transfers.size());
  return true;
}

transfer_executor_t balance_ledger::executor() {
  return [this](const std::vector<tranche::schema::transfer_instruction_t>&
                    transfers,
                change_set& pending) { return execute(transfers, pending); };
}

}  // namespace tranche::execution
