#include <spdlog/spdlog.h>
#include <tranche/accrual/accrual.hpp>
#include <tranche/blake3/hash.hpp>
#include <tranche/common/critical.hpp>
#include <tranche/execution/engine.hpp>
#include <iterator>
#include <string>
#include <utility>

using namespace tranche::schema;

namespace {

template <typename T>
operation_result<T> reject(const error_code code, std::string log) {
  spdlog::warn("Rejected ({}): {}", to_string(code), log);
  return make_failure<T>(code, std::move(log));
}

std::string join_ids(const std::vector<schedule_id_t>& ids) {
  auto joined = std::string{};
  for (const auto id : ids) {
    if (!joined.empty()) {
      joined += ',';
    }
    joined += std::to_string(id);
  }
  return joined;
}

}  // namespace

namespace tranche::execution {

engine::engine(encoder_t& encoder, storage_t& storage, engine_options options)
    : encoder_{encoder}, store_{encoder, storage}, options_{options} {
  auto lock = std::scoped_lock{mutex_};
  if (!options_.require_authorization) {
    spdlog::warn("Authorization disabled; every caller is accepted");
  }
  auto admin = store_.admin();
  spdlog::info("Release engine ready ({}; {} stream(s), {} vesting grant(s))",
               admin ? "initialized" : "not initialized",
               store_.schedule_count(schedule_kind_t::stream),
               store_.schedule_count(schedule_kind_t::vesting));
}

bool engine::initialized() const {
  return store_.admin().has_value();
}

bool engine::authorized(const account_id_t& account) const {
  if (!options_.require_authorization) {
    return true;
  }
  if (!authorizer_) {
    spdlog::warn("No authorizer installed; denying {}", to_hex(account));
    return false;
  }
  return authorizer_(account);
}

operation_result<account_id_t> engine::initialize(const account_id_t& admin) {
  auto lock = std::scoped_lock{mutex_};
  if (initialized()) {
    return reject<account_id_t>(error_code::already_initialized,
                                "engine already has an admin");
  }
  if (!authorized(admin)) {
    return reject<account_id_t>(error_code::unauthorized,
                                "admin did not authorize initialization");
  }
  auto pending = change_set{};
  store_.stage_admin(pending, admin);
  store_.commit(pending);

  auto events = std::vector{
      make_event("initialized", {make_attribute("admin", to_hex(admin))})};
  spdlog::info("Engine initialized with admin {}", to_hex(admin));
  emit(events);
  return make_success(admin, std::move(events));
}

operation_result<account_id_t> engine::admin() const {
  auto lock = std::scoped_lock{mutex_};
  auto value = store_.admin();
  if (!value) {
    return make_failure<account_id_t>(error_code::not_initialized,
                                      "engine is not initialized");
  }
  return make_success(*value);
}

void engine::set_authorizer(authorizer_t authorizer) {
  auto lock = std::scoped_lock{mutex_};
  authorizer_ = std::move(authorizer);
}

void engine::set_transfer_executor(transfer_executor_t executor) {
  auto lock = std::scoped_lock{mutex_};
  transfer_executor_ = std::move(executor);
}

void engine::set_event_sink(event_sink_t sink) {
  auto lock = std::scoped_lock{mutex_};
  event_sink_ = std::move(sink);
}

void engine::set_block_time(const timestamp_seconds_t now) {
  auto lock = std::scoped_lock{mutex_};
  now_ = now;
}

const account_id_t& engine::escrow_account() {
  static const auto account =
      tranche::blake3::hash(std::string_view{"tranche-escrow-v1"});
  return account;
}

error_code engine::validate_stream(const account_id_t& sender,
                                   const create_stream_t& params,
                                   std::string& log) const {
  if (sender == params.recipient) {
    log = "sender cannot stream to itself";
    return error_code::invalid_recipient;
  }
  auto terms = stream_terms_t{.start_time = params.start_time,
                              .end_time = params.end_time};
  auto code = tranche::accrual::validate(terms, params.total_amount);
  if (code != error_code::ok) {
    log = "invalid stream terms";
    return code;
  }
  if (params.start_time < now_) {
    log = "stream start time " + std::to_string(params.start_time) +
          " is before block time " + std::to_string(now_);
    return error_code::invalid_start_time;
  }
  return error_code::ok;
}

schedule_t engine::stage_schedule(change_set& pending, schedule_t value) {
  value.id = store_.next_id(pending, kind_of(value));
  store_.stage(pending, value);
  store_.stage_indexes(pending, value);
  return value;
}

operation_result<schedule_id_t> engine::create_stream(
    const account_id_t& sender,
    const create_stream_t& params) {
  auto lock = std::scoped_lock{mutex_};
  if (!initialized()) {
    return reject<schedule_id_t>(error_code::not_initialized,
                                 "engine is not initialized");
  }
  if (!authorized(sender)) {
    return reject<schedule_id_t>(error_code::unauthorized,
                                 "sender did not authorize stream creation");
  }
  auto log = std::string{};
  if (auto code = validate_stream(sender, params, log);
      code != error_code::ok) {
    return reject<schedule_id_t>(code, std::move(log));
  }

  auto pending = change_set{};
  auto stream = stage_schedule(
      pending, schedule_t{.sender = sender,
                          .recipient = params.recipient,
                          .token = params.token,
                          .total_amount = params.total_amount,
                          .terms = stream_terms_t{.start_time = params.start_time,
                                                  .end_time = params.end_time},
                          .created_at = now_,
                          .last_update_time = params.start_time});
  if (!settle(pending, {{.token = params.token,
                         .from = sender,
                         .to = escrow_account(),
                         .amount = params.total_amount}})) {
    return reject<schedule_id_t>(error_code::transfer_failed,
                                 "escrow deposit failed");
  }

  auto events = std::vector{make_event(
      "stream_created",
      {make_attribute("id", std::to_string(stream.id)),
       make_attribute("sender", to_hex(sender)),
       make_attribute("recipient", to_hex(params.recipient)),
       make_attribute("token", to_hex(params.token), false),
       make_attribute("total_amount", to_string(params.total_amount), false),
       make_attribute("start_time", std::to_string(params.start_time), false),
       make_attribute("end_time", std::to_string(params.end_time), false)})};
  spdlog::info("Created stream {} of {} from {} to {}", stream.id,
               to_string(params.total_amount), to_hex(sender),
               to_hex(params.recipient));
  emit(events);
  return make_success(stream.id, std::move(events));
}

operation_result<std::vector<schedule_id_t>> engine::create_streams(
    const account_id_t& sender,
    const std::vector<create_stream_t>& params) {
  using result_t = std::vector<schedule_id_t>;
  auto lock = std::scoped_lock{mutex_};
  if (!initialized()) {
    return reject<result_t>(error_code::not_initialized,
                            "engine is not initialized");
  }
  if (!authorized(sender)) {
    return reject<result_t>(error_code::unauthorized,
                            "sender did not authorize stream creation");
  }

  auto pending = change_set{};
  auto ids = result_t{};
  auto transfers = std::vector<transfer_instruction_t>{};
  ids.reserve(params.size());
  transfers.reserve(params.size());
  for (auto index = size_t{0}; index < params.size(); ++index) {
    const auto& entry = params[index];
    auto log = std::string{};
    if (auto code = validate_stream(sender, entry, log);
        code != error_code::ok) {
      return reject<result_t>(
          code, "batch entry " + std::to_string(index) + ": " + log);
    }
    auto stream = stage_schedule(
        pending,
        schedule_t{.sender = sender,
                   .recipient = entry.recipient,
                   .token = entry.token,
                   .total_amount = entry.total_amount,
                   .terms = stream_terms_t{.start_time = entry.start_time,
                                           .end_time = entry.end_time},
                   .created_at = now_,
                   .last_update_time = entry.start_time});
    ids.push_back(stream.id);
    transfers.push_back({.token = entry.token,
                         .from = sender,
                         .to = escrow_account(),
                         .amount = entry.total_amount});
  }

  if (!settle(pending, transfers)) {
    return reject<result_t>(error_code::transfer_failed,
                            "escrow deposit failed for batch");
  }

  auto events = std::vector{make_event(
      "streams_created", {make_attribute("sender", to_hex(sender)),
                          make_attribute("ids", join_ids(ids)),
                          make_attribute("count", std::to_string(ids.size()),
                                         false)})};
  spdlog::info("Created {} stream(s) from {}", ids.size(), to_hex(sender));
  emit(events);
  return make_success(std::move(ids), std::move(events));
}

operation_result<schedule_id_t> engine::create_vesting(
    const account_id_t& grantor,
    const create_vesting_t& params) {
  auto lock = std::scoped_lock{mutex_};
  if (!initialized()) {
    return reject<schedule_id_t>(error_code::not_initialized,
                                 "engine is not initialized");
  }
  if (!authorized(grantor)) {
    return reject<schedule_id_t>(error_code::unauthorized,
                                 "grantor did not authorize vesting grant");
  }
  auto terms = vesting_terms_t{.start_time = params.start_time,
                               .cliff_duration = params.cliff_duration,
                               .cliff_amount = params.cliff_amount,
                               .total_duration = params.total_duration};
  if (auto code = tranche::accrual::validate(terms, params.total_amount);
      code != error_code::ok) {
    return reject<schedule_id_t>(code, "invalid vesting terms");
  }

  auto pending = change_set{};
  auto grant = stage_schedule(pending,
                              schedule_t{.sender = grantor,
                                         .recipient = params.beneficiary,
                                         .token = params.token,
                                         .total_amount = params.total_amount,
                                         .terms = terms,
                                         .created_at = now_,
                                         .last_update_time = params.start_time,
                                         .label = params.label,
                                         .revocable = params.revocable});
  if (!settle(pending, {{.token = params.token,
                         .from = grantor,
                         .to = escrow_account(),
                         .amount = params.total_amount}})) {
    return reject<schedule_id_t>(error_code::transfer_failed,
                                 "escrow deposit failed");
  }

  auto events = std::vector{make_event(
      "vesting_created",
      {make_attribute("id", std::to_string(grant.id)),
       make_attribute("grantor", to_hex(grantor)),
       make_attribute("beneficiary", to_hex(params.beneficiary)),
       make_attribute("token", to_hex(params.token), false),
       make_attribute("total_amount", to_string(params.total_amount), false),
       make_attribute("label", params.label, false)})};
  spdlog::info("Created vesting grant {} '{}' of {} for {}", grant.id,
               params.label, to_string(params.total_amount),
               to_hex(params.beneficiary));
  emit(events);
  return make_success(grant.id, std::move(events));
}

operation_result<amount_t> engine::claim_stream(const account_id_t& recipient,
                                                const schedule_id_t id) {
  return claim(schedule_kind_t::stream, recipient, id);
}

operation_result<amount_t> engine::claim_vesting(
    const account_id_t& beneficiary,
    const schedule_id_t id) {
  return claim(schedule_kind_t::vesting, beneficiary, id);
}

operation_result<amount_t> engine::claim(const schedule_kind_t kind,
                                         const account_id_t& caller,
                                         const schedule_id_t id) {
  auto lock = std::scoped_lock{mutex_};
  if (!initialized()) {
    return reject<amount_t>(error_code::not_initialized,
                            "engine is not initialized");
  }
  if (!authorized(caller)) {
    return reject<amount_t>(error_code::unauthorized,
                            "caller did not authorize claim");
  }
  auto value = store_.get(kind, id);
  if (!value) {
    return reject<amount_t>(error_code::schedule_not_found,
                            std::string{to_string(kind)} + " " +
                                std::to_string(id) + " not found");
  }
  if (value->recipient != caller) {
    return reject<amount_t>(error_code::unauthorized,
                            "caller is not the recipient");
  }
  if (is_terminal(value->status)) {
    return reject<amount_t>(
        error_code::already_terminal,
        std::string{to_string(kind)} + " is " +
            std::string{to_string(value->status)});
  }
  auto amount = store_.claimable(*value, now_);
  if (amount <= 0) {
    return reject<amount_t>(error_code::nothing_to_claim,
                            "nothing has accrued since the last claim");
  }

  value->claimed_amount += amount;
  value->last_update_time = now_;
  if (value->claimed_amount >= value->total_amount) {
    store_.transition(*value, schedule_status_t::completed);
  }

  auto pending = change_set{};
  store_.stage(pending, *value);
  store_.stage_claim(pending, kind, id,
                     claim_record_t{.amount = amount, .timestamp = now_});
  if (!settle(pending, {{.token = value->token,
                         .from = escrow_account(),
                         .to = caller,
                         .amount = amount}})) {
    return reject<amount_t>(error_code::transfer_failed, "payout failed");
  }

  auto events = std::vector{make_event(
      "claimed", {make_attribute("kind", std::string{to_string(kind)}),
                  make_attribute("id", std::to_string(id)),
                  make_attribute("recipient", to_hex(caller)),
                  make_attribute("amount", to_string(amount), false),
                  make_attribute("status",
                                 std::string{to_string(value->status)},
                                 false)})};
  spdlog::info("Claimed {} from {} {} for {}", to_string(amount),
               to_string(kind), id, to_hex(caller));
  emit(events);
  return make_success(amount, std::move(events));
}

operation_result<amount_t> engine::cancel_stream(const account_id_t& sender,
                                                 const schedule_id_t id) {
  return terminate(schedule_kind_t::stream, sender, id);
}

operation_result<amount_t> engine::revoke_vesting(const account_id_t& grantor,
                                                  const schedule_id_t id) {
  return terminate(schedule_kind_t::vesting, grantor, id);
}

operation_result<amount_t> engine::terminate(const schedule_kind_t kind,
                                             const account_id_t& caller,
                                             const schedule_id_t id) {
  auto lock = std::scoped_lock{mutex_};
  if (!initialized()) {
    return reject<amount_t>(error_code::not_initialized,
                            "engine is not initialized");
  }
  if (!authorized(caller)) {
    return reject<amount_t>(error_code::unauthorized,
                            "caller did not authorize termination");
  }
  auto value = store_.get(kind, id);
  if (!value) {
    return reject<amount_t>(error_code::schedule_not_found,
                            std::string{to_string(kind)} + " " +
                                std::to_string(id) + " not found");
  }
  if (value->sender != caller) {
    return reject<amount_t>(error_code::unauthorized,
                            "caller is not the sender");
  }
  if (is_terminal(value->status)) {
    return reject<amount_t>(
        error_code::already_terminal,
        std::string{to_string(kind)} + " is " +
            std::string{to_string(value->status)});
  }
  if (!value->revocable) {
    return reject<amount_t>(error_code::unauthorized,
                            "grant was created non-revocable");
  }

  const auto total_before = value->total_amount;
  const auto claimed_before = value->claimed_amount;
  auto accrued = store_.accrued(*value, now_);
  auto settleable = tranche::accrual::claimable(accrued, claimed_before);
  auto refund = amount_t{total_before - claimed_before - settleable};
  if (refund < 0 || settleable + refund + claimed_before != total_before) {
    tranche::common::critical(
        "termination does not conserve value",
        "Conservation broken for {} {}: total {} claimed {} settle {} refund {}",
        to_string(kind), id, to_string(total_before),
        to_string(claimed_before), to_string(settleable), to_string(refund));
  }

  auto transfers = std::vector<transfer_instruction_t>{};
  if (settleable > 0) {
    transfers.push_back({.token = value->token,
                         .from = escrow_account(),
                         .to = value->recipient,
                         .amount = settleable});
  }
  if (refund > 0) {
    transfers.push_back({.token = value->token,
                         .from = escrow_account(),
                         .to = value->sender,
                         .amount = refund});
  }

  value->claimed_amount += settleable;
  value->refunded_amount = refund;
  value->terminated_at = now_;
  if (kind == schedule_kind_t::vesting) {
    value->total_amount = value->claimed_amount;
    store_.transition(*value, schedule_status_t::revoked);
  } else {
    store_.transition(*value, schedule_status_t::cancelled);
  }

  auto pending = change_set{};
  store_.stage(pending, *value);
  if (!settle(pending, transfers)) {
    return reject<amount_t>(error_code::transfer_failed,
                            "termination settlement failed");
  }

  auto is_stream = kind == schedule_kind_t::stream;
  auto events = std::vector{make_event(
      is_stream ? "stream_cancelled" : "vesting_revoked",
      {make_attribute("id", std::to_string(id)),
       make_attribute(is_stream ? "sender" : "grantor", to_hex(caller)),
       make_attribute("settled", to_string(settleable), false),
       make_attribute("refund", to_string(refund), false)})};
  spdlog::info("{} {} {}: settled {} to {}, refunded {}",
               is_stream ? "Cancelled" : "Revoked", to_string(kind), id,
               to_string(settleable), to_hex(value->recipient),
               to_string(refund));
  emit(events);
  return make_success(refund, std::move(events));
}

bool engine::settle(change_set& pending,
                    const std::vector<transfer_instruction_t>& transfers) {
  if (!transfers.empty()) {
    if (!transfer_executor_) {
      spdlog::warn("No transfer executor installed");
      return false;
    }
    if (!transfer_executor_(transfers, pending)) {
      return false;
    }
  }
  store_.commit(pending);
  return true;
}

void engine::emit(const std::vector<transaction_event_t>& events) const {
  for (const auto& event : events) {
    spdlog::debug("Event '{}' with {} attribute(s)", event.type,
                  event.attributes.size());
    if (event_sink_) {
      event_sink_(event);
    }
  }
}

operation_result<schedule_t> engine::get(const schedule_kind_t kind,
                                         const schedule_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  auto value = store_.get(kind, id);
  if (!value) {
    return make_failure<schedule_t>(error_code::schedule_not_found,
                                    std::string{to_string(kind)} + " " +
                                        std::to_string(id) + " not found");
  }
  return make_success(std::move(*value));
}

operation_result<amount_t> engine::claimable(const schedule_kind_t kind,
                                             const schedule_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  auto value = store_.get(kind, id);
  if (!value) {
    return make_failure<amount_t>(error_code::schedule_not_found,
                                  std::string{to_string(kind)} + " " +
                                      std::to_string(id) + " not found");
  }
  return make_success(store_.claimable(*value, now_));
}

operation_result<progress_t> engine::progress(const schedule_kind_t kind,
                                              const schedule_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  auto value = store_.get(kind, id);
  if (!value) {
    return make_failure<progress_t>(error_code::schedule_not_found,
                                    std::string{to_string(kind)} + " " +
                                        std::to_string(id) + " not found");
  }
  return make_success(
      progress_t{.total_amount = value->total_amount,
                 .accrued_amount = store_.accrued(*value, now_),
                 .claimed_amount = value->claimed_amount,
                 .claimable_amount = store_.claimable(*value, now_),
                 .refunded_amount = value->refunded_amount,
                 .status = value->status});
}

std::vector<schedule_id_t> engine::schedules_by_sender(
    const schedule_kind_t kind,
    const account_id_t& sender) const {
  auto lock = std::scoped_lock{mutex_};
  return store_.by_sender(kind, sender);
}

std::vector<schedule_id_t> engine::schedules_by_recipient(
    const schedule_kind_t kind,
    const account_id_t& recipient) const {
  auto lock = std::scoped_lock{mutex_};
  return store_.by_recipient(kind, recipient);
}

operation_result<std::vector<claim_record_t>> engine::claim_history(
    const schedule_kind_t kind,
    const schedule_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  if (!store_.get(kind, id)) {
    return make_failure<std::vector<claim_record_t>>(
        error_code::schedule_not_found,
        std::string{to_string(kind)} + " " + std::to_string(id) +
            " not found");
  }
  return make_success(store_.claim_history(kind, id));
}

uint32_t engine::schedule_count(const schedule_kind_t kind) const {
  auto lock = std::scoped_lock{mutex_};
  return store_.schedule_count(kind);
}

}  // namespace tranche::execution
