#include <gtest/gtest.h>
#include <tranche/testing/engine_fixture.hpp>

#include <optional>
#include <string>
#include <vector>

using namespace tranche::schema;
using tranche::execution::change_set;
using tranche::execution::engine;
using tranche::testing::engine_fixture;
using tranche::testing::make_account;

namespace {

create_stream_t make_stream(const amount_t& total,
                            const uint64_t start,
                            const uint64_t end,
                            const account_id_t& recipient =
                                engine_fixture::recipient()) {
  return create_stream_t{.recipient = recipient,
                         .token = engine_fixture::token(),
                         .total_amount = total,
                         .start_time = start,
                         .end_time = end};
}

}  // namespace

TEST(engine_stream, salary_stream_pays_out_in_two_claims) {
  auto fixture = engine_fixture{"tranche_engine_stream_claims"};
  auto& releases = fixture.engine();
  fixture.fund(engine_fixture::sender(), 10000);
  releases.set_block_time(900);

  auto created = releases.create_stream(engine_fixture::sender(),
                                        make_stream(10000, 1000, 2000));
  ASSERT_TRUE(created.ok()) << created.log;
  EXPECT_EQ(*created.value, 0u);
  EXPECT_EQ(fixture.balance(engine_fixture::sender()), 0);
  EXPECT_EQ(fixture.balance(engine::escrow_account()), 10000);

  releases.set_block_time(1500);
  auto first = releases.claim_stream(engine_fixture::recipient(), 0);
  ASSERT_TRUE(first.ok()) << first.log;
  EXPECT_EQ(*first.value, 5000);

  releases.set_block_time(2000);
  auto second = releases.claim_stream(engine_fixture::recipient(), 0);
  ASSERT_TRUE(second.ok()) << second.log;
  EXPECT_EQ(*second.value, 5000);

  auto stream = releases.get(schedule_kind_t::stream, 0);
  ASSERT_TRUE(stream.ok());
  EXPECT_EQ(stream.value->status, schedule_status_t::completed);
  EXPECT_EQ(stream.value->claimed_amount, 10000);
  EXPECT_EQ(stream.value->last_update_time, 2000u);
  EXPECT_EQ(fixture.balance(engine_fixture::recipient()), 10000);
  EXPECT_EQ(fixture.balance(engine::escrow_account()), 0);

  auto after = releases.claim_stream(engine_fixture::recipient(), 0);
  EXPECT_EQ(after.code, error_code::already_terminal);
}

TEST(engine_stream, second_claim_at_same_instant_is_rejected) {
  auto fixture = engine_fixture{"tranche_engine_stream_double"};
  auto& releases = fixture.engine();
  fixture.fund(engine_fixture::sender(), 10000);
  releases.set_block_time(1000);
  ASSERT_TRUE(releases
                  .create_stream(engine_fixture::sender(),
                                 make_stream(10000, 1000, 2000))
                  .ok());

  releases.set_block_time(1300);
  auto first = releases.claim_stream(engine_fixture::recipient(), 0);
  ASSERT_TRUE(first.ok());
  EXPECT_EQ(*first.value, 3000);
  auto second = releases.claim_stream(engine_fixture::recipient(), 0);
  EXPECT_EQ(second.code, error_code::nothing_to_claim);
  EXPECT_FALSE(second.value.has_value());
  EXPECT_EQ(fixture.balance(engine_fixture::recipient()), 3000);

  auto history = releases.claim_history(schedule_kind_t::stream, 0);
  ASSERT_TRUE(history.ok());
  ASSERT_EQ(history.value->size(), 1u);
  EXPECT_EQ(history.value->front().amount, 3000);
  EXPECT_EQ(history.value->front().timestamp, 1300u);
}

TEST(engine_stream, nothing_accrues_before_start) {
  auto fixture = engine_fixture{"tranche_engine_stream_early"};
  auto& releases = fixture.engine();
  fixture.fund(engine_fixture::sender(), 100);
  releases.set_block_time(10);
  ASSERT_TRUE(
      releases.create_stream(engine_fixture::sender(), make_stream(100, 50, 150))
          .ok());
  releases.set_block_time(50);
  EXPECT_EQ(releases.claim_stream(engine_fixture::recipient(), 0).code,
            error_code::nothing_to_claim);
  EXPECT_EQ(*releases.claimable(schedule_kind_t::stream, 0).value, 0);
}

TEST(engine_stream, cancel_splits_escrow_between_recipient_and_sender) {
  auto fixture = engine_fixture{"tranche_engine_stream_cancel"};
  auto& releases = fixture.engine();
  fixture.fund(engine_fixture::sender(), 10000);
  releases.set_block_time(900);
  ASSERT_TRUE(releases
                  .create_stream(engine_fixture::sender(),
                                 make_stream(10000, 1000, 2000))
                  .ok());

  releases.set_block_time(1500);
  auto cancelled = releases.cancel_stream(engine_fixture::sender(), 0);
  ASSERT_TRUE(cancelled.ok()) << cancelled.log;
  EXPECT_EQ(*cancelled.value, 5000);
  EXPECT_EQ(fixture.balance(engine_fixture::recipient()), 5000);
  EXPECT_EQ(fixture.balance(engine_fixture::sender()), 5000);
  EXPECT_EQ(fixture.balance(engine::escrow_account()), 0);

  auto progress = releases.progress(schedule_kind_t::stream, 0);
  ASSERT_TRUE(progress.ok());
  EXPECT_EQ(progress.value->status, schedule_status_t::cancelled);
  EXPECT_EQ(progress.value->claimed_amount, 5000);
  EXPECT_EQ(progress.value->refunded_amount, 5000);
  EXPECT_EQ(progress.value->accrued_amount, 5000);
  EXPECT_EQ(progress.value->claimable_amount, 0);

  auto stream = releases.get(schedule_kind_t::stream, 0);
  EXPECT_EQ(stream.value->terminated_at, 1500u);

  releases.set_block_time(1800);
  EXPECT_EQ(releases.claim_stream(engine_fixture::recipient(), 0).code,
            error_code::already_terminal);
  EXPECT_EQ(releases.cancel_stream(engine_fixture::sender(), 0).code,
            error_code::already_terminal);
  EXPECT_EQ(releases.progress(schedule_kind_t::stream, 0).value->accrued_amount,
            5000);
}

TEST(engine_stream, cancel_after_partial_claim_conserves_total) {
  auto fixture = engine_fixture{"tranche_engine_stream_partial"};
  auto& releases = fixture.engine();
  fixture.fund(engine_fixture::sender(), 10000);
  releases.set_block_time(1000);
  ASSERT_TRUE(releases
                  .create_stream(engine_fixture::sender(),
                                 make_stream(10000, 1000, 2000))
                  .ok());

  releases.set_block_time(1250);
  EXPECT_EQ(*releases.claim_stream(engine_fixture::recipient(), 0).value,
            2500);
  releases.set_block_time(1750);
  auto refund = releases.cancel_stream(engine_fixture::sender(), 0);
  ASSERT_TRUE(refund.ok());
  EXPECT_EQ(*refund.value, 2500);

  auto stream = releases.get(schedule_kind_t::stream, 0).value.value();
  EXPECT_EQ(stream.claimed_amount, 7500);
  EXPECT_EQ(stream.claimed_amount + stream.refunded_amount, 10000);
  EXPECT_EQ(fixture.balance(engine_fixture::recipient()), 7500);
  EXPECT_EQ(fixture.balance(engine_fixture::sender()), 2500);
}

TEST(engine_stream, cancel_after_end_settles_everything_to_recipient) {
  auto fixture = engine_fixture{"tranche_engine_stream_late_cancel"};
  auto& releases = fixture.engine();
  fixture.fund(engine_fixture::sender(), 999);
  releases.set_block_time(0);
  ASSERT_TRUE(
      releases.create_stream(engine_fixture::sender(), make_stream(999, 0, 10))
          .ok());
  releases.set_block_time(20);
  auto refund = releases.cancel_stream(engine_fixture::sender(), 0);
  ASSERT_TRUE(refund.ok());
  EXPECT_EQ(*refund.value, 0);
  EXPECT_EQ(fixture.balance(engine_fixture::recipient()), 999);
  EXPECT_EQ(fixture.balance(engine_fixture::sender()), 0);
}

TEST(engine_stream, truncation_never_loses_units) {
  auto fixture = engine_fixture{"tranche_engine_stream_rounding"};
  auto& releases = fixture.engine();
  fixture.fund(engine_fixture::sender(), 10);
  releases.set_block_time(0);
  ASSERT_TRUE(
      releases.create_stream(engine_fixture::sender(), make_stream(10, 0, 3))
          .ok());

  auto total_claimed = amount_t{0};
  for (auto now = uint64_t{1}; now <= 3; ++now) {
    releases.set_block_time(now);
    auto claimed = releases.claim_stream(engine_fixture::recipient(), 0);
    ASSERT_TRUE(claimed.ok());
    total_claimed += *claimed.value;
  }
  EXPECT_EQ(total_claimed, 10);
  EXPECT_EQ(fixture.balance(engine_fixture::recipient()), 10);
}

TEST(engine_stream, creation_validates_inputs) {
  auto fixture = engine_fixture{"tranche_engine_stream_validation"};
  auto& releases = fixture.engine();
  fixture.fund(engine_fixture::sender(), 10000);
  releases.set_block_time(500);

  EXPECT_EQ(releases
                .create_stream(engine_fixture::sender(),
                               make_stream(100, 600, 700,
                                           engine_fixture::sender()))
                .code,
            error_code::invalid_recipient);
  EXPECT_EQ(
      releases.create_stream(engine_fixture::sender(), make_stream(0, 600, 700))
          .code,
      error_code::invalid_amount);
  EXPECT_EQ(releases
                .create_stream(engine_fixture::sender(),
                               make_stream(-10, 600, 700))
                .code,
            error_code::invalid_amount);
  EXPECT_EQ(releases
                .create_stream(engine_fixture::sender(),
                               make_stream(100, 700, 700))
                .code,
            error_code::invalid_duration);
  EXPECT_EQ(releases
                .create_stream(engine_fixture::sender(),
                               make_stream(100, 499, 700))
                .code,
            error_code::invalid_start_time);
  EXPECT_TRUE(releases
                  .create_stream(engine_fixture::sender(),
                                 make_stream(100, 500, 700))
                  .ok());

  EXPECT_EQ(releases.schedule_count(schedule_kind_t::stream), 1u);
  EXPECT_EQ(fixture.balance(engine_fixture::sender()), 9900);
}

TEST(engine_stream, underfunded_sender_leaves_no_trace) {
  auto fixture = engine_fixture{"tranche_engine_stream_underfunded"};
  auto& releases = fixture.engine();
  fixture.fund(engine_fixture::sender(), 50);
  releases.set_block_time(0);

  auto events_before = fixture.events().size();
  auto result =
      releases.create_stream(engine_fixture::sender(), make_stream(100, 0, 10));
  EXPECT_EQ(result.code, error_code::transfer_failed);
  EXPECT_FALSE(result.log.empty());
  EXPECT_EQ(releases.schedule_count(schedule_kind_t::stream), 0u);
  EXPECT_FALSE(releases.get(schedule_kind_t::stream, 0).ok());
  EXPECT_TRUE(releases
                  .schedules_by_sender(schedule_kind_t::stream,
                                       engine_fixture::sender())
                  .empty());
  EXPECT_EQ(fixture.balance(engine_fixture::sender()), 50);
  EXPECT_EQ(fixture.events().size(), events_before);
}

TEST(engine_stream, only_parties_may_claim_or_cancel) {
  auto fixture = engine_fixture{"tranche_engine_stream_parties"};
  auto& releases = fixture.engine();
  fixture.fund(engine_fixture::sender(), 1000);
  releases.set_block_time(0);
  ASSERT_TRUE(
      releases.create_stream(engine_fixture::sender(), make_stream(1000, 0, 10))
          .ok());
  releases.set_block_time(5);

  EXPECT_EQ(releases.claim_stream(engine_fixture::outsider(), 0).code,
            error_code::unauthorized);
  EXPECT_EQ(releases.claim_stream(engine_fixture::sender(), 0).code,
            error_code::unauthorized);
  EXPECT_EQ(releases.cancel_stream(engine_fixture::recipient(), 0).code,
            error_code::unauthorized);
  EXPECT_EQ(releases.cancel_stream(engine_fixture::outsider(), 0).code,
            error_code::unauthorized);
  EXPECT_EQ(releases.claim_stream(engine_fixture::recipient(), 7).code,
            error_code::schedule_not_found);
  EXPECT_EQ(releases.cancel_stream(engine_fixture::sender(), 7).code,
            error_code::schedule_not_found);
}

TEST(engine_stream, authorizer_decides_who_is_authenticated) {
  auto fixture = engine_fixture{"tranche_engine_stream_auth"};
  auto& releases = fixture.engine();
  fixture.fund(engine_fixture::sender(), 1000);
  releases.set_block_time(0);
  releases.set_authorizer(
      [](const account_id_t& account) { return account == make_account(2); });

  EXPECT_EQ(
      releases.create_stream(engine_fixture::sender(), make_stream(1000, 0, 10))
          .code,
      error_code::unauthorized);
  EXPECT_EQ(releases.schedule_count(schedule_kind_t::stream), 0u);
}

TEST(engine_stream, engine_without_authorizer_denies_callers) {
  auto fixture = engine_fixture{"tranche_engine_stream_no_auth"};
  fixture.fund(engine_fixture::sender(), 1000);

  auto strict = engine{fixture.encoder(), fixture.storage()};
  strict.set_transfer_executor(fixture.ledger().executor());
  EXPECT_EQ(
      strict.create_stream(engine_fixture::sender(), make_stream(1000, 0, 10))
          .code,
      error_code::unauthorized);

  auto open = engine{fixture.encoder(), fixture.storage(),
                     tranche::execution::engine_options{
                         .require_authorization = false}};
  open.set_transfer_executor(fixture.ledger().executor());
  EXPECT_TRUE(
      open.create_stream(engine_fixture::sender(), make_stream(1000, 0, 10))
          .ok());
}

TEST(engine_stream, engine_without_transfer_executor_fails_cleanly) {
  auto fixture = engine_fixture{"tranche_engine_stream_no_executor"};
  auto detached = engine{fixture.encoder(), fixture.storage()};
  detached.set_authorizer(engine_fixture::allow_all_authorizer());
  EXPECT_EQ(detached
                .create_stream(engine_fixture::sender(),
                               make_stream(1000, 0, 10))
                .code,
            error_code::transfer_failed);
  EXPECT_EQ(detached.schedule_count(schedule_kind_t::stream), 0u);
}

TEST(engine_stream, balances_and_schedule_rows_commit_together) {
  auto fixture = engine_fixture{"tranche_engine_stream_one_batch"};
  auto& releases = fixture.engine();
  fixture.fund(engine_fixture::sender(), 10000);
  releases.set_block_time(1000);

  auto ledger_executor = fixture.ledger().executor();
  auto sender_during_settlement = std::optional<amount_t>{};
  auto staged_rows = size_t{0};
  releases.set_transfer_executor(
      [&](const std::vector<transfer_instruction_t>& transfers,
          change_set& pending) {
        if (!ledger_executor(transfers, pending)) {
          return false;
        }
        sender_during_settlement = fixture.balance(engine_fixture::sender());
        staged_rows = pending.size();
        return true;
      });

  ASSERT_TRUE(releases
                  .create_stream(engine_fixture::sender(),
                                 make_stream(10000, 1000, 2000))
                  .ok());
  ASSERT_TRUE(sender_during_settlement.has_value());
  EXPECT_EQ(*sender_during_settlement, 10000);
  // Two balance rows plus the schedule, its counter and both indexes.
  EXPECT_GT(staged_rows, size_t{2});
  EXPECT_EQ(fixture.balance(engine_fixture::sender()), 0);
  EXPECT_EQ(fixture.balance(engine::escrow_account()), 10000);
  EXPECT_EQ(releases.schedule_count(schedule_kind_t::stream), 1u);
}

TEST(engine_stream, executor_that_stages_then_rejects_writes_nothing) {
  auto fixture = engine_fixture{"tranche_engine_stream_staged_reject"};
  auto& releases = fixture.engine();
  fixture.fund(engine_fixture::sender(), 10000);
  releases.set_block_time(1000);

  auto ledger_executor = fixture.ledger().executor();
  releases.set_transfer_executor(
      [&](const std::vector<transfer_instruction_t>& transfers,
          change_set& pending) {
        EXPECT_TRUE(ledger_executor(transfers, pending));
        return false;
      });

  EXPECT_EQ(releases
                .create_stream(engine_fixture::sender(),
                               make_stream(10000, 1000, 2000))
                .code,
            error_code::transfer_failed);
  EXPECT_EQ(fixture.balance(engine_fixture::sender()), 10000);
  EXPECT_EQ(fixture.balance(engine::escrow_account()), 0);
  EXPECT_EQ(releases.schedule_count(schedule_kind_t::stream), 0u);
  EXPECT_EQ(releases.get(schedule_kind_t::stream, 0).code,
            error_code::schedule_not_found);
}

TEST(engine_stream, failed_settlement_leaves_stream_unchanged) {
  auto fixture = engine_fixture{"tranche_engine_stream_rollback"};
  auto& releases = fixture.engine();
  fixture.fund(engine_fixture::sender(), 10000);
  releases.set_block_time(1000);
  ASSERT_TRUE(releases
                  .create_stream(engine_fixture::sender(),
                                 make_stream(10000, 1000, 2000))
                  .ok());
  releases.set_block_time(1300);
  ASSERT_TRUE(releases.claim_stream(engine_fixture::recipient(), 0).ok());

  releases.set_transfer_executor(rejecting_executor());
  releases.set_block_time(1500);
  auto claim = releases.claim_stream(engine_fixture::recipient(), 0);
  EXPECT_EQ(claim.code, error_code::transfer_failed);
  EXPECT_FALSE(claim.value.has_value());
  auto cancel = releases.cancel_stream(engine_fixture::sender(), 0);
  EXPECT_EQ(cancel.code, error_code::transfer_failed);
  EXPECT_FALSE(cancel.value.has_value());

  auto stream = releases.get(schedule_kind_t::stream, 0);
  ASSERT_TRUE(stream.ok());
  EXPECT_EQ(stream.value->status, schedule_status_t::active);
  EXPECT_EQ(stream.value->total_amount, 10000);
  EXPECT_EQ(stream.value->claimed_amount, 3000);
  EXPECT_EQ(stream.value->refunded_amount, 0);
  EXPECT_EQ(stream.value->last_update_time, 1300u);
  EXPECT_FALSE(stream.value->terminated_at.has_value());
  auto history = releases.claim_history(schedule_kind_t::stream, 0);
  ASSERT_TRUE(history.ok());
  EXPECT_EQ(history.value->size(), 1u);
  EXPECT_EQ(fixture.balance(engine::escrow_account()), 7000);
  EXPECT_EQ(fixture.balance(engine_fixture::recipient()), 3000);
  EXPECT_EQ(fixture.balance(engine_fixture::sender()), 0);

  releases.set_transfer_executor(fixture.ledger().executor());
  auto retried = releases.claim_stream(engine_fixture::recipient(), 0);
  ASSERT_TRUE(retried.ok()) << retried.log;
  EXPECT_EQ(*retried.value, 2000);
}

TEST(engine_stream, cancel_after_full_claim_is_already_terminal) {
  auto fixture = engine_fixture{"tranche_engine_stream_cancel_completed"};
  auto& releases = fixture.engine();
  fixture.fund(engine_fixture::sender(), 10000);
  releases.set_block_time(1000);
  ASSERT_TRUE(releases
                  .create_stream(engine_fixture::sender(),
                                 make_stream(10000, 1000, 2000))
                  .ok());
  releases.set_block_time(2500);
  ASSERT_TRUE(releases.claim_stream(engine_fixture::recipient(), 0).ok());

  auto cancel = releases.cancel_stream(engine_fixture::sender(), 0);
  EXPECT_EQ(cancel.code, error_code::already_terminal);
  EXPECT_FALSE(cancel.value.has_value());

  auto stream = releases.get(schedule_kind_t::stream, 0);
  ASSERT_TRUE(stream.ok());
  EXPECT_EQ(stream.value->status, schedule_status_t::completed);
  EXPECT_EQ(stream.value->refunded_amount, 0);
  EXPECT_FALSE(stream.value->terminated_at.has_value());
  EXPECT_EQ(fixture.balance(engine_fixture::recipient()), 10000);
  EXPECT_EQ(fixture.balance(engine_fixture::sender()), 0);
  EXPECT_EQ(fixture.balance(engine::escrow_account()), 0);
}

TEST(engine_stream, batch_creation_returns_ordered_ids) {
  auto fixture = engine_fixture{"tranche_engine_stream_batch"};
  auto& releases = fixture.engine();
  fixture.fund(engine_fixture::sender(), 600);
  releases.set_block_time(0);

  auto created = releases.create_streams(
      engine_fixture::sender(),
      {make_stream(100, 0, 10), make_stream(200, 5, 10, make_account(4)),
       make_stream(300, 10, 20)});
  ASSERT_TRUE(created.ok()) << created.log;
  EXPECT_EQ(*created.value, (std::vector<schedule_id_t>{0, 1, 2}));
  EXPECT_EQ(fixture.balance(engine_fixture::sender()), 0);
  EXPECT_EQ(fixture.balance(engine::escrow_account()), 600);
  EXPECT_EQ(releases.schedules_by_sender(schedule_kind_t::stream,
                                         engine_fixture::sender()),
            (std::vector<schedule_id_t>{0, 1, 2}));
  EXPECT_EQ(releases.schedules_by_recipient(schedule_kind_t::stream,
                                            engine_fixture::recipient()),
            (std::vector<schedule_id_t>{0, 2}));
  EXPECT_EQ(releases.schedules_by_recipient(schedule_kind_t::stream,
                                            make_account(4)),
            (std::vector<schedule_id_t>{1}));
  ASSERT_EQ(created.events.size(), 1u);
  EXPECT_EQ(created.events[0].type, "streams_created");
}

TEST(engine_stream, batch_with_one_invalid_entry_creates_nothing) {
  auto fixture = engine_fixture{"tranche_engine_stream_batch_invalid"};
  auto& releases = fixture.engine();
  fixture.fund(engine_fixture::sender(), 1000);
  releases.set_block_time(0);

  auto rejected = releases.create_streams(
      engine_fixture::sender(),
      {make_stream(100, 0, 10), make_stream(100, 10, 5)});
  EXPECT_EQ(rejected.code, error_code::invalid_duration);
  EXPECT_EQ(releases.schedule_count(schedule_kind_t::stream), 0u);
  EXPECT_EQ(fixture.balance(engine_fixture::sender()), 1000);

  auto underfunded = releases.create_streams(
      engine_fixture::sender(),
      {make_stream(600, 0, 10), make_stream(600, 0, 10)});
  EXPECT_EQ(underfunded.code, error_code::transfer_failed);
  EXPECT_EQ(releases.schedule_count(schedule_kind_t::stream), 0u);
  EXPECT_EQ(fixture.balance(engine_fixture::sender()), 1000);
  EXPECT_TRUE(releases
                  .schedules_by_sender(schedule_kind_t::stream,
                                       engine_fixture::sender())
                  .empty());
}

TEST(engine_stream, queries_are_idempotent) {
  auto fixture = engine_fixture{"tranche_engine_stream_queries"};
  auto& releases = fixture.engine();
  fixture.fund(engine_fixture::sender(), 1000);
  releases.set_block_time(0);
  ASSERT_TRUE(
      releases.create_stream(engine_fixture::sender(), make_stream(1000, 0, 100))
          .ok());
  releases.set_block_time(37);

  auto first = releases.progress(schedule_kind_t::stream, 0);
  auto second = releases.progress(schedule_kind_t::stream, 0);
  ASSERT_TRUE(first.ok());
  EXPECT_EQ(*first.value, *second.value);
  EXPECT_EQ(first.value->accrued_amount, 370);
  EXPECT_EQ(*releases.claimable(schedule_kind_t::stream, 0).value, 370);
  EXPECT_EQ(*releases.claimable(schedule_kind_t::stream, 0).value, 370);
  EXPECT_EQ(releases.progress(schedule_kind_t::stream, 5).code,
            error_code::schedule_not_found);
  EXPECT_EQ(releases.claim_history(schedule_kind_t::stream, 5).code,
            error_code::schedule_not_found);
}

TEST(engine_stream, events_describe_successful_operations) {
  auto fixture = engine_fixture{"tranche_engine_stream_events"};
  auto& releases = fixture.engine();
  fixture.fund(engine_fixture::sender(), 100);
  releases.set_block_time(0);
  ASSERT_TRUE(
      releases.create_stream(engine_fixture::sender(), make_stream(100, 0, 10))
          .ok());
  releases.set_block_time(5);
  auto claimed = releases.claim_stream(engine_fixture::recipient(), 0);
  ASSERT_TRUE(claimed.ok());
  ASSERT_TRUE(releases.cancel_stream(engine_fixture::sender(), 0).ok());

  const auto& events = fixture.events();
  ASSERT_EQ(events.size(), 4u);
  EXPECT_EQ(events[0].type, "initialized");
  EXPECT_EQ(events[1].type, "stream_created");
  EXPECT_EQ(events[2].type, "claimed");
  EXPECT_EQ(events[3].type, "stream_cancelled");
  ASSERT_EQ(claimed.events.size(), 1u);
  EXPECT_EQ(find_attribute(claimed.events[0], "amount"), "50");
  EXPECT_EQ(find_attribute(claimed.events[0], "status"), "active");
  EXPECT_FALSE(find_attribute(claimed.events[0], "refund").has_value());
  EXPECT_EQ(find_attribute(events[3], "refund"), "50");
}
