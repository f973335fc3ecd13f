#include <gtest/gtest.h>
#include <clearhouse/batching/grouper.hpp>
#include <clearhouse/intake/dedup_store.hpp>
#include <clearhouse/intake/idempotency_gate.hpp>
#include <clearhouse/ledger/emitter.hpp>
#include <clearhouse/ledger/memory_log.hpp>
#include <clearhouse/testing/common.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace {

clearhouse::schema::validation_error_code rejection_code(
    const clearhouse::intake::validation_result_t& result) {
  return std::get<clearhouse::schema::rejected_t>(result).code;
}

size_t count_events(const clearhouse::ledger::memory_log& log,
                    const clearhouse::schema::ledger_event_type_t type) {
  auto count = size_t{};
  for (const auto& logged : log.replay(0)) {
    if (logged.event.type == type) {
      ++count;
    }
  }
  return count;
}

struct gate_harness final {
  explicit gate_harness(const size_t max_pending = 100)
      : grouper{max_pending},
        emitter{log, clearhouse::ledger::retry_policy_t{},
                [](std::chrono::milliseconds) {}},
        gate{dedup, grouper, emitter} {}

  clearhouse::intake::dedup_store dedup{1'000};
  clearhouse::batching::grouper grouper;
  clearhouse::ledger::memory_log log;
  clearhouse::ledger::emitter emitter;
  clearhouse::intake::idempotency_gate gate;
};

}  // namespace

TEST(idempotency_gate, validate_builds_intent_in_minor_units) {
  auto submission = clearhouse::testing::make_submission("tx-1", "1250.50");
  submission.settlement_window = "t1";
  auto result = clearhouse::intake::validate(submission, 42);
  ASSERT_TRUE(
      std::holds_alternative<clearhouse::schema::transaction_intent_t>(result));
  const auto& intent = std::get<clearhouse::schema::transaction_intent_t>(result);
  EXPECT_EQ(intent.amount, 125'050);
  EXPECT_EQ(intent.currencies.source, "USD");
  EXPECT_EQ(intent.currencies.destination, "EUR");
  EXPECT_EQ(intent.window, clearhouse::schema::settlement_window_t::t1);
  EXPECT_EQ(intent.submitted_at, 42u);
}

TEST(idempotency_gate, validate_defaults_window_to_rtgs) {
  auto submission = clearhouse::testing::make_submission("tx-1");
  submission.settlement_window.clear();
  auto result = clearhouse::intake::validate(submission, 0);
  EXPECT_EQ(std::get<clearhouse::schema::transaction_intent_t>(result).window,
            clearhouse::schema::settlement_window_t::rtgs);
}

TEST(idempotency_gate, validate_reports_precise_codes) {
  using code = clearhouse::schema::validation_error_code;

  auto bad_id = clearhouse::testing::make_submission("tx 1");
  EXPECT_EQ(rejection_code(clearhouse::intake::validate(bad_id, 0)),
            code::invalid_transaction_id);

  auto long_id = clearhouse::testing::make_submission(std::string(51, 'a'));
  EXPECT_EQ(rejection_code(clearhouse::intake::validate(long_id, 0)),
            code::invalid_transaction_id);

  auto zero = clearhouse::testing::make_submission("tx-1", "0.00");
  EXPECT_EQ(rejection_code(clearhouse::intake::validate(zero, 0)),
            code::invalid_amount);

  auto negative = clearhouse::testing::make_submission("tx-1", "-5.00");
  EXPECT_EQ(rejection_code(clearhouse::intake::validate(negative, 0)),
            code::invalid_amount);

  auto too_precise = clearhouse::testing::make_submission("tx-1", "1.001");
  EXPECT_EQ(rejection_code(clearhouse::intake::validate(too_precise, 0)),
            code::invalid_amount);

  auto too_large =
      clearhouse::testing::make_submission("tx-1", "1000000000.00");
  EXPECT_EQ(rejection_code(clearhouse::intake::validate(too_large, 0)),
            code::amount_exceeds_limit);

  auto at_limit = clearhouse::testing::make_submission("tx-1", "999999999.99");
  EXPECT_TRUE(std::holds_alternative<clearhouse::schema::transaction_intent_t>(
      clearhouse::intake::validate(at_limit, 0)));

  auto malformed_currency = clearhouse::testing::make_submission("tx-1");
  malformed_currency.source_currency = "usd";
  EXPECT_EQ(rejection_code(clearhouse::intake::validate(malformed_currency, 0)),
            code::invalid_currency);

  auto unknown_currency = clearhouse::testing::make_submission("tx-1");
  unknown_currency.destination_currency = "XYZ";
  EXPECT_EQ(rejection_code(clearhouse::intake::validate(unknown_currency, 0)),
            code::unsupported_currency);

  auto no_source = clearhouse::testing::make_submission("tx-1");
  no_source.source_account = "  ";
  EXPECT_EQ(rejection_code(clearhouse::intake::validate(no_source, 0)),
            code::missing_source_account);

  auto no_destination = clearhouse::testing::make_submission("tx-1");
  no_destination.destination_account.clear();
  EXPECT_EQ(rejection_code(clearhouse::intake::validate(no_destination, 0)),
            code::missing_destination_account);

  auto same_account = clearhouse::testing::make_submission("tx-1");
  same_account.destination_account = same_account.source_account;
  EXPECT_EQ(rejection_code(clearhouse::intake::validate(same_account, 0)),
            code::same_source_and_destination);

  auto no_counterparty = clearhouse::testing::make_submission("tx-1");
  no_counterparty.counterparty_id.clear();
  EXPECT_EQ(rejection_code(clearhouse::intake::validate(no_counterparty, 0)),
            code::missing_counterparty);

  auto long_account = clearhouse::testing::make_submission("tx-1");
  long_account.source_account = std::string(51, 'S');
  EXPECT_EQ(rejection_code(clearhouse::intake::validate(long_account, 0)),
            code::field_too_long);

  auto no_key = clearhouse::testing::make_submission("tx-1");
  no_key.idempotency_key.clear();
  EXPECT_EQ(rejection_code(clearhouse::intake::validate(no_key, 0)),
            code::invalid_idempotency_key);

  auto long_key = clearhouse::testing::make_submission("tx-1");
  long_key.idempotency_key = std::string(101, 'k');
  EXPECT_EQ(rejection_code(clearhouse::intake::validate(long_key, 0)),
            code::field_too_long);

  auto bad_window = clearhouse::testing::make_submission("tx-1");
  bad_window.settlement_window = "t5";
  EXPECT_EQ(rejection_code(clearhouse::intake::validate(bad_window, 0)),
            code::invalid_settlement_window);
}

TEST(idempotency_gate, accepted_submission_is_routed_and_recorded) {
  auto harness = gate_harness{};
  auto result =
      harness.gate.admit(clearhouse::testing::make_submission("tx-1"), 10);
  ASSERT_TRUE(std::holds_alternative<clearhouse::schema::accepted_t>(result));
  const auto& accepted = std::get<clearhouse::schema::accepted_t>(result);
  EXPECT_EQ(accepted.outcome.transaction_id, "tx-1");
  EXPECT_EQ(accepted.outcome.status, "submitted");
  EXPECT_EQ(accepted.outcome.amount, "100.00");

  EXPECT_EQ(harness.grouper.pending(), 1u);
  auto lane = harness.grouper.find(clearhouse::schema::lane_key_t{
      .window = clearhouse::schema::settlement_window_t::rtgs,
      .currencies = clearhouse::schema::currency_pair_t{"USD", "EUR"}});
  ASSERT_NE(lane, nullptr);
  EXPECT_EQ(lane->size(), 1u);

  auto events = harness.log.replay(0);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].event.type,
            clearhouse::schema::ledger_event_type_t::submitted);
  EXPECT_EQ(events[0].event.entity_id, "tx-1");
  EXPECT_EQ(events[0].event.sequence, 1u);
}

TEST(idempotency_gate, duplicate_returns_prior_outcome_and_emits_deduped) {
  auto harness = gate_harness{};
  auto first =
      harness.gate.admit(clearhouse::testing::make_submission("tx-1"), 10);
  auto retry = clearhouse::testing::make_submission("tx-2", "999.00");
  retry.idempotency_key = "key-tx-1";
  auto second = harness.gate.admit(retry, 20);

  ASSERT_TRUE(std::holds_alternative<clearhouse::schema::duplicate_t>(second));
  EXPECT_EQ(std::get<clearhouse::schema::duplicate_t>(second).prior,
            std::get<clearhouse::schema::accepted_t>(first).outcome);
  EXPECT_EQ(harness.grouper.pending(), 1u);
  EXPECT_EQ(count_events(harness.log,
                         clearhouse::schema::ledger_event_type_t::submitted),
            1u);
  EXPECT_EQ(count_events(harness.log,
                         clearhouse::schema::ledger_event_type_t::deduped),
            1u);
}

TEST(idempotency_gate, concurrent_duplicates_admit_exactly_once) {
  auto harness = gate_harness{};
  auto accepted = std::atomic<int>{0};
  auto duplicates = std::atomic<int>{0};
  {
    auto threads = std::vector<std::jthread>{};
    for (auto i = 0; i < 8; ++i) {
      threads.emplace_back([&] {
        auto result = harness.gate.admit(
            clearhouse::testing::make_submission("tx-1"), 10);
        if (std::holds_alternative<clearhouse::schema::accepted_t>(result)) {
          ++accepted;
        } else if (std::holds_alternative<clearhouse::schema::duplicate_t>(
                       result)) {
          ++duplicates;
        }
      });
    }
  }
  EXPECT_EQ(accepted.load(), 1);
  EXPECT_EQ(duplicates.load(), 7);
  EXPECT_EQ(harness.grouper.pending(), 1u);
  EXPECT_EQ(count_events(harness.log,
                         clearhouse::schema::ledger_event_type_t::submitted),
            1u);
}

TEST(idempotency_gate, rejections_are_not_cached) {
  auto harness = gate_harness{};
  auto invalid = clearhouse::testing::make_submission("tx-1", "abc");
  auto rejected = harness.gate.admit(invalid, 10);
  ASSERT_TRUE(std::holds_alternative<clearhouse::schema::rejected_t>(rejected));
  EXPECT_EQ(harness.dedup.size(), 0u);

  auto fixed = harness.gate.admit(clearhouse::testing::make_submission("tx-1"),
                                  11);
  EXPECT_TRUE(std::holds_alternative<clearhouse::schema::accepted_t>(fixed));
}

TEST(idempotency_gate, reused_transaction_id_under_new_key_is_rejected) {
  auto harness = gate_harness{};
  harness.gate.admit(clearhouse::testing::make_submission("tx-1"), 10);
  auto reuse = clearhouse::testing::make_submission("tx-1");
  reuse.idempotency_key = "another-key";
  auto result = harness.gate.admit(reuse, 11);
  ASSERT_TRUE(std::holds_alternative<clearhouse::schema::rejected_t>(result));
  EXPECT_EQ(std::get<clearhouse::schema::rejected_t>(result).code,
            clearhouse::schema::validation_error_code::duplicate_transaction_id);
  EXPECT_EQ(harness.dedup.size(), 1u);
}

TEST(idempotency_gate, queue_full_is_retryable_and_not_cached) {
  auto harness = gate_harness{1};
  harness.gate.admit(clearhouse::testing::make_submission("tx-1"), 10);
  auto refused =
      harness.gate.admit(clearhouse::testing::make_submission("tx-2"), 11);
  ASSERT_TRUE(std::holds_alternative<clearhouse::schema::rejected_t>(refused));
  EXPECT_EQ(std::get<clearhouse::schema::rejected_t>(refused).code,
            clearhouse::schema::validation_error_code::queue_full);

  harness.grouper.release(1);
  auto retried =
      harness.gate.admit(clearhouse::testing::make_submission("tx-2"), 12);
  EXPECT_TRUE(std::holds_alternative<clearhouse::schema::accepted_t>(retried));
}

TEST(idempotency_gate, key_is_admitted_again_after_retention) {
  auto harness = gate_harness{};
  harness.gate.admit(clearhouse::testing::make_submission("tx-1"), 10);
  auto later = clearhouse::testing::make_submission("tx-9");
  later.idempotency_key = "key-tx-1";
  auto result = harness.gate.admit(later, 10 + 1'000);
  EXPECT_TRUE(std::holds_alternative<clearhouse::schema::accepted_t>(result));
}

TEST(idempotency_gate, transaction_ids_expire_with_the_dedup_horizon) {
  auto harness = gate_harness{};
  harness.gate.admit(clearhouse::testing::make_submission("tx-1"), 10);
  harness.gate.admit(clearhouse::testing::make_submission("tx-2"), 500);
  EXPECT_EQ(harness.gate.tracked_transaction_ids(), 2u);

  EXPECT_EQ(harness.gate.purge_expired(10 + 1'000), 1u);
  EXPECT_EQ(harness.gate.tracked_transaction_ids(), 1u);
  EXPECT_EQ(harness.dedup.size(), 1u);

  auto reused = clearhouse::testing::make_submission("tx-1");
  reused.idempotency_key = "key-other";
  auto result = harness.gate.admit(reused, 10 + 1'000);
  EXPECT_TRUE(std::holds_alternative<clearhouse::schema::accepted_t>(result));
}

TEST(idempotency_gate, saturated_outbox_refuses_with_queue_full) {
  auto dedup = clearhouse::intake::dedup_store{1'000};
  auto grouper = clearhouse::batching::grouper{100};
  auto log = clearhouse::ledger::memory_log{};
  auto emitter = clearhouse::ledger::emitter{
      log,
      clearhouse::ledger::retry_policy_t{.max_attempts = 1,
                                         .outbox_capacity = 1},
      [](std::chrono::milliseconds) {}};
  auto gate = clearhouse::intake::idempotency_gate{dedup, grouper, emitter};

  log.set_available(false);
  auto first = gate.admit(clearhouse::testing::make_submission("tx-1"), 1);
  ASSERT_TRUE(std::holds_alternative<clearhouse::schema::accepted_t>(first));

  auto second = gate.admit(clearhouse::testing::make_submission("tx-2"), 2);
  ASSERT_TRUE(std::holds_alternative<clearhouse::schema::rejected_t>(second));
  EXPECT_EQ(std::get<clearhouse::schema::rejected_t>(second).code,
            clearhouse::schema::validation_error_code::queue_full);
  EXPECT_EQ(grouper.pending(), 1u);

  log.set_available(true);
  EXPECT_EQ(emitter.flush_pending(), 0u);
  auto retried = gate.admit(clearhouse::testing::make_submission("tx-2"), 3);
  EXPECT_TRUE(std::holds_alternative<clearhouse::schema::accepted_t>(retried));
}
