#include <gtest/gtest.h>
#include <clearhouse/optimizer/cost_model.hpp>
#include <clearhouse/optimizer/fallback_assigner.hpp>
#include <clearhouse/testing/common.hpp>

#include <set>
#include <vector>

TEST(cost_model, default_pricing_is_symmetric) {
  auto pricing = clearhouse::optimizer::default_pricing();
  EXPECT_EQ(clearhouse::optimizer::spread_bps(
                pricing, clearhouse::schema::currency_pair_t{"USD", "GBP"}),
            clearhouse::schema::cost_t{"3.0"});
  EXPECT_EQ(clearhouse::optimizer::spread_bps(
                pricing, clearhouse::schema::currency_pair_t{"GBP", "USD"}),
            clearhouse::schema::cost_t{"3.0"});
  EXPECT_EQ(clearhouse::optimizer::spread_bps(
                pricing, clearhouse::schema::currency_pair_t{"CHF", "SGD"}),
            clearhouse::schema::cost_t{5});
}

TEST(cost_model, price_charges_one_wire_per_counterparty) {
  auto chunk = clearhouse::testing::make_chunk(
      {clearhouse::testing::make_intent("tx-1", 10'000, "CP-1"),
       clearhouse::testing::make_intent("tx-2", 10'000, "CP-1"),
       clearhouse::testing::make_intent("tx-3", 10'000, "CP-1"),
       clearhouse::testing::make_intent("tx-4", 10'000, "CP-2")});
  auto members = std::vector<size_t>{0, 1, 2, 3};
  auto cost = clearhouse::optimizer::price(
      chunk, members, clearhouse::optimizer::default_pricing());

  EXPECT_EQ(cost.wire_count, 2u);
  EXPECT_EQ(cost.consolidated_wire_count, 1u);
  // 400 USD at 2.5 bps.
  EXPECT_EQ(cost.fx_spread, clearhouse::schema::cost_t{"0.1"});
  EXPECT_EQ(cost.wire, clearhouse::schema::cost_t{10});
  EXPECT_EQ(cost.consolidation_discount, clearhouse::schema::cost_t{"0.75"});
  EXPECT_EQ(cost.total, clearhouse::schema::cost_t{"9.35"});
}

TEST(cost_model, split_feasible_applies_exposure_then_liquidity) {
  auto limits = clearhouse::optimizer::limits_t{};
  limits.exposure_caps["CP-1"] = clearhouse::schema::cost_t{150};
  limits.liquidity_caps[{clearhouse::schema::settlement_window_t::rtgs,
                         "USD"}] = 25'000;
  auto chunk = clearhouse::testing::make_chunk(
      {clearhouse::testing::make_intent("tx-1", 20'000, "CP-1"),
       clearhouse::testing::make_intent("tx-2", 10'000, "CP-2"),
       clearhouse::testing::make_intent("tx-3", 10'000, "CP-2"),
       clearhouse::testing::make_intent("tx-4", 10'000, "CP-2"),
       clearhouse::testing::make_intent("tx-5", 5'000, "CP-2")});

  auto split = clearhouse::optimizer::split_feasible(chunk, limits);
  EXPECT_EQ(split.feasible, (std::vector<size_t>{1, 2, 4}));
  EXPECT_EQ(split.infeasible, (std::vector<size_t>{0, 3}));
  EXPECT_EQ(split.reason, "exposure_cap_exceeded,liquidity_cap_exceeded");
}

TEST(cost_model, liquidity_cap_is_keyed_by_window_and_source_currency) {
  auto limits = clearhouse::optimizer::limits_t{};
  limits.liquidity_caps[{clearhouse::schema::settlement_window_t::t1,
                         "USD"}] = 100;
  EXPECT_EQ(clearhouse::optimizer::liquidity_cap(
                limits, clearhouse::schema::settlement_window_t::t1, "USD"),
            100);
  EXPECT_FALSE(clearhouse::optimizer::liquidity_cap(
                   limits, clearhouse::schema::settlement_window_t::rtgs, "USD")
                   .has_value());

  limits.default_exposure_cap = clearhouse::schema::cost_t{10};
  limits.exposure_caps["CP-1"] = clearhouse::schema::cost_t{20};
  EXPECT_EQ(clearhouse::optimizer::exposure_cap(limits, "CP-1"),
            clearhouse::schema::cost_t{20});
  EXPECT_EQ(clearhouse::optimizer::exposure_cap(limits, "CP-2"),
            clearhouse::schema::cost_t{10});
}

TEST(cost_model, batch_id_depends_on_status_and_members) {
  auto lane = clearhouse::schema::lane_key_t{
      .window = clearhouse::schema::settlement_window_t::rtgs,
      .currencies = clearhouse::schema::currency_pair_t{"USD", "EUR"}};
  auto members = std::vector<clearhouse::schema::transaction_id_t>{"a", "b"};
  auto optimal = clearhouse::optimizer::make_batch_id(
      lane, 1, clearhouse::schema::batch_status_t::optimal, members);
  EXPECT_TRUE(optimal.starts_with("batch-"));
  EXPECT_EQ(optimal.size(), 6u + 32u);
  EXPECT_EQ(optimal, clearhouse::optimizer::make_batch_id(
                         lane, 1, clearhouse::schema::batch_status_t::optimal,
                         members));
  EXPECT_NE(optimal, clearhouse::optimizer::make_batch_id(
                         lane, 1, clearhouse::schema::batch_status_t::fallback,
                         members));
  EXPECT_NE(optimal, clearhouse::optimizer::make_batch_id(
                         lane, 2, clearhouse::schema::batch_status_t::optimal,
                         members));
}

TEST(cost_model, infeasible_batch_carries_reason_and_no_cost) {
  auto chunk = clearhouse::testing::make_chunk(
      {clearhouse::testing::make_intent("tx-1", 10'000)});
  auto batch = clearhouse::optimizer::make_batch(
      chunk, {0}, clearhouse::schema::batch_status_t::infeasible,
      clearhouse::optimizer::default_pricing(), "liquidity_cap_exceeded");
  EXPECT_EQ(batch.infeasible_reason, "liquidity_cap_exceeded");
  EXPECT_EQ(batch.cost.total, clearhouse::schema::cost_t{0});
  EXPECT_EQ(batch.cost.wire_count, 0u);
  ASSERT_EQ(batch.subtotals.size(), 1u);
  EXPECT_EQ(batch.subtotals[0].currency, "USD");
  EXPECT_EQ(batch.subtotals[0].gross, 10'000);
  EXPECT_EQ(batch.created_at, chunk.formed_at);
}

TEST(fallback_assigner, groups_by_counterparty_in_arrival_order) {
  auto chunk = clearhouse::testing::make_chunk(
      {clearhouse::testing::make_intent("tx-1", 100, "CP-2"),
       clearhouse::testing::make_intent("tx-2", 100, "CP-1"),
       clearhouse::testing::make_intent("tx-3", 100, "CP-2"),
       clearhouse::testing::make_intent("tx-4", 100, "CP-1")});
  auto limits = clearhouse::optimizer::limits_t{};
  limits.max_batch_size = 2;
  auto batches = clearhouse::optimizer::assign_fallback(
      chunk, clearhouse::optimizer::default_pricing(), limits);

  ASSERT_EQ(batches.size(), 2u);
  EXPECT_EQ(batches[0].members,
            (std::vector<clearhouse::schema::transaction_id_t>{"tx-1", "tx-3"}));
  EXPECT_EQ(batches[1].members,
            (std::vector<clearhouse::schema::transaction_id_t>{"tx-2", "tx-4"}));
  for (const auto& batch : batches) {
    EXPECT_EQ(batch.status, clearhouse::schema::batch_status_t::fallback);
    EXPECT_EQ(batch.cost.consolidated_wire_count, 1u);
  }
}

TEST(fallback_assigner, is_deterministic) {
  auto members = std::vector<clearhouse::schema::transaction_intent_t>{};
  for (auto i = 0; i < 40; ++i) {
    members.push_back(clearhouse::testing::make_intent(
        "tx-" + std::to_string(i), 1'000 + (i * 37) % 500,
        "CP-" + std::to_string(i % 3)));
  }
  auto chunk = clearhouse::testing::make_chunk(members);
  auto limits = clearhouse::optimizer::limits_t{};
  limits.max_batch_size = 7;
  limits.default_exposure_cap = clearhouse::schema::cost_t{40};

  auto first = clearhouse::optimizer::assign_fallback(
      chunk, clearhouse::optimizer::default_pricing(), limits);
  auto second = clearhouse::optimizer::assign_fallback(
      chunk, clearhouse::optimizer::default_pricing(), limits);
  EXPECT_EQ(first, second);

  auto seen = std::set<clearhouse::schema::transaction_id_t>{};
  for (const auto& batch : first) {
    EXPECT_LE(batch.members.size(), 7u);
    for (const auto& member : batch.members) {
      EXPECT_TRUE(seen.insert(member).second);
    }
  }
  EXPECT_EQ(seen.size(), 40u);
}

TEST(fallback_assigner, respects_exposure_cap_per_batch) {
  auto chunk = clearhouse::testing::make_chunk(
      {clearhouse::testing::make_intent("tx-1", 10'000, "CP-1"),
       clearhouse::testing::make_intent("tx-2", 10'000, "CP-1"),
       clearhouse::testing::make_intent("tx-3", 5'000, "CP-1")});
  auto limits = clearhouse::optimizer::limits_t{};
  limits.exposure_caps["CP-1"] = clearhouse::schema::cost_t{150};
  auto batches = clearhouse::optimizer::assign_fallback(
      chunk, clearhouse::optimizer::default_pricing(), limits);
  ASSERT_EQ(batches.size(), 2u);
  EXPECT_EQ(batches[0].subtotals[0].gross, 10'000);
  EXPECT_EQ(batches[1].subtotals[0].gross, 15'000);
}
