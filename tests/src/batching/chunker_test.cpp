#include <gtest/gtest.h>
#include <clearhouse/batching/chunker.hpp>
#include <clearhouse/batching/grouper.hpp>
#include <clearhouse/testing/common.hpp>

#include <string>

namespace {

void fill(clearhouse::batching::grouper& grouper,
          const int count,
          const clearhouse::schema::timestamp_milliseconds_t submitted_at) {
  for (auto i = 0; i < count; ++i) {
    auto intent = clearhouse::testing::make_intent(
        "tx-" + std::to_string(submitted_at) + "-" + std::to_string(i), 100,
        "CP-1", submitted_at);
    ASSERT_TRUE(grouper.try_route(intent));
  }
}

}  // namespace

TEST(chunker, due_on_size_or_timeout) {
  auto grouper = clearhouse::batching::grouper{100};
  auto chunker = clearhouse::batching::chunker{
      grouper, clearhouse::batching::chunking_policy_t{.max_chunk_size = 3,
                                                       .batch_timeout = 500}};
  fill(grouper, 2, 1'000);
  auto lane = grouper.lanes().front();
  EXPECT_FALSE(chunker.due(*lane, 1'499));
  EXPECT_TRUE(chunker.due(*lane, 1'500));

  fill(grouper, 1, 1'400);
  EXPECT_TRUE(chunker.due(*lane, 1'400));
  EXPECT_EQ(chunker.due_lanes(1'400).size(), 1u);
}

TEST(chunker, form_releases_pending_and_bounds_chunk_size) {
  auto grouper = clearhouse::batching::grouper{100};
  auto chunker = clearhouse::batching::chunker{
      grouper, clearhouse::batching::chunking_policy_t{.max_chunk_size = 4,
                                                       .batch_timeout = 500}};
  fill(grouper, 10, 0);
  auto lane = grouper.lanes().front();

  auto first = chunker.form(*lane, 10);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->members.size(), 4u);
  EXPECT_EQ(grouper.pending(), 6u);

  auto second = chunker.form(*lane, 10);
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->sequence, 2u);

  // Two left: under the size trigger and not yet timed out.
  EXPECT_FALSE(chunker.form(*lane, 10).has_value());
  auto forced = chunker.form(*lane, 10, true);
  ASSERT_TRUE(forced.has_value());
  EXPECT_EQ(forced->members.size(), 2u);
  EXPECT_EQ(grouper.pending(), 0u);
}

TEST(chunker, requeue_restores_pending_at_lane_head) {
  auto grouper = clearhouse::batching::grouper{100};
  auto chunker = clearhouse::batching::chunker{
      grouper, clearhouse::batching::chunking_policy_t{.max_chunk_size = 2,
                                                       .batch_timeout = 500}};
  fill(grouper, 3, 0);
  auto lane = grouper.lanes().front();
  auto chunk = chunker.form(*lane, 600);
  ASSERT_TRUE(chunk.has_value());
  EXPECT_EQ(grouper.pending(), 1u);

  chunker.requeue(*lane, chunk->members);
  EXPECT_EQ(grouper.pending(), 3u);
  auto again = chunker.form(*lane, 600);
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->members[0].transaction_id,
            chunk->members[0].transaction_id);
  EXPECT_EQ(again->sequence, 2u);
}

TEST(chunker, empty_lane_is_never_due) {
  auto grouper = clearhouse::batching::grouper{100};
  auto chunker = clearhouse::batching::chunker{
      grouper, clearhouse::batching::chunking_policy_t{}};
  auto lane = clearhouse::batching::lane{clearhouse::schema::lane_key_t{}};
  EXPECT_FALSE(chunker.due(lane, 1'000'000));
  EXPECT_FALSE(chunker.form(lane, 1'000'000, true).has_value());
}
