#include <clearhouse/ledger/rocksdb_batch_store.hpp>
#include <clearhouse/ledger/rocksdb_log.hpp>
#include <clearhouse/storage/rocksdb/storage.hpp>
#include <clearhouse/storage/storage.hpp>
#include <clearhouse/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>

namespace {

using storage_t =
    clearhouse::storage::storage<clearhouse::storage::rocksdb_storage_tag>;

storage_t open_storage(const std::string& path) {
  return clearhouse::storage::make_storage<
      clearhouse::storage::rocksdb_storage_tag>(path);
}

clearhouse::schema::ledger_event_t make_event(const std::string& entity_id,
                                              const uint64_t sequence) {
  auto event = clearhouse::schema::ledger_event_t{};
  event.type = clearhouse::schema::ledger_event_type_t::submitted;
  event.entity_id = entity_id;
  event.sequence = sequence;
  event.timestamp = 1'000 + sequence;
  event.attributes = {{"window", "rtgs"}};
  return event;
}

}  // namespace

TEST(rocksdb_storage, raw_values_round_trip) {
  auto db = clearhouse::testing::make_db_path("clearhouse_storage_raw");
  {
    auto storage = open_storage(db);
    auto key = clearhouse::schema::make_bytes(std::string_view{"key"});
    auto value = clearhouse::schema::bytes_t{0x01, 0x02, 0x03};
    EXPECT_FALSE(
        storage.get_raw(clearhouse::schema::make_bytes_view(key)).has_value());
    storage.put_raw(clearhouse::schema::make_bytes_view(key),
                    clearhouse::schema::make_bytes_view(value));
    EXPECT_EQ(storage.get_raw(clearhouse::schema::make_bytes_view(key)), value);
  }
  clearhouse::testing::remove_path(db);
}

TEST(rocksdb_storage, records_list_in_numeric_offset_order) {
  auto db = clearhouse::testing::make_db_path("clearhouse_storage_records");
  {
    auto storage = open_storage(db);
    EXPECT_FALSE(storage.last_record_offset("LOG|").has_value());
    for (const auto offset : {uint64_t{256}, uint64_t{1}, uint64_t{2}}) {
      auto value = clearhouse::schema::bytes_t{static_cast<uint8_t>(offset)};
      storage.put_record("LOG|", offset,
                         clearhouse::schema::make_bytes_view(value));
    }
    auto other = clearhouse::schema::bytes_t{0xFF};
    storage.put_record("MARK|", 9, clearhouse::schema::make_bytes_view(other));

    EXPECT_EQ(storage.last_record_offset("LOG|"), 256u);
    auto records = storage.list_records("LOG|", 2);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].offset, 2u);
    EXPECT_EQ(records[1].offset, 256u);
    EXPECT_EQ(storage.list_records("LOG|", 0).size(), 3u);
  }
  clearhouse::testing::remove_path(db);
}

TEST(rocksdb_log, appends_survive_reopen) {
  auto db = clearhouse::testing::make_db_path("clearhouse_rocksdb_log");
  {
    auto storage = open_storage(db);
    auto log = clearhouse::ledger::rocksdb_log{storage};
    EXPECT_EQ(log.append(make_event("tx-1", 1)), 0u);
    EXPECT_EQ(log.append(make_event("tx-2", 1)), 1u);
  }
  {
    auto storage = open_storage(db);
    auto log = clearhouse::ledger::rocksdb_log{storage};
    EXPECT_EQ(log.append(make_event("tx-1", 2)), 2u);

    auto events = log.replay(0);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].event, make_event("tx-1", 1));
    EXPECT_EQ(events[2].offset, 2u);
    EXPECT_EQ(events[2].event.sequence, 2u);
    EXPECT_EQ(log.replay(1).size(), 2u);
  }
  clearhouse::testing::remove_path(db);
}

TEST(rocksdb_log, failed_write_reports_downstream_unavailable) {
  auto db = clearhouse::testing::make_db_path("clearhouse_rocksdb_log_ro");
  {
    auto storage = open_storage(db);
    auto log = clearhouse::ledger::rocksdb_log{storage};
    EXPECT_EQ(log.append(make_event("tx-1", 1)), 0u);
  }
  {
    auto storage = clearhouse::storage::make_read_only_storage<
        clearhouse::storage::rocksdb_storage_tag>(db);
    auto log = clearhouse::ledger::rocksdb_log{storage};
    EXPECT_THROW(log.append(make_event("tx-2", 1)),
                 clearhouse::ledger::downstream_unavailable);
    EXPECT_THROW(log.append(make_event("tx-2", 1)),
                 clearhouse::ledger::downstream_unavailable);
    ASSERT_EQ(log.replay(0).size(), 1u);
  }
  {
    auto storage = open_storage(db);
    auto log = clearhouse::ledger::rocksdb_log{storage};
    EXPECT_EQ(log.append(make_event("tx-2", 1)), 1u);
  }
  clearhouse::testing::remove_path(db);
}

TEST(rocksdb_batch_store, put_once_is_write_once_and_lists) {
  auto db = clearhouse::testing::make_db_path("clearhouse_rocksdb_batches");
  {
    auto storage = open_storage(db);
    auto store = clearhouse::ledger::rocksdb_batch_store{storage};

    auto batch = clearhouse::schema::batch_t{};
    batch.batch_id = "batch-2";
    batch.members = {"tx-1", "tx-2"};
    batch.cost.total = clearhouse::schema::cost_t{"9.35"};
    EXPECT_TRUE(store.put_once(batch));

    auto rewrite = batch;
    rewrite.members = {"tx-3"};
    EXPECT_FALSE(store.put_once(rewrite));

    auto first = clearhouse::schema::batch_t{};
    first.batch_id = "batch-1";
    first.status = clearhouse::schema::batch_status_t::infeasible;
    first.infeasible_reason = "liquidity_cap_exceeded";
    EXPECT_TRUE(store.put_once(first));

    auto stored = store.get("batch-2");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, batch);
    EXPECT_FALSE(store.get("batch-9").has_value());

    auto listed = store.list();
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(listed[0], first);
    EXPECT_EQ(listed[1].batch_id, "batch-2");
  }
  clearhouse::testing::remove_path(db);
}
