#pragma once

#include <clearhouse/ledger/durable_log.hpp>
#include <clearhouse/schema/encoding/scale/encoder.hpp>
#include <clearhouse/storage/rocksdb/storage.hpp>

#include <mutex>
#include <string_view>

namespace clearhouse::ledger {

inline constexpr auto kLogPrefix = std::string_view{"LOG|"};

/// Durable log stored in RocksDB under `LOG|` + big-endian offset, each
/// event SCALE encoded. Appends resume after the highest stored offset.
class rocksdb_log final : public durable_log {
 public:
  explicit rocksdb_log(
      clearhouse::storage::storage<clearhouse::storage::rocksdb_storage_tag>&
          storage);

  uint64_t append(const clearhouse::schema::ledger_event_t& event) override;
  std::vector<logged_event_t> replay(uint64_t from_offset) const override;

 private:
  clearhouse::storage::storage<clearhouse::storage::rocksdb_storage_tag>&
      storage_;
  mutable std::mutex mutex_;
  mutable clearhouse::schema::encoding::scale_encoder_t encoder_;
  uint64_t next_offset_{};
};

}  // namespace clearhouse::ledger
