#pragma once

#include <clearhouse/ledger/batch_store.hpp>
#include <clearhouse/schema/encoding/scale/encoder.hpp>
#include <clearhouse/storage/rocksdb/storage.hpp>

#include <mutex>
#include <string_view>

namespace clearhouse::ledger {

inline constexpr auto kBatchPrefix = std::string_view{"BATCH|"};

/// Batches persisted in RocksDB under `BATCH|` + batch id.
class rocksdb_batch_store final : public batch_store {
 public:
  explicit rocksdb_batch_store(
      clearhouse::storage::storage<clearhouse::storage::rocksdb_storage_tag>&
          storage);

  bool put_once(const clearhouse::schema::batch_t& batch) override;
  std::optional<clearhouse::schema::batch_t> get(
      const clearhouse::schema::batch_id_t& batch_id) const override;
  std::vector<clearhouse::schema::batch_t> list() const override;

 private:
  clearhouse::storage::storage<clearhouse::storage::rocksdb_storage_tag>&
      storage_;
  mutable std::mutex mutex_;
  mutable clearhouse::schema::encoding::scale_encoder_t encoder_;
};

}  // namespace clearhouse::ledger
