#include <clearhouse/common/critical.hpp>
#include <clearhouse/storage/rocksdb/storage.hpp>

namespace clearhouse::storage {
template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    clearhouse::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

template <>
storage<rocksdb_storage_tag> make_read_only_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::DB::OpenForReadOnly(
      ROCKSDB_NAMESPACE::Options{}, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB read-only at {}: {}", path,
                  status.ToString());
    clearhouse::common::critical("Failed to open RocksDB read-only");
  }
  spdlog::info("Opened RocksDB read-only at {}", path);
  store.database.reset(database);

  return store;
}
}  // namespace clearhouse::storage
