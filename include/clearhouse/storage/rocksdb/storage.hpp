#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <spdlog/spdlog.h>
#include <boost/endian/conversion.hpp>
#include <clearhouse/common/critical.hpp>
#include <clearhouse/storage/storage.hpp>
#include <cstring>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>

namespace clearhouse::storage {

namespace detail {

inline clearhouse::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const clearhouse::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

/// Big-endian offsets keep lexicographic key order equal to numeric order.
inline std::string make_record_key(const std::string_view prefix,
                                   const uint64_t offset) {
  auto big_endian = boost::endian::native_to_big(offset);
  auto key = std::string{prefix};
  key.append(reinterpret_cast<const char*>(&big_endian), sizeof(big_endian));
  return key;
}

inline std::optional<uint64_t> parse_record_key(const std::string_view prefix,
                                                const std::string_view key) {
  if (!key.starts_with(prefix) || key.size() != prefix.size() + 8) {
    return std::nullopt;
  }
  auto big_endian = uint64_t{};
  std::memcpy(&big_endian, key.data() + prefix.size(), sizeof(big_endian));
  return boost::endian::big_to_native(big_endian);
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const clearhouse::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const clearhouse::schema::bytes_view_t& key,
           const T& value) const;

  std::optional<clearhouse::schema::bytes_t> get_raw(
      const clearhouse::schema::bytes_view_t& key) const;
  void put_raw(const clearhouse::schema::bytes_view_t& key,
               const clearhouse::schema::bytes_view_t& value) const;
  void put_record(std::string_view prefix,
                  uint64_t offset,
                  const clearhouse::schema::bytes_view_t& value) const;
  std::optional<std::string> try_put_record(
      std::string_view prefix,
      uint64_t offset,
      const clearhouse::schema::bytes_view_t& value) const;
  std::optional<uint64_t> last_record_offset(std::string_view prefix) const;
  std::vector<log_record> list_records(std::string_view prefix,
                                       uint64_t from_offset) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const clearhouse::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <>
storage<rocksdb_storage_tag> make_read_only_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const clearhouse::schema::bytes_view_t& key) const {
  auto value = get_raw(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      clearhouse::schema::bytes_view_t{value->data(), value->size()})};
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const clearhouse::schema::bytes_view_t& key,
    const T& value) const {
  auto encoded_value = encoder.encode(value);
  put_raw(key, clearhouse::schema::bytes_view_t{encoded_value.data(),
                                                encoded_value.size()});
}

inline std::optional<clearhouse::schema::bytes_t>
storage<rocksdb_storage_tag>::get_raw(
    const clearhouse::schema::bytes_view_t& key) const {
  if (!database) {
    clearhouse::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    clearhouse::common::critical("Failed to get value from RocksDB");
  }
  return clearhouse::schema::bytes_t(std::begin(value), std::end(value));
}

inline void storage<rocksdb_storage_tag>::put_raw(
    const clearhouse::schema::bytes_view_t& key,
    const clearhouse::schema::bytes_view_t& value) const {
  if (!database) {
    clearhouse::common::critical("RocksDB database is not initialized");
  }
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = database->Put(write_options, detail::to_slice(key),
                              detail::to_slice(value));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    clearhouse::common::critical("Failed to put value into RocksDB");
  }
}

inline void storage<rocksdb_storage_tag>::put_record(
    const std::string_view prefix,
    const uint64_t offset,
    const clearhouse::schema::bytes_view_t& value) const {
  auto key = detail::make_record_key(prefix, offset);
  put_raw(clearhouse::schema::make_bytes_view(key), value);
}

inline std::optional<std::string>
storage<rocksdb_storage_tag>::try_put_record(
    const std::string_view prefix,
    const uint64_t offset,
    const clearhouse::schema::bytes_view_t& value) const {
  if (!database) {
    clearhouse::common::critical("RocksDB database is not initialized");
  }
  auto key = detail::make_record_key(prefix, offset);
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status =
      database->Put(write_options, key, detail::to_slice(value));
  if (!status.ok()) {
    return status.ToString();
  }
  return std::nullopt;
}

inline std::optional<uint64_t>
storage<rocksdb_storage_tag>::last_record_offset(
    const std::string_view prefix) const {
  if (!database) {
    clearhouse::common::critical("RocksDB database is not initialized");
  }
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  // Every record key is prefix + 8 bytes, so prefix + 0xFF..FF bounds them.
  auto upper = detail::make_record_key(prefix, UINT64_MAX);
  iterator->SeekForPrev(upper);
  if (!iterator->Valid()) {
    return std::nullopt;
  }
  return detail::parse_record_key(
      prefix, std::string_view{iterator->key().data(), iterator->key().size()});
}

inline std::vector<log_record> storage<rocksdb_storage_tag>::list_records(
    const std::string_view prefix,
    const uint64_t from_offset) const {
  if (!database) {
    clearhouse::common::critical("RocksDB database is not initialized");
  }
  auto records = std::vector<log_record>{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(detail::make_record_key(prefix, from_offset));
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix)) {
      break;
    }
    auto offset = detail::parse_record_key(prefix, key_view);
    if (!offset) {
      spdlog::warn("Skipping malformed record key under '{}'", prefix);
      iterator->Next();
      continue;
    }
    records.push_back(log_record{.offset = *offset,
                                 .value = detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    clearhouse::common::critical("RocksDB iteration failed");
  }
  return records;
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const clearhouse::schema::bytes_view_t& prefix) const {
  if (!database) {
    clearhouse::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  return entries;
}

}  // namespace clearhouse::storage
