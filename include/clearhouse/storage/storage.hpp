#pragma once
#include <clearhouse/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace clearhouse::storage {

using key_value_entry_t =
    std::pair<clearhouse::schema::bytes_t, clearhouse::schema::bytes_t>;

/// One record of an ordered keyspace addressed by a numeric offset.
struct log_record final {
  uint64_t offset{};
  clearhouse::schema::bytes_t value;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const clearhouse::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const clearhouse::schema::bytes_view_t& key,
           const T& value) const;

  /// Return raw bytes at key, or std::nullopt when missing.
  std::optional<clearhouse::schema::bytes_t> get_raw(
      const clearhouse::schema::bytes_view_t& key) const;

  /// Persist raw bytes at key.
  void put_raw(const clearhouse::schema::bytes_view_t& key,
               const clearhouse::schema::bytes_view_t& value) const;

  /// Write value under `prefix` + big-endian offset.
  void put_record(std::string_view prefix,
                  uint64_t offset,
                  const clearhouse::schema::bytes_view_t& value) const;

  /// Like put_record, but a failed write is handed back as its error text
  /// instead of being fatal.
  std::optional<std::string> try_put_record(
      std::string_view prefix,
      uint64_t offset,
      const clearhouse::schema::bytes_view_t& value) const;

  /// Highest offset stored under prefix, or std::nullopt for an empty range.
  std::optional<uint64_t> last_record_offset(std::string_view prefix) const;

  /// Records under prefix with offset >= from_offset, in offset order.
  std::vector<log_record> list_records(std::string_view prefix,
                                       uint64_t from_offset) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const clearhouse::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

/// Open an existing backend at path without write access.
template <typename Library>
storage<Library> make_read_only_storage(const std::string_view& path);

}  // namespace clearhouse::storage
