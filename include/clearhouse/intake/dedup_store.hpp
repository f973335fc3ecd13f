#pragma once

#include <clearhouse/schema/admission_result.hpp>
#include <clearhouse/schema/dedup_record.hpp>
#include <clearhouse/schema/primitives.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace clearhouse::intake {

enum class dedup_status_t : uint8_t {
  inserted = 0,  // factory ran and its outcome is now cached
  existing = 1,  // a live record already held an outcome for the key
  refused = 2    // factory declined; nothing was cached
};

struct dedup_lookup_t final {
  dedup_status_t status{dedup_status_t::refused};
  std::optional<clearhouse::schema::admission_outcome_t> outcome;
};

/// Sharded, mutex-protected map from idempotency fingerprint to the first
/// admission outcome.
class dedup_store final {
 public:
  using factory_t =
      std::function<std::optional<clearhouse::schema::admission_outcome_t>()>;

  explicit dedup_store(
      clearhouse::schema::duration_milliseconds_t retention = 86'400'000,
      size_t shard_count = 16);

  /// Atomically return the live record for `fingerprint`, or run `factory`
  /// and cache what it returns.
  ///
  /// `factory` runs while the key's shard is locked, so exactly one caller
  /// per key observes `inserted`. Expired records are treated as absent.
  dedup_lookup_t check_and_set(const std::string& fingerprint,
                               clearhouse::schema::timestamp_milliseconds_t now,
                               const factory_t& factory);

  std::optional<clearhouse::schema::dedup_record_t> find(
      const std::string& fingerprint,
      clearhouse::schema::timestamp_milliseconds_t now) const;

  /// Drop records past their retention horizon; returns how many went.
  size_t purge_expired(clearhouse::schema::timestamp_milliseconds_t now);

  size_t size() const;

  clearhouse::schema::duration_milliseconds_t retention() const {
    return retention_;
  }

 private:
  struct shard final {
    mutable std::mutex mutex;
    std::unordered_map<std::string, clearhouse::schema::dedup_record_t>
        records;
  };

  shard& shard_for(const std::string& fingerprint) const;

  clearhouse::schema::duration_milliseconds_t retention_{};
  std::vector<std::unique_ptr<shard>> shards_;
};

}  // namespace clearhouse::intake
