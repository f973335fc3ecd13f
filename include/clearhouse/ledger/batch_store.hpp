#pragma once

#include <clearhouse/schema/batch.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace clearhouse::ledger {

/// Write-once store of finalized batches.
class batch_store {
 public:
  virtual ~batch_store() = default;

  /// Store `batch` unless its id is already present. Returns false, leaving
  /// the stored batch untouched, for a second write of the same id.
  virtual bool put_once(const clearhouse::schema::batch_t& batch) = 0;

  virtual std::optional<clearhouse::schema::batch_t> get(
      const clearhouse::schema::batch_id_t& batch_id) const = 0;

  /// Every stored batch, ordered by id.
  virtual std::vector<clearhouse::schema::batch_t> list() const = 0;
};

class memory_batch_store final : public batch_store {
 public:
  bool put_once(const clearhouse::schema::batch_t& batch) override;
  std::optional<clearhouse::schema::batch_t> get(
      const clearhouse::schema::batch_id_t& batch_id) const override;
  std::vector<clearhouse::schema::batch_t> list() const override;

 private:
  mutable std::mutex mutex_;
  std::map<clearhouse::schema::batch_id_t, clearhouse::schema::batch_t>
      batches_;
};

}  // namespace clearhouse::ledger
