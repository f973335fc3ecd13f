#include <clearhouse/ledger/batch_store.hpp>

#include <iterator>

namespace clearhouse::ledger {

bool memory_batch_store::put_once(const clearhouse::schema::batch_t& batch) {
  auto lock = std::scoped_lock{mutex_};
  return batches_.try_emplace(batch.batch_id, batch).second;
}

std::optional<clearhouse::schema::batch_t> memory_batch_store::get(
    const clearhouse::schema::batch_id_t& batch_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = batches_.find(batch_id);
  if (it == std::end(batches_)) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<clearhouse::schema::batch_t> memory_batch_store::list() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = std::vector<clearhouse::schema::batch_t>{};
  result.reserve(batches_.size());
  for (const auto& [id, batch] : batches_) {
    result.push_back(batch);
  }
  return result;
}

}  // namespace clearhouse::ledger
