#include <clearhouse/common/critical.hpp>
#include <clearhouse/ledger/rocksdb_batch_store.hpp>
#include <clearhouse/schema/encoding/scale/batch.hpp>

#include <spdlog/spdlog.h>

#include <string>

using namespace clearhouse::schema;

namespace clearhouse::ledger {

namespace {

std::string make_batch_key(const batch_id_t& batch_id) {
  return std::string{kBatchPrefix} + batch_id;
}

}  // namespace

rocksdb_batch_store::rocksdb_batch_store(
    clearhouse::storage::storage<clearhouse::storage::rocksdb_storage_tag>&
        storage)
    : storage_{storage} {}

bool rocksdb_batch_store::put_once(const batch_t& batch) {
  auto key = make_batch_key(batch.batch_id);
  auto lock = std::scoped_lock{mutex_};
  if (storage_.get_raw(make_bytes_view(key))) {
    spdlog::warn("batch {} already stored, keeping the first write",
                 batch.batch_id);
    return false;
  }
  auto encoded = encoding::scale::encode(encoder_, batch);
  storage_.put_raw(make_bytes_view(key),
                   bytes_view_t{encoded.data(), encoded.size()});
  return true;
}

std::optional<batch_t> rocksdb_batch_store::get(
    const batch_id_t& batch_id) const {
  auto key = make_batch_key(batch_id);
  auto lock = std::scoped_lock{mutex_};
  auto raw = storage_.get_raw(make_bytes_view(key));
  if (!raw) {
    return std::nullopt;
  }
  auto batch = encoding::scale::decode_batch(
      encoder_, bytes_view_t{raw->data(), raw->size()});
  if (!batch) {
    clearhouse::common::critical("corrupt batch record {}", batch_id);
  }
  return batch;
}

std::vector<batch_t> rocksdb_batch_store::list() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = std::vector<batch_t>{};
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes_view(kBatchPrefix))) {
    auto batch = encoding::scale::decode_batch(
        encoder_, bytes_view_t{value.data(), value.size()});
    if (!batch) {
      clearhouse::common::critical("corrupt batch record {}", make_string(key));
    }
    result.push_back(std::move(*batch));
  }
  return result;
}

}  // namespace clearhouse::ledger
