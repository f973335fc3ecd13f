#include <clearhouse/common/critical.hpp>
#include <clearhouse/ledger/rocksdb_log.hpp>
#include <clearhouse/schema/encoding/scale/ledger_event.hpp>

#include <spdlog/spdlog.h>

#include <string>

using namespace clearhouse::schema;

namespace clearhouse::ledger {

rocksdb_log::rocksdb_log(
    clearhouse::storage::storage<clearhouse::storage::rocksdb_storage_tag>&
        storage)
    : storage_{storage} {
  auto last = storage_.last_record_offset(kLogPrefix);
  next_offset_ = last ? *last + 1 : 0;
  spdlog::info("durable log resumes at offset {}", next_offset_);
}

uint64_t rocksdb_log::append(const ledger_event_t& event) {
  auto lock = std::scoped_lock{mutex_};
  auto encoded = encoding::scale::encode(encoder_, event);
  auto offset = next_offset_;
  if (auto error = storage_.try_put_record(
          kLogPrefix, offset, bytes_view_t{encoded.data(), encoded.size()})) {
    throw downstream_unavailable{"append at offset " + std::to_string(offset) +
                                 " failed: " + *error};
  }
  ++next_offset_;
  return offset;
}

std::vector<logged_event_t> rocksdb_log::replay(
    const uint64_t from_offset) const {
  auto lock = std::scoped_lock{mutex_};
  auto result = std::vector<logged_event_t>{};
  for (const auto& record : storage_.list_records(kLogPrefix, from_offset)) {
    auto event = encoding::scale::decode_ledger_event(
        encoder_, bytes_view_t{record.value.data(), record.value.size()});
    if (!event) {
      clearhouse::common::critical("corrupt ledger event at offset {}",
                                   record.offset);
    }
    result.push_back(
        logged_event_t{.offset = record.offset, .event = std::move(*event)});
  }
  return result;
}

}  // namespace clearhouse::ledger
