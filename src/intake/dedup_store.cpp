#include <clearhouse/intake/dedup_store.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

using namespace clearhouse::schema;

namespace clearhouse::intake {

dedup_store::dedup_store(const duration_milliseconds_t retention,
                         const size_t shard_count)
    : retention_{retention} {
  shards_.reserve(shard_count == 0 ? 1 : shard_count);
  for (size_t i = 0; i < std::max<size_t>(shard_count, 1); ++i) {
    shards_.push_back(std::make_unique<shard>());
  }
}

dedup_store::shard& dedup_store::shard_for(
    const std::string& fingerprint) const {
  auto index = std::hash<std::string>{}(fingerprint) % shards_.size();
  return *shards_[index];
}

dedup_lookup_t dedup_store::check_and_set(const std::string& fingerprint,
                                          const timestamp_milliseconds_t now,
                                          const factory_t& factory) {
  auto& s = shard_for(fingerprint);
  auto lock = std::scoped_lock{s.mutex};
  auto it = s.records.find(fingerprint);
  if (it != std::end(s.records)) {
    if (it->second.expires_at > now) {
      return dedup_lookup_t{.status = dedup_status_t::existing,
                            .outcome = it->second.outcome};
    }
    s.records.erase(it);
  }

  auto outcome = factory();
  if (!outcome) {
    return dedup_lookup_t{.status = dedup_status_t::refused};
  }
  s.records.emplace(fingerprint,
                    dedup_record_t{.fingerprint = fingerprint,
                                   .outcome = *outcome,
                                   .stored_at = now,
                                   .expires_at = now + retention_});
  return dedup_lookup_t{.status = dedup_status_t::inserted,
                        .outcome = std::move(outcome)};
}

std::optional<dedup_record_t> dedup_store::find(
    const std::string& fingerprint,
    const timestamp_milliseconds_t now) const {
  auto& s = shard_for(fingerprint);
  auto lock = std::scoped_lock{s.mutex};
  auto it = s.records.find(fingerprint);
  if (it == std::end(s.records) || it->second.expires_at <= now) {
    return std::nullopt;
  }
  return it->second;
}

size_t dedup_store::purge_expired(const timestamp_milliseconds_t now) {
  auto purged = size_t{};
  for (auto& s : shards_) {
    auto lock = std::scoped_lock{s->mutex};
    purged += std::erase_if(s->records, [&](const auto& entry) {
      return entry.second.expires_at <= now;
    });
  }
  if (purged > 0) {
    spdlog::debug("purged {} expired dedup records", purged);
  }
  return purged;
}

size_t dedup_store::size() const {
  auto count = size_t{};
  for (const auto& s : shards_) {
    auto lock = std::scoped_lock{s->mutex};
    count += s->records.size();
  }
  return count;
}

}  // namespace clearhouse::intake
