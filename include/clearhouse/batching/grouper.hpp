#pragma once

#include <clearhouse/batching/lane.hpp>
#include <clearhouse/schema/lane_key.hpp>
#include <clearhouse/schema/transaction_intent.hpp>

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <shared_mutex>
#include <vector>

namespace clearhouse::batching {

/// Routes admitted intents into per-(window, currency pair) lanes and keeps
/// the count of queued-but-unchunked intents under `max_pending`.
class grouper final {
 public:
  explicit grouper(size_t max_pending);

  /// Append the intent to its lane. Returns false, leaving every lane
  /// untouched, when the pending bound is already reached.
  bool try_route(const clearhouse::schema::transaction_intent_t& intent);

  /// Claim one pending slot; false when the bound is reached.
  bool try_reserve();

  /// Append an intent whose slot was claimed with `try_reserve`.
  void route(const clearhouse::schema::transaction_intent_t& intent);

  /// Lanes in key order.
  std::vector<std::shared_ptr<lane>> lanes() const;

  std::shared_ptr<lane> find(const clearhouse::schema::lane_key_t& key) const;

  /// Account for intents leaving (chunked) or re-entering (requeued) lanes.
  void release(size_t count);
  void restore(size_t count);

  size_t pending() const { return pending_.load(); }
  size_t max_pending() const { return max_pending_; }

 private:
  std::shared_ptr<lane> lane_for(const clearhouse::schema::lane_key_t& key);

  size_t max_pending_{};
  std::atomic<size_t> pending_{0};
  mutable std::shared_mutex mutex_;
  std::map<clearhouse::schema::lane_key_t, std::shared_ptr<lane>> lanes_;
};

/// Lane key of an intent.
clearhouse::schema::lane_key_t lane_key_of(
    const clearhouse::schema::transaction_intent_t& intent);

}  // namespace clearhouse::batching
