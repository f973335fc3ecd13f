#pragma once

#include <clearhouse/schema/chunk.hpp>
#include <clearhouse/schema/lane_key.hpp>
#include <clearhouse/schema/primitives.hpp>
#include <clearhouse/schema/transaction_intent.hpp>

#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace clearhouse::batching {

/// FIFO of intents sharing one (window, currency pair).
///
/// The mutex guards only queue pushes and pops. Chunk processing is
/// serialized separately through `try_begin`/`end`, so admissions never wait
/// on a solve.
class lane final {
 public:
  explicit lane(clearhouse::schema::lane_key_t key);

  const clearhouse::schema::lane_key_t& key() const { return key_; }

  /// Append an intent; its arrival time is its submission time.
  void push(clearhouse::schema::transaction_intent_t intent);

  /// Put intents back at the head of the queue, keeping their order.
  void requeue_front(
      std::vector<clearhouse::schema::transaction_intent_t> intents);

  /// Pop up to `max_size` intents in arrival order as the lane's next chunk.
  std::optional<clearhouse::schema::chunk_t> take(
      size_t max_size,
      clearhouse::schema::timestamp_milliseconds_t now);

  size_t size() const;
  std::optional<clearhouse::schema::timestamp_milliseconds_t> oldest_arrival()
      const;

  /// Claim the lane for chunk processing; false when another worker owns it.
  bool try_begin();
  void end();

 private:
  clearhouse::schema::lane_key_t key_;
  mutable std::mutex mutex_;
  std::deque<clearhouse::schema::transaction_intent_t> queue_;
  uint64_t next_sequence_{1};
  std::atomic<bool> busy_{false};
};

}  // namespace clearhouse::batching
