#include <clearhouse/batching/lane.hpp>

#include <algorithm>
#include <iterator>

using namespace clearhouse::schema;

namespace clearhouse::batching {

lane::lane(lane_key_t key) : key_{std::move(key)} {}

void lane::push(transaction_intent_t intent) {
  auto lock = std::scoped_lock{mutex_};
  queue_.push_back(std::move(intent));
}

void lane::requeue_front(std::vector<transaction_intent_t> intents) {
  auto lock = std::scoped_lock{mutex_};
  queue_.insert(std::begin(queue_), std::make_move_iterator(std::begin(intents)),
                std::make_move_iterator(std::end(intents)));
}

std::optional<chunk_t> lane::take(const size_t max_size,
                                  const timestamp_milliseconds_t now) {
  auto lock = std::scoped_lock{mutex_};
  if (queue_.empty() || max_size == 0) {
    return std::nullopt;
  }
  auto chunk = chunk_t{.lane = key_, .sequence = next_sequence_++,
                       .formed_at = now};
  auto count = std::min(max_size, queue_.size());
  chunk.members.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    chunk.members.push_back(std::move(queue_.front()));
    queue_.pop_front();
  }
  return chunk;
}

size_t lane::size() const {
  auto lock = std::scoped_lock{mutex_};
  return queue_.size();
}

std::optional<timestamp_milliseconds_t> lane::oldest_arrival() const {
  auto lock = std::scoped_lock{mutex_};
  if (queue_.empty()) {
    return std::nullopt;
  }
  return queue_.front().submitted_at;
}

bool lane::try_begin() {
  auto expected = false;
  return busy_.compare_exchange_strong(expected, true);
}

void lane::end() { busy_.store(false); }

}  // namespace clearhouse::batching
