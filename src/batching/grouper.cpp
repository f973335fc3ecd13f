#include <clearhouse/batching/grouper.hpp>

#include <spdlog/spdlog.h>

#include <iterator>
#include <mutex>

using namespace clearhouse::schema;

namespace clearhouse::batching {

lane_key_t lane_key_of(const transaction_intent_t& intent) {
  return lane_key_t{.window = intent.window, .currencies = intent.currencies};
}

grouper::grouper(const size_t max_pending) : max_pending_{max_pending} {}

bool grouper::try_reserve() {
  auto current = pending_.load();
  do {
    if (current >= max_pending_) {
      spdlog::warn("pending intent bound {} reached", max_pending_);
      return false;
    }
  } while (!pending_.compare_exchange_weak(current, current + 1));
  return true;
}

void grouper::route(const transaction_intent_t& intent) {
  lane_for(lane_key_of(intent))->push(intent);
}

bool grouper::try_route(const transaction_intent_t& intent) {
  if (!try_reserve()) {
    return false;
  }
  route(intent);
  return true;
}

std::shared_ptr<lane> grouper::lane_for(const lane_key_t& key) {
  {
    auto lock = std::shared_lock{mutex_};
    auto it = lanes_.find(key);
    if (it != std::end(lanes_)) {
      return it->second;
    }
  }
  auto lock = std::unique_lock{mutex_};
  auto [it, inserted] = lanes_.try_emplace(key, nullptr);
  if (inserted) {
    it->second = std::make_shared<lane>(key);
    spdlog::info("opened lane {}", to_string(key));
  }
  return it->second;
}

std::vector<std::shared_ptr<lane>> grouper::lanes() const {
  auto lock = std::shared_lock{mutex_};
  auto result = std::vector<std::shared_ptr<lane>>{};
  result.reserve(lanes_.size());
  for (const auto& [key, l] : lanes_) {
    result.push_back(l);
  }
  return result;
}

std::shared_ptr<lane> grouper::find(const lane_key_t& key) const {
  auto lock = std::shared_lock{mutex_};
  auto it = lanes_.find(key);
  if (it == std::end(lanes_)) {
    return nullptr;
  }
  return it->second;
}

void grouper::release(const size_t count) { pending_.fetch_sub(count); }

void grouper::restore(const size_t count) { pending_.fetch_add(count); }

}  // namespace clearhouse::batching
