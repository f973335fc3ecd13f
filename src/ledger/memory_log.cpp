#include <clearhouse/ledger/memory_log.hpp>

namespace clearhouse::ledger {

uint64_t memory_log::append(const clearhouse::schema::ledger_event_t& event) {
  if (!available_.load()) {
    throw downstream_unavailable{"memory log is unavailable"};
  }
  auto lock = std::scoped_lock{mutex_};
  events_.push_back(event);
  return events_.size() - 1;
}

std::vector<logged_event_t> memory_log::replay(
    const uint64_t from_offset) const {
  auto lock = std::scoped_lock{mutex_};
  auto result = std::vector<logged_event_t>{};
  for (auto offset = from_offset; offset < events_.size(); ++offset) {
    result.push_back(logged_event_t{.offset = offset, .event = events_[offset]});
  }
  return result;
}

size_t memory_log::size() const {
  auto lock = std::scoped_lock{mutex_};
  return events_.size();
}

}  // namespace clearhouse::ledger
