#include <clearhouse/ledger/emitter.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

using namespace clearhouse::schema;

namespace clearhouse::ledger {

emitter::emitter(durable_log& log,
                 retry_policy_t policy,
                 sleep_function_t sleep)
    : log_{log}, policy_{policy}, sleep_{std::move(sleep)} {
  if (!sleep_) {
    sleep_ = [](const std::chrono::milliseconds duration) {
      std::this_thread::sleep_for(duration);
    };
  }
}

ledger_event_t emitter::emit(const ledger_event_type_t type,
                             const entity_kind_t kind,
                             const std::string& entity_id,
                             const timestamp_milliseconds_t timestamp,
                             std::vector<event_attribute_t> attributes) {
  auto event = ledger_event_t{};
  auto deliver_now = false;
  {
    auto lock = std::scoped_lock{mutex_};
    event.type = type;
    event.entity_kind = kind;
    event.entity_id = entity_id;
    event.sequence = ++sequences_[std::pair{kind, entity_id}];
    event.timestamp = timestamp;
    event.attributes = std::move(attributes);

    outbox_.push_back(event);
    if (outbox_.size() >= policy_.outbox_capacity && !overflow_reported_) {
      overflow_reported_ = true;
      spdlog::error("outbox holds {} undelivered events, capacity is {}",
                    outbox_.size(), policy_.outbox_capacity);
    }
    // A non-empty outbox means the log was already failing; leave retries to
    // flush_pending.
    if (!delivering_ && outbox_.size() == 1) {
      delivering_ = true;
      deliver_now = true;
    }
  }
  if (deliver_now) {
    drain(1, false);
  }
  return event;
}

size_t emitter::flush_pending() {
  {
    auto lock = std::scoped_lock{mutex_};
    if (delivering_ || outbox_.empty()) {
      return outbox_.size();
    }
    delivering_ = true;
  }
  drain(policy_.max_attempts, true);
  return pending();
}

void emitter::retire(const entity_kind_t kind, const std::string& entity_id) {
  auto lock = std::scoped_lock{mutex_};
  sequences_.erase(std::pair{kind, entity_id});
}

size_t emitter::pending() const {
  auto lock = std::scoped_lock{mutex_};
  return outbox_.size();
}

bool emitter::saturated() const {
  auto lock = std::scoped_lock{mutex_};
  return outbox_.size() >= policy_.outbox_capacity;
}

size_t emitter::tracked_entities() const {
  auto lock = std::scoped_lock{mutex_};
  return sequences_.size();
}

void emitter::drain(const uint32_t attempts, const bool sleep_between) {
  while (true) {
    auto head = ledger_event_t{};
    {
      auto lock = std::scoped_lock{mutex_};
      if (outbox_.empty()) {
        delivering_ = false;
        overflow_reported_ = false;
        return;
      }
      head = outbox_.front();
    }
    if (!deliver(head, attempts, sleep_between)) {
      auto lock = std::scoped_lock{mutex_};
      delivering_ = false;
      spdlog::error("parked {} events in the outbox, head is {} #{} for {}",
                    outbox_.size(), to_string(head.type), head.sequence,
                    head.entity_id);
      return;
    }
    auto lock = std::scoped_lock{mutex_};
    outbox_.pop_front();
  }
}

bool emitter::deliver(const ledger_event_t& event,
                      const uint32_t attempts,
                      const bool sleep_between) {
  auto backoff = policy_.initial_backoff;
  for (auto attempt = uint32_t{1}; attempt <= attempts; ++attempt) {
    try {
      auto offset = log_.append(event);
      spdlog::debug("appended {} #{} for {} at offset {}", to_string(event.type),
                    event.sequence, event.entity_id, offset);
      return true;
    } catch (const downstream_unavailable& e) {
      spdlog::warn("durable log unavailable (attempt {}/{}): {}", attempt,
                   attempts, e.what());
    }
    if (sleep_between && attempt < attempts) {
      sleep_(backoff);
      backoff = std::min(backoff * 2, policy_.max_backoff);
    }
  }
  return false;
}

}  // namespace clearhouse::ledger
