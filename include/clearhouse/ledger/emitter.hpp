#pragma once

#include <clearhouse/ledger/durable_log.hpp>
#include <clearhouse/schema/ledger_event.hpp>
#include <clearhouse/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace clearhouse::ledger {

struct retry_policy_t final {
  uint32_t max_attempts{5};
  std::chrono::milliseconds initial_backoff{10};
  std::chrono::milliseconds max_backoff{1000};
  /// Parked events at which the emitter reports itself saturated.
  size_t outbox_capacity{100'000};
};

/// Boundary through which domain events reach the durable log.
///
/// Assigns each event the next sequence number of its entity, starting at 1,
/// and queues it in the outbox. `emit` makes one delivery attempt when the
/// outbox was empty and nobody else is delivering; it never sleeps. Parked
/// events are retried with exponential backoff by `flush_pending`, and later
/// events queue behind them so the log order matches emission order.
class emitter final {
 public:
  using sleep_function_t = std::function<void(std::chrono::milliseconds)>;

  explicit emitter(durable_log& log,
                   retry_policy_t policy = {},
                   sleep_function_t sleep = {});

  /// Sequence and queue one event. Returns the event as recorded.
  clearhouse::schema::ledger_event_t emit(
      clearhouse::schema::ledger_event_type_t type,
      clearhouse::schema::entity_kind_t kind,
      const std::string& entity_id,
      clearhouse::schema::timestamp_milliseconds_t timestamp,
      std::vector<clearhouse::schema::event_attribute_t> attributes = {});

  /// Retry delivery of parked events in order, sleeping between attempts.
  /// Returns how many remain. Returns at once if another caller is already
  /// delivering.
  size_t flush_pending();

  /// Drop the sequence counter of an entity that will emit no more events.
  void retire(clearhouse::schema::entity_kind_t kind,
              const std::string& entity_id);

  size_t pending() const;

  /// True while the outbox holds `outbox_capacity` events or more.
  bool saturated() const;

  size_t tracked_entities() const;

 private:
  /// Deliver the outbox head-first until it is empty or an event keeps
  /// failing. Caller must have set `delivering_`.
  void drain(uint32_t attempts, bool sleep_between);
  bool deliver(const clearhouse::schema::ledger_event_t& event,
               uint32_t attempts,
               bool sleep_between);

  durable_log& log_;
  retry_policy_t policy_;
  sleep_function_t sleep_;
  mutable std::mutex mutex_;
  bool delivering_{false};
  bool overflow_reported_{false};
  std::map<std::pair<clearhouse::schema::entity_kind_t, std::string>, uint64_t>
      sequences_;
  std::deque<clearhouse::schema::ledger_event_t> outbox_;
};

}  // namespace clearhouse::ledger
