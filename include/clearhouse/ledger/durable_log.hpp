#pragma once

#include <clearhouse/schema/ledger_event.hpp>

#include <cstdint>
#include <stdexcept>
#include <vector>

namespace clearhouse::ledger {

/// Raised by a log adapter when the downstream log cannot take an append
/// right now. The emitter retries and parks the event.
class downstream_unavailable final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct logged_event_t final {
  uint64_t offset{};
  clearhouse::schema::ledger_event_t event;
};

/// Append-only event log consumed by the rest of the platform.
class durable_log {
 public:
  virtual ~durable_log() = default;

  /// Persist `event` and return its offset. Offsets start at 0 and grow by
  /// one per append.
  virtual uint64_t append(const clearhouse::schema::ledger_event_t& event) = 0;

  /// Events with offset >= `from_offset`, in offset order.
  virtual std::vector<logged_event_t> replay(uint64_t from_offset) const = 0;
};

}  // namespace clearhouse::ledger
