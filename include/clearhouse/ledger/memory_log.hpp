#pragma once

#include <clearhouse/ledger/durable_log.hpp>

#include <atomic>
#include <mutex>
#include <vector>

namespace clearhouse::ledger {

/// In-process durable log. `set_available(false)` makes appends fail with
/// downstream_unavailable until it is switched back on.
class memory_log final : public durable_log {
 public:
  uint64_t append(const clearhouse::schema::ledger_event_t& event) override;
  std::vector<logged_event_t> replay(uint64_t from_offset) const override;

  void set_available(bool available) { available_.store(available); }
  size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::vector<clearhouse::schema::ledger_event_t> events_;
  std::atomic<bool> available_{true};
};

}  // namespace clearhouse::ledger
