#pragma once

#include <clearhouse/execution/engine.hpp>
#include <clearhouse/intake/dedup_store.hpp>
#include <clearhouse/ledger/batch_store.hpp>
#include <clearhouse/ledger/emitter.hpp>
#include <clearhouse/ledger/memory_log.hpp>
#include <clearhouse/optimizer/cost_model.hpp>
#include <clearhouse/schema/ledger_event.hpp>

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

namespace clearhouse::testing {

/// Engine wired to in-memory log and batch store; backoff sleeps are
/// skipped.
class engine_fixture final {
 public:
  explicit engine_fixture(
      clearhouse::execution::engine_options_t options = {},
      clearhouse::optimizer::limits_t limits = {},
      clearhouse::agreement::agreement_service* agreement = nullptr)
      : dedup_{},
        log_{},
        emitter_{log_, clearhouse::ledger::retry_policy_t{},
                 [](std::chrono::milliseconds) {}},
        batches_{},
        engine_{options,  clearhouse::optimizer::default_pricing(),
                limits,   dedup_,
                emitter_, batches_,
                agreement} {}

  engine_fixture(const engine_fixture&) = delete;
  engine_fixture& operator=(const engine_fixture&) = delete;
  engine_fixture(engine_fixture&&) = delete;
  engine_fixture& operator=(engine_fixture&&) = delete;

  clearhouse::execution::engine& engine() { return engine_; }
  clearhouse::ledger::memory_log& log() { return log_; }
  clearhouse::ledger::emitter& emitter() { return emitter_; }
  clearhouse::ledger::memory_batch_store& batches() { return batches_; }
  clearhouse::intake::dedup_store& dedup() { return dedup_; }

  std::vector<clearhouse::schema::ledger_event_t> events(
      const clearhouse::schema::ledger_event_type_t type) const {
    auto out = std::vector<clearhouse::schema::ledger_event_t>{};
    for (const auto& logged : log_.replay(0)) {
      if (logged.event.type == type) {
        out.push_back(logged.event);
      }
    }
    return out;
  }

 private:
  clearhouse::intake::dedup_store dedup_;
  clearhouse::ledger::memory_log log_;
  clearhouse::ledger::emitter emitter_;
  clearhouse::ledger::memory_batch_store batches_;
  clearhouse::execution::engine engine_;
};

}  // namespace clearhouse::testing
