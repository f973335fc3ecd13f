#pragma once

#include <clearhouse/agreement/agreement_service.hpp>
#include <clearhouse/batching/chunker.hpp>
#include <clearhouse/batching/grouper.hpp>
#include <clearhouse/intake/dedup_store.hpp>
#include <clearhouse/intake/idempotency_gate.hpp>
#include <clearhouse/ledger/batch_store.hpp>
#include <clearhouse/ledger/emitter.hpp>
#include <clearhouse/optimizer/cost_model.hpp>
#include <clearhouse/optimizer/solver.hpp>
#include <clearhouse/schema/admission_result.hpp>
#include <clearhouse/schema/batch.hpp>
#include <clearhouse/schema/chunk.hpp>
#include <clearhouse/schema/submission.hpp>
#include <clearhouse/schema/transaction_status.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <unordered_map>
#include <vector>

namespace clearhouse::execution {

struct engine_options_t final {
  clearhouse::batching::chunking_policy_t chunking;
  std::chrono::milliseconds solver_budget{100};
  /// Infeasible or aborted cycles a transaction may sit out before it is
  /// marked failed.
  uint32_t max_deferrals{3};
  size_t workers{4};
  size_t max_pending_intents{100'000};
};

/// Settlement batching pipeline: gate, lanes, chunking, solving with
/// fallback, netting, events and batch persistence.
///
/// Handles to the dedup store, emitter, batch store and optional agreement
/// service are owned by the caller and must outlive the engine.
class engine final {
 public:
  engine(engine_options_t options,
         clearhouse::optimizer::pricing_t pricing,
         clearhouse::optimizer::limits_t limits,
         clearhouse::intake::dedup_store& dedup,
         clearhouse::ledger::emitter& emitter,
         clearhouse::ledger::batch_store& batches,
         clearhouse::agreement::agreement_service* agreement = nullptr);

  /// Admit one submission (see idempotency_gate::admit).
  clearhouse::schema::admission_result_t submit(
      const clearhouse::schema::submission_t& submission,
      clearhouse::schema::timestamp_milliseconds_t now);

  /// Process every lane that is due at `now`, lanes in parallel on up to
  /// `workers` threads, after expiring idempotency state and settled
  /// statuses and retrying parked events. Returns the number of chunks
  /// processed.
  size_t tick(clearhouse::schema::timestamp_milliseconds_t now);

  /// Chunk and process everything queued regardless of the timeout. Members
  /// deferred by this pass stay queued.
  size_t flush(clearhouse::schema::timestamp_milliseconds_t now);

  std::optional<clearhouse::schema::batch_t> batch(
      const clearhouse::schema::batch_id_t& batch_id) const;

  std::optional<clearhouse::schema::transaction_status_t> transaction_status(
      const clearhouse::schema::transaction_id_t& transaction_id) const;

  /// Stop in-flight and future solves; chunks fall back to the greedy
  /// assignment from now on.
  void cancel();

  /// Queued-but-unchunked intents.
  size_t pending() const;

  const engine_options_t& options() const { return options_; }

 private:
  size_t run(std::vector<std::shared_ptr<clearhouse::batching::lane>> lanes,
             clearhouse::schema::timestamp_milliseconds_t now,
             bool force);

  /// Form and process chunks of one lane until it is no longer due. Members
  /// deferred during the pass return to the lane head once it ends.
  size_t process_lane(clearhouse::batching::lane& l,
                      clearhouse::schema::timestamp_milliseconds_t now,
                      bool force);

  void process_chunk(
      const clearhouse::schema::chunk_t& chunk,
      clearhouse::schema::timestamp_milliseconds_t now,
      std::vector<clearhouse::schema::transaction_intent_t>& deferred);

  void finalize(clearhouse::schema::batch_t batch,
                const clearhouse::schema::chunk_t& chunk,
                const std::optional<clearhouse::optimizer::solver_failure>&
                    failure,
                clearhouse::schema::timestamp_milliseconds_t now,
                std::vector<clearhouse::schema::transaction_intent_t>&
                    deferred);

  /// Record a deferral for each member; those still under the limit are
  /// appended to `deferred`, the rest are marked failed.
  void defer(const clearhouse::schema::batch_t& batch,
             const clearhouse::schema::chunk_t& chunk,
             clearhouse::schema::timestamp_milliseconds_t now,
             std::vector<clearhouse::schema::transaction_intent_t>& deferred);

  void mark_batched(const clearhouse::schema::batch_t& batch,
                    clearhouse::schema::timestamp_milliseconds_t now);

  /// Drop batched and failed statuses, with their event counters, once they
  /// are older than the dedup retention horizon.
  size_t evict_settled(clearhouse::schema::timestamp_milliseconds_t now);

  engine_options_t options_;
  clearhouse::intake::dedup_store& dedup_;
  clearhouse::ledger::emitter& emitter_;
  clearhouse::ledger::batch_store& batches_;
  clearhouse::agreement::agreement_service* agreement_{nullptr};
  clearhouse::batching::grouper grouper_;
  clearhouse::batching::chunker chunker_;
  clearhouse::intake::idempotency_gate gate_;
  clearhouse::optimizer::solver solver_;
  std::stop_source stop_source_;
  mutable std::mutex status_mutex_;
  std::unordered_map<clearhouse::schema::transaction_id_t,
                     clearhouse::schema::transaction_status_t>
      statuses_;
};

}  // namespace clearhouse::execution
