#include <clearhouse/common/critical.hpp>
#include <clearhouse/execution/engine.hpp>
#include <clearhouse/netting/calculator.hpp>
#include <clearhouse/optimizer/fallback_assigner.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <iterator>
#include <map>
#include <string>
#include <thread>
#include <string_view>
#include <unordered_set>
#include <utility>

using namespace clearhouse::schema;

namespace clearhouse::execution {

namespace {

/// Releases a lane claimed with `try_begin`.
struct lane_claim final {
  clearhouse::batching::lane& l;
  ~lane_claim() { l.end(); }
};

std::vector<event_attribute_t> batch_attributes(const batch_t& batch) {
  return {{"window", std::string{to_string(batch.window)}},
          {"currency_pair", to_string(batch.currencies)},
          {"chunk_sequence", std::to_string(batch.chunk_sequence)},
          {"member_count", std::to_string(batch.members.size())},
          {"status", std::string{to_string(batch.status)}}};
}

std::unordered_set<std::string_view> member_set(const batch_t& batch) {
  return {std::begin(batch.members), std::end(batch.members)};
}

bool is_settled(const transaction_state_t state) {
  return state == transaction_state_t::batched ||
         state == transaction_state_t::failed;
}

ledger_event_type_t status_event(const batch_status_t status) {
  switch (status) {
    case batch_status_t::optimal:
      return ledger_event_type_t::batch_optimized;
    case batch_status_t::fallback:
      return ledger_event_type_t::batch_fallback;
    case batch_status_t::infeasible:
      return ledger_event_type_t::batch_infeasible;
  }
  clearhouse::common::critical("unknown batch status {}",
                               static_cast<int>(status));
}

}  // namespace

engine::engine(engine_options_t options,
               clearhouse::optimizer::pricing_t pricing,
               clearhouse::optimizer::limits_t limits,
               clearhouse::intake::dedup_store& dedup,
               clearhouse::ledger::emitter& emitter,
               clearhouse::ledger::batch_store& batches,
               clearhouse::agreement::agreement_service* agreement)
    : options_{std::move(options)},
      dedup_{dedup},
      emitter_{emitter},
      batches_{batches},
      agreement_{agreement},
      grouper_{options_.max_pending_intents},
      chunker_{grouper_, options_.chunking},
      gate_{dedup_, grouper_, emitter_},
      solver_{std::move(pricing), std::move(limits)} {}

admission_result_t engine::submit(const submission_t& submission,
                                  const timestamp_milliseconds_t now) {
  auto result = gate_.admit(submission, now);
  if (auto* accepted = std::get_if<accepted_t>(&result)) {
    auto lock = std::scoped_lock{status_mutex_};
    // A tick may already have batched the intent; keep the later state.
    statuses_.try_emplace(
        accepted->intent.transaction_id,
        transaction_status_t{.transaction_id = accepted->intent.transaction_id,
                             .state = transaction_state_t::submitted,
                             .updated_at = now});
  }
  return result;
}

size_t engine::tick(const timestamp_milliseconds_t now) {
  gate_.purge_expired(now);
  evict_settled(now);
  emitter_.flush_pending();
  return run(chunker_.due_lanes(now), now, false);
}

size_t engine::flush(const timestamp_milliseconds_t now) {
  emitter_.flush_pending();
  return run(grouper_.lanes(), now, true);
}

size_t engine::run(std::vector<std::shared_ptr<clearhouse::batching::lane>> lanes,
                   const timestamp_milliseconds_t now,
                   const bool force) {
  if (lanes.empty()) {
    return 0;
  }
  auto chunks = std::atomic<size_t>{0};
  auto next = std::atomic<size_t>{0};
  auto worker_count = std::clamp<size_t>(options_.workers, 1, lanes.size());
  {
    auto workers = std::vector<std::jthread>{};
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
      workers.emplace_back([&] {
        for (auto index = next++; index < lanes.size(); index = next++) {
          chunks += process_lane(*lanes[index], now, force);
        }
      });
    }
  }
  return chunks.load();
}

size_t engine::process_lane(clearhouse::batching::lane& l,
                            const timestamp_milliseconds_t now,
                            const bool force) {
  if (!l.try_begin()) {
    spdlog::debug("lane {} is busy, skipping", to_string(l.key()));
    return 0;
  }
  auto claim = lane_claim{l};

  auto deferred = std::vector<transaction_intent_t>{};
  auto processed = size_t{0};
  while (auto chunk = chunker_.form(l, now, force)) {
    process_chunk(*chunk, now, deferred);
    ++processed;
  }
  chunker_.requeue(l, std::move(deferred));
  return processed;
}

void engine::process_chunk(const chunk_t& chunk,
                           const timestamp_milliseconds_t now,
                           std::vector<transaction_intent_t>& deferred) {
  auto solved = solver_.solve(chunk, options_.solver_budget,
                              stop_source_.get_token());
  auto failure = std::optional<clearhouse::optimizer::solver_failure>{};
  auto batches = std::vector<batch_t>{};
  if (auto* result = std::get_if<std::vector<batch_t>>(&solved)) {
    batches = std::move(*result);
  } else {
    failure = std::get<clearhouse::optimizer::solver_failure>(solved);
    spdlog::warn("solver failed on chunk {}#{} ({}: {}), falling back",
                 to_string(chunk.lane), chunk.sequence,
                 to_string(failure->reason), failure->detail);
    batches = clearhouse::optimizer::assign_fallback(chunk, solver_.pricing(),
                                                     solver_.limits());
  }

  for (auto& batch : batches) {
    auto batch_id = batch.batch_id;
    finalize(std::move(batch), chunk, failure, now, deferred);
    emitter_.retire(entity_kind_t::batch, batch_id);
  }
}

void engine::finalize(
    batch_t batch,
    const chunk_t& chunk,
    const std::optional<clearhouse::optimizer::solver_failure>& failure,
    const timestamp_milliseconds_t now,
    std::vector<transaction_intent_t>& deferred) {
  spdlog::info("created batch {} ({}) with {} members", batch.batch_id,
               to_string(batch.status), batch.members.size());
  emitter_.emit(ledger_event_type_t::batch_created, entity_kind_t::batch,
                batch.batch_id, now, batch_attributes(batch));

  auto details = std::vector<event_attribute_t>{
      {"total_cost", to_string(batch.cost.total)},
      {"wire_count", std::to_string(batch.cost.wire_count)}};
  if (batch.status == batch_status_t::fallback && failure) {
    details.push_back({"solver_failure", std::string{to_string(failure->reason)}});
  }
  if (batch.status == batch_status_t::infeasible) {
    details = {{"reason", batch.infeasible_reason}};
  }
  emitter_.emit(status_event(batch.status), entity_kind_t::batch,
                batch.batch_id, now, std::move(details));

  if (batch.status == batch_status_t::infeasible) {
    spdlog::warn("batch {} is infeasible ({}), deferring {} members",
                 batch.batch_id, batch.infeasible_reason, batch.members.size());
    batches_.put_once(batch);
    defer(batch, chunk, now, deferred);
    return;
  }

  auto intents = std::vector<transaction_intent_t>{};
  intents.reserve(batch.members.size());
  auto members = member_set(batch);
  for (const auto& intent : chunk.members) {
    if (members.contains(intent.transaction_id)) {
      intents.push_back(intent);
    }
  }
  auto netted = clearhouse::netting::net(batch, intents);
  if (auto* error = std::get_if<clearhouse::netting::netting_failure>(&netted)) {
    clearhouse::common::critical("netting batch {} failed: {}", batch.batch_id,
                                 error->detail);
  }
  batch.netting = std::move(std::get<netting_result_t>(netted));
  emitter_.emit(
      ledger_event_type_t::batch_netted, entity_kind_t::batch, batch.batch_id,
      now,
      {{"position_count", std::to_string(batch.netting->positions.size())},
       {"transfer_count", std::to_string(batch.netting->transfers.size())}});

  if (agreement_ != nullptr) {
    auto outcome = agreement_->propose(batch);
    if (outcome == clearhouse::agreement::agreement_outcome_t::aborted) {
      spdlog::warn("agreement aborted batch {}, deferring its members",
                   batch.batch_id);
      defer(batch, chunk, now, deferred);
      return;
    }
  }

  if (!batches_.put_once(batch)) {
    spdlog::warn("batch {} was already stored", batch.batch_id);
  }
  mark_batched(batch, now);
}

void engine::defer(const batch_t& batch,
                   const chunk_t& chunk,
                   const timestamp_milliseconds_t now,
                   std::vector<transaction_intent_t>& deferred) {
  auto members = member_set(batch);
  auto lock = std::scoped_lock{status_mutex_};
  for (const auto& intent : chunk.members) {
    if (!members.contains(intent.transaction_id)) {
      continue;
    }
    auto& status = statuses_[intent.transaction_id];
    status.transaction_id = intent.transaction_id;
    status.batch_id = batch.batch_id;
    status.updated_at = now;
    ++status.deferrals;
    if (status.deferrals > options_.max_deferrals) {
      status.state = transaction_state_t::failed;
      spdlog::error("transaction {} failed after {} deferrals",
                    intent.transaction_id, options_.max_deferrals);
      continue;
    }
    status.state = transaction_state_t::deferred;
    deferred.push_back(intent);
  }
}

void engine::mark_batched(const batch_t& batch,
                          const timestamp_milliseconds_t now) {
  auto lock = std::scoped_lock{status_mutex_};
  for (const auto& member : batch.members) {
    auto& status = statuses_[member];
    status.transaction_id = member;
    status.state = transaction_state_t::batched;
    status.batch_id = batch.batch_id;
    status.updated_at = now;
  }
}

size_t engine::evict_settled(const timestamp_milliseconds_t now) {
  auto horizon = dedup_.retention();
  auto evicted = std::vector<transaction_id_t>{};
  {
    auto lock = std::scoped_lock{status_mutex_};
    for (auto it = std::begin(statuses_); it != std::end(statuses_);) {
      if (is_settled(it->second.state) &&
          it->second.updated_at + horizon <= now) {
        evicted.push_back(it->first);
        it = statuses_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (const auto& transaction_id : evicted) {
    emitter_.retire(entity_kind_t::transaction, transaction_id);
  }
  if (!evicted.empty()) {
    spdlog::debug("evicted {} settled transaction statuses", evicted.size());
  }
  return evicted.size();
}

std::optional<batch_t> engine::batch(const batch_id_t& batch_id) const {
  return batches_.get(batch_id);
}

std::optional<transaction_status_t> engine::transaction_status(
    const transaction_id_t& transaction_id) const {
  auto lock = std::scoped_lock{status_mutex_};
  auto it = statuses_.find(transaction_id);
  if (it == std::end(statuses_)) {
    return std::nullopt;
  }
  return it->second;
}

void engine::cancel() {
  spdlog::warn("cancelling solver work");
  stop_source_.request_stop();
}

size_t engine::pending() const { return grouper_.pending(); }

}  // namespace clearhouse::execution
