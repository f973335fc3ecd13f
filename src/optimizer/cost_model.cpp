#include <clearhouse/common/critical.hpp>
#include <clearhouse/crypto/digest.hpp>
#include <clearhouse/optimizer/cost_model.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

using namespace clearhouse::schema;

namespace clearhouse::optimizer {

namespace {

void append_reason(std::string& reasons, const std::string_view reason) {
  if (reasons.find(reason) != std::string::npos) {
    return;
  }
  if (!reasons.empty()) {
    reasons += ',';
  }
  reasons += reason;
}

}  // namespace

pricing_t default_pricing() {
  auto pricing = pricing_t{};
  auto add = [&](const char* source, const char* destination,
                 const char* bps) {
    pricing.fx_spreads[currency_pair_t{source, destination}] = cost_t{bps};
    pricing.fx_spreads[currency_pair_t{destination, source}] = cost_t{bps};
  };
  add("USD", "EUR", "2.5");
  add("USD", "GBP", "3.0");
  add("USD", "JPY", "2.0");
  add("EUR", "GBP", "2.0");
  return pricing;
}

cost_t spread_bps(const pricing_t& pricing, const currency_pair_t& pair) {
  auto it = pricing.fx_spreads.find(pair);
  if (it == std::end(pricing.fx_spreads)) {
    return pricing.default_spread_bps;
  }
  return it->second;
}

std::optional<cost_t> exposure_cap(const limits_t& limits,
                                   const counterparty_id_t& counterparty) {
  auto it = limits.exposure_caps.find(counterparty);
  if (it == std::end(limits.exposure_caps)) {
    return limits.default_exposure_cap;
  }
  return it->second;
}

std::optional<amount_t> liquidity_cap(const limits_t& limits,
                                      const settlement_window_t window,
                                      const std::string& currency) {
  auto it = limits.liquidity_caps.find(std::pair{window, currency});
  if (it == std::end(limits.liquidity_caps)) {
    return std::nullopt;
  }
  return it->second;
}

cost_t major_amount(const transaction_intent_t& intent) {
  auto currency = find_currency(intent.currencies.source);
  if (!currency) {
    clearhouse::common::critical("transaction {} carries unsupported currency {}",
                                 intent.transaction_id,
                                 intent.currencies.source);
  }
  return to_major_units(intent.amount, *currency);
}

feasibility_split_t split_feasible(const chunk_t& chunk,
                                   const limits_t& limits) {
  auto split = feasibility_split_t{};
  auto cap = liquidity_cap(limits, chunk.lane.window,
                           chunk.lane.currencies.source);
  auto admitted = amount_t{};
  for (size_t i = 0; i < chunk.members.size(); ++i) {
    const auto& intent = chunk.members[i];
    auto counterparty_cap = exposure_cap(limits, intent.counterparty_id);
    if (counterparty_cap && major_amount(intent) > *counterparty_cap) {
      split.infeasible.push_back(i);
      append_reason(split.reason, kExposureCapExceeded);
      continue;
    }
    if (cap && intent.amount > *cap - admitted) {
      split.infeasible.push_back(i);
      append_reason(split.reason, kLiquidityCapExceeded);
      continue;
    }
    admitted += intent.amount;
    split.feasible.push_back(i);
  }
  return split;
}

cost_breakdown_t price(const chunk_t& chunk,
                       const std::span<const size_t> members,
                       const pricing_t& pricing) {
  auto cost = cost_breakdown_t{};
  auto bps = spread_bps(pricing, chunk.lane.currencies);
  auto per_counterparty = std::map<counterparty_id_t, uint32_t>{};
  for (const auto index : members) {
    const auto& intent = chunk.members[index];
    cost.fx_spread += major_amount(intent) * bps / cost_t{10000};
    ++per_counterparty[intent.counterparty_id];
  }
  for (const auto& [counterparty, count] : per_counterparty) {
    ++cost.wire_count;
    if (count >= 2) {
      ++cost.consolidated_wire_count;
    }
  }
  cost.wire = pricing.wire_cost * cost.wire_count;
  cost.consolidation_discount = pricing.consolidation_discount *
                                pricing.wire_cost *
                                cost.consolidated_wire_count;
  cost.total = cost.fx_spread + cost.wire - cost.consolidation_discount;
  return cost;
}

batch_id_t make_batch_id(const lane_key_t& lane,
                         const uint64_t chunk_sequence,
                         const batch_status_t status,
                         const std::span<const transaction_id_t> members) {
  auto lane_text = to_string(lane);
  auto sequence_text = std::to_string(chunk_sequence);
  auto parts = std::vector<std::string_view>{};
  parts.reserve(members.size() + 3);
  parts.push_back(lane_text);
  parts.push_back(sequence_text);
  parts.push_back(to_string(status));
  for (const auto& member : members) {
    parts.push_back(member);
  }
  auto digest = clearhouse::crypto::sha256_parts(parts);
  // 16 bytes is plenty to keep ids unique while staying readable.
  return "batch-" + to_hex(bytes_view_t{digest.data(), 16});
}

batch_t make_batch(const chunk_t& chunk,
                   std::vector<size_t> members,
                   const batch_status_t status,
                   const pricing_t& pricing,
                   std::string infeasible_reason) {
  std::ranges::sort(members);
  auto batch = batch_t{};
  batch.window = chunk.lane.window;
  batch.currencies = chunk.lane.currencies;
  batch.chunk_sequence = chunk.sequence;
  batch.status = status;
  batch.created_at = chunk.formed_at;
  batch.members.reserve(members.size());
  auto gross = amount_t{};
  for (const auto index : members) {
    batch.members.push_back(chunk.members[index].transaction_id);
    gross += chunk.members[index].amount;
  }
  batch.subtotals.push_back(currency_subtotal_t{
      .currency = chunk.lane.currencies.source, .gross = gross});
  if (status == batch_status_t::infeasible) {
    batch.infeasible_reason = std::move(infeasible_reason);
  } else {
    batch.cost = price(chunk, members, pricing);
  }
  batch.batch_id =
      make_batch_id(chunk.lane, chunk.sequence, status, batch.members);
  return batch;
}

std::vector<batch_t> assemble(const chunk_t& chunk,
                              std::vector<std::vector<size_t>> groups,
                              const batch_status_t status,
                              const feasibility_split_t& split,
                              const pricing_t& pricing) {
  std::erase_if(groups, [](const auto& group) { return group.empty(); });
  for (auto& group : groups) {
    std::ranges::sort(group);
  }
  std::ranges::sort(groups, {}, [](const auto& group) { return group.front(); });

  auto batches = std::vector<batch_t>{};
  batches.reserve(groups.size() + 1);
  for (auto& group : groups) {
    batches.push_back(make_batch(chunk, std::move(group), status, pricing));
  }
  if (!split.infeasible.empty()) {
    batches.push_back(make_batch(chunk, split.infeasible,
                                 batch_status_t::infeasible, pricing,
                                 split.reason));
  }
  return batches;
}

cost_t total_cost(const std::span<const batch_t> batches) {
  auto total = cost_t{};
  for (const auto& batch : batches) {
    total += batch.cost.total;
  }
  return total;
}

}  // namespace clearhouse::optimizer
