#pragma once

#include <clearhouse/schema/batch.hpp>
#include <clearhouse/schema/chunk.hpp>
#include <clearhouse/schema/cost_breakdown.hpp>
#include <clearhouse/schema/currency.hpp>
#include <clearhouse/schema/primitives.hpp>
#include <clearhouse/schema/settlement_window.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace clearhouse::optimizer {

/// Prices applied to every batch.
struct pricing_t final {
  /// Flat charge per wire, in major units of the source currency.
  clearhouse::schema::cost_t wire_cost{5};
  /// Fraction of `wire_cost` refunded for each wire carrying two or more
  /// transactions.
  clearhouse::schema::cost_t consolidation_discount{"0.15"};
  /// Spread for pairs missing from `fx_spreads`, in basis points.
  clearhouse::schema::cost_t default_spread_bps{5};
  std::map<clearhouse::schema::currency_pair_t, clearhouse::schema::cost_t>
      fx_spreads;
};

/// Constraints a batch assignment must respect.
struct limits_t final {
  uint32_t max_batch_size{1000};
  /// (window, source currency) -> cap on admitted notional per chunk, minor
  /// units. Missing entries are unlimited.
  std::map<std::pair<clearhouse::schema::settlement_window_t, std::string>,
           clearhouse::schema::amount_t>
      liquidity_caps;
  /// Counterparty -> cap on its notional inside one batch, major units.
  std::map<clearhouse::schema::counterparty_id_t, clearhouse::schema::cost_t>
      exposure_caps;
  std::optional<clearhouse::schema::cost_t> default_exposure_cap;
};

/// Pricing with the standard corridor table (USD/EUR 2.5, USD/GBP 3.0,
/// USD/JPY 2.0, EUR/GBP 2.0 bps, both directions).
pricing_t default_pricing();

clearhouse::schema::cost_t spread_bps(
    const pricing_t& pricing,
    const clearhouse::schema::currency_pair_t& pair);

std::optional<clearhouse::schema::cost_t> exposure_cap(
    const limits_t& limits,
    const clearhouse::schema::counterparty_id_t& counterparty);

std::optional<clearhouse::schema::amount_t> liquidity_cap(
    const limits_t& limits,
    clearhouse::schema::settlement_window_t window,
    const std::string& currency);

/// Amount of an intent in major units of its source currency.
clearhouse::schema::cost_t major_amount(
    const clearhouse::schema::transaction_intent_t& intent);

inline constexpr auto kExposureCapExceeded =
    std::string_view{"exposure_cap_exceeded"};
inline constexpr auto kLiquidityCapExceeded =
    std::string_view{"liquidity_cap_exceeded"};

/// Members of a chunk split into those that may be batched this cycle and
/// those that may not. Indices refer to `chunk.members`, in arrival order.
struct feasibility_split_t final {
  std::vector<size_t> feasible;
  std::vector<size_t> infeasible;
  /// Comma separated reasons, empty when nothing is infeasible.
  std::string reason;
};

/// Admit members in arrival order against the counterparty exposure caps and
/// the window liquidity cap of the chunk's source currency.
///
/// A member above its counterparty's cap on its own, or one that would push
/// the admitted total past the liquidity cap, is infeasible; later members
/// are still considered.
feasibility_split_t split_feasible(const clearhouse::schema::chunk_t& chunk,
                                   const limits_t& limits);

/// Price a set of chunk members that settle together in one batch.
///
/// One wire is charged per counterparty present; wires carrying two or more
/// members earn the consolidation discount.
clearhouse::schema::cost_breakdown_t price(
    const clearhouse::schema::chunk_t& chunk,
    std::span<const size_t> members,
    const pricing_t& pricing);

/// Deterministic id from the lane, chunk sequence, status and member ids.
clearhouse::schema::batch_id_t make_batch_id(
    const clearhouse::schema::lane_key_t& lane,
    uint64_t chunk_sequence,
    clearhouse::schema::batch_status_t status,
    std::span<const clearhouse::schema::transaction_id_t> members);

/// Assemble a batch from chunk member indices.
///
/// Members are ordered by arrival; INFEASIBLE batches carry no cost.
clearhouse::schema::batch_t make_batch(
    const clearhouse::schema::chunk_t& chunk,
    std::vector<size_t> members,
    clearhouse::schema::batch_status_t status,
    const pricing_t& pricing,
    std::string infeasible_reason = {});

/// Order batches by earliest member and append the INFEASIBLE batch, if any.
std::vector<clearhouse::schema::batch_t> assemble(
    const clearhouse::schema::chunk_t& chunk,
    std::vector<std::vector<size_t>> groups,
    clearhouse::schema::batch_status_t status,
    const feasibility_split_t& split,
    const pricing_t& pricing);

/// Sum of `cost.total` over batches.
clearhouse::schema::cost_t total_cost(
    std::span<const clearhouse::schema::batch_t> batches);

}  // namespace clearhouse::optimizer
