#pragma once

#include <clearhouse/schema/batch_status.hpp>
#include <clearhouse/schema/cost_breakdown.hpp>
#include <clearhouse/schema/currency.hpp>
#include <clearhouse/schema/netting_result.hpp>
#include <clearhouse/schema/primitives.hpp>
#include <clearhouse/schema/settlement_window.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: batch.
// Output of solving or falling back on a chunk. Enriched once by netting and
// immutable afterwards.
namespace clearhouse::schema {

struct currency_subtotal_t final {
  std::string currency;
  amount_t gross{};

  bool operator==(const currency_subtotal_t&) const = default;
};

template <uint16_t Version>
struct batch;

template <>
struct batch<1> final {
  uint16_t version{1};
  batch_id_t batch_id;
  settlement_window_t window{settlement_window_t::rtgs};
  currency_pair_t currencies;
  uint64_t chunk_sequence{};
  std::vector<transaction_id_t> members;
  std::vector<currency_subtotal_t> subtotals;
  cost_breakdown_t cost;
  batch_status_t status{batch_status_t::optimal};
  /// Why the members could not be placed; empty unless INFEASIBLE.
  std::string infeasible_reason;
  std::optional<netting_result_t> netting;
  timestamp_milliseconds_t created_at{};

  bool operator==(const batch&) const = default;
};

using batch_t = batch<1>;

}  // namespace clearhouse::schema
