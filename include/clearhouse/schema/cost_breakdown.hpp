#pragma once

#include <clearhouse/schema/primitives.hpp>

#include <cstdint>

// Schema type: cost breakdown.
// Priced components of one batch, in major units of the batch's source
// currency. total = fx_spread + wire - consolidation_discount.
namespace clearhouse::schema {

struct cost_breakdown_t final {
  cost_t fx_spread{};
  cost_t wire{};
  cost_t consolidation_discount{};
  cost_t total{};
  uint32_t wire_count{};
  uint32_t consolidated_wire_count{};

  bool operator==(const cost_breakdown_t&) const = default;

  cost_breakdown_t& operator+=(const cost_breakdown_t& other) {
    fx_spread += other.fx_spread;
    wire += other.wire;
    consolidation_discount += other.consolidation_discount;
    total += other.total;
    wire_count += other.wire_count;
    consolidated_wire_count += other.consolidated_wire_count;
    return *this;
  }
};

}  // namespace clearhouse::schema
