#pragma once

#include <clearhouse/schema/lane_key.hpp>
#include <clearhouse/schema/transaction_intent.hpp>

#include <cstdint>
#include <vector>

// Schema type: chunk.
// Ordered, bounded slice of one lane handed to the solver. Members keep
// their arrival order; `sequence` counts chunks formed by the lane.
namespace clearhouse::schema {

struct chunk_t final {
  lane_key_t lane;
  uint64_t sequence{};
  timestamp_milliseconds_t formed_at{};
  std::vector<transaction_intent_t> members;
};

}  // namespace clearhouse::schema
