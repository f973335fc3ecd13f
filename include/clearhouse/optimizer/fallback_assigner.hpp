#pragma once

#include <clearhouse/optimizer/cost_model.hpp>
#include <clearhouse/schema/batch.hpp>
#include <clearhouse/schema/chunk.hpp>

#include <vector>

namespace clearhouse::optimizer {

/// Greedy, deterministic batch assignment used when the solver gives up.
///
/// Members are grouped by counterparty and currency pair (groups ordered by
/// first arrival) and poured into an open batch until adding the next member
/// would break the size cap or the counterparty's exposure cap. Identical
/// chunks always produce identical batches, ids included.
std::vector<clearhouse::schema::batch_t> assign_fallback(
    const clearhouse::schema::chunk_t& chunk,
    const pricing_t& pricing,
    const limits_t& limits);

}  // namespace clearhouse::optimizer
