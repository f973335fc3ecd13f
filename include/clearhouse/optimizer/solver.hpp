#pragma once

#include <clearhouse/optimizer/cost_model.hpp>
#include <clearhouse/schema/batch.hpp>
#include <clearhouse/schema/chunk.hpp>
#include <clearhouse/schema/enum_string.hpp>

#include <chrono>
#include <cstdint>
#include <stop_token>
#include <string>
#include <variant>
#include <vector>

namespace clearhouse::optimizer {

enum class solver_failure_reason : uint8_t {
  timeout = 0,
  cancelled = 1,
  internal = 2
};

inline constexpr auto kSolverFailureReasonMappings =
    clearhouse::schema::enum_mappings_t<solver_failure_reason, 3>{
        std::pair{std::string_view{"timeout"}, solver_failure_reason::timeout},
        std::pair{std::string_view{"cancelled"},
                  solver_failure_reason::cancelled},
        std::pair{std::string_view{"internal"},
                  solver_failure_reason::internal}};

inline constexpr std::string_view to_string(const solver_failure_reason value) {
  return clearhouse::schema::to_string(value, kSolverFailureReasonMappings)
      .value_or("unknown");
}

struct solver_failure final {
  solver_failure_reason reason{solver_failure_reason::internal};
  std::string detail;
};

using solve_result_t =
    std::variant<std::vector<clearhouse::schema::batch_t>, solver_failure>;

/// Exact cost-minimizing batch assignment for one chunk.
///
/// Each counterparty's members are packed into wires by branch and bound
/// (exposure cap and batch size bound a wire), minimizing
/// wires - discount * consolidated wires. Wires are then packed into batches
/// first-fit-decreasing with at most one wire per counterparty per batch.
/// FX spread cost does not depend on the partition, so the result is
/// cost-minimal overall.
class solver final {
 public:
  explicit solver(pricing_t pricing, limits_t limits);

  /// Solve `chunk` within `budget`. Partial work is discarded on timeout or
  /// when `stop` is requested.
  solve_result_t solve(const clearhouse::schema::chunk_t& chunk,
                       std::chrono::milliseconds budget,
                       std::stop_token stop = {}) const;

  const pricing_t& pricing() const { return pricing_; }
  const limits_t& limits() const { return limits_; }

 private:
  pricing_t pricing_;
  limits_t limits_;
};

}  // namespace clearhouse::optimizer
