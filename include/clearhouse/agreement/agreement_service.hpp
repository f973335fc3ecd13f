#pragma once

#include <clearhouse/schema/batch.hpp>
#include <clearhouse/schema/enum_string.hpp>

#include <cstdint>
#include <string_view>

namespace clearhouse::agreement {

enum class agreement_outcome_t : uint8_t { committed = 0, aborted = 1 };

inline constexpr auto kAgreementOutcomeMappings =
    clearhouse::schema::enum_mappings_t<agreement_outcome_t, 2>{
        std::pair{std::string_view{"committed"},
                  agreement_outcome_t::committed},
        std::pair{std::string_view{"aborted"}, agreement_outcome_t::aborted}};

inline constexpr std::string_view to_string(const agreement_outcome_t value) {
  return clearhouse::schema::to_string(value, kAgreementOutcomeMappings)
      .value_or("unknown");
}

/// Multi-party agreement on a netted batch. Implemented outside this
/// service; the engine only proposes.
class agreement_service {
 public:
  virtual ~agreement_service() = default;

  virtual agreement_outcome_t propose(
      const clearhouse::schema::batch_t& batch) = 0;
};

}  // namespace clearhouse::agreement
