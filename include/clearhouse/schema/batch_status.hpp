#pragma once

#include <clearhouse/schema/enum_string.hpp>

#include <cstdint>
#include <string_view>

namespace clearhouse::schema {

enum class batch_status_t : uint8_t { optimal = 0, fallback = 1, infeasible = 2 };

inline constexpr auto kBatchStatusMappings = enum_mappings_t<batch_status_t, 3>{
    std::pair{std::string_view{"OPTIMAL"}, batch_status_t::optimal},
    std::pair{std::string_view{"FALLBACK"}, batch_status_t::fallback},
    std::pair{std::string_view{"INFEASIBLE"}, batch_status_t::infeasible}};

template <>
inline std::optional<batch_status_t> try_from_string<batch_status_t>(
    const std::string_view value) {
  return from_string(value, kBatchStatusMappings);
}

inline constexpr std::string_view to_string(const batch_status_t value) {
  return to_string(value, kBatchStatusMappings).value_or("UNKNOWN");
}

}  // namespace clearhouse::schema
