#pragma once

#include <clearhouse/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: settlement window.
// Settlement timing class; transactions of different windows never share a
// lane, a chunk or a batch.
namespace clearhouse::schema {

enum class settlement_window_t : uint8_t {
  rtgs = 0,  // immediate, real-time gross settlement
  t0 = 1,
  t1 = 2,
  t2 = 3
};

inline constexpr auto kSettlementWindowMappings =
    enum_mappings_t<settlement_window_t, 4>{
        std::pair{std::string_view{"rtgs"}, settlement_window_t::rtgs},
        std::pair{std::string_view{"t0"}, settlement_window_t::t0},
        std::pair{std::string_view{"t1"}, settlement_window_t::t1},
        std::pair{std::string_view{"t2"}, settlement_window_t::t2}};

template <>
inline std::optional<settlement_window_t> try_from_string<settlement_window_t>(
    const std::string_view value) {
  return from_string(value, kSettlementWindowMappings);
}

inline constexpr std::string_view to_string(const settlement_window_t value) {
  return to_string(value, kSettlementWindowMappings).value_or("unknown");
}

}  // namespace clearhouse::schema
