#pragma once

#include <clearhouse/schema/currency.hpp>
#include <clearhouse/schema/settlement_window.hpp>

#include <compare>
#include <string>

// Schema type: lane key.
// (settlement window, ordered currency pair) identifying one batching lane.
namespace clearhouse::schema {

struct lane_key_t final {
  settlement_window_t window{settlement_window_t::rtgs};
  currency_pair_t currencies;

  auto operator<=>(const lane_key_t&) const = default;
};

inline std::string to_string(const lane_key_t& key) {
  return std::string{to_string(key.window)} + ":" + to_string(key.currencies);
}

}  // namespace clearhouse::schema
