#pragma once

#include <clearhouse/schema/primitives.hpp>

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: currency.
// ISO-4217 codes accepted for settlement together with their minor-unit
// exponent, plus the ordered (source, destination) pair used to key lanes.
namespace clearhouse::schema {

struct currency_info final {
  std::string_view code;
  uint8_t minor_units{2};
};

struct currency_pair_t final {
  std::string source;
  std::string destination;

  auto operator<=>(const currency_pair_t&) const = default;
};

/// Look up a supported currency; std::nullopt for unknown or malformed codes.
std::optional<currency_info> find_currency(std::string_view code);

/// True for exactly three upper-case ASCII letters.
bool is_well_formed_currency_code(std::string_view code);

/// Parse a plain decimal ("1250", "1250.5", "1250.50") into minor units.
///
/// Rejects signs, exponents, thousands separators and more fractional digits
/// than the currency allows.
std::optional<amount_t> parse_amount(std::string_view text,
                                     const currency_info& currency);

/// Render minor units as a decimal string with the currency's exponent.
std::string format_amount(amount_t amount, const currency_info& currency);

/// Minor units converted to major units as an exact decimal.
cost_t to_major_units(amount_t amount, const currency_info& currency);

std::string to_string(const currency_pair_t& pair);

}  // namespace clearhouse::schema
