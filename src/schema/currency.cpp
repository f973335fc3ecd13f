#include <clearhouse/schema/currency.hpp>

#include <algorithm>
#include <array>
#include <limits>

namespace clearhouse::schema {

namespace {

inline constexpr auto kSupportedCurrencies = std::array{
    currency_info{"USD", 2}, currency_info{"EUR", 2}, currency_info{"GBP", 2},
    currency_info{"JPY", 0}, currency_info{"CHF", 2}, currency_info{"CAD", 2},
    currency_info{"AUD", 2}, currency_info{"NZD", 2}, currency_info{"CNY", 2},
    currency_info{"INR", 2}, currency_info{"KRW", 0}, currency_info{"SGD", 2},
    currency_info{"HKD", 2}, currency_info{"MXN", 2}, currency_info{"BRL", 2},
    currency_info{"ZAR", 2}};

amount_t power_of_ten(const uint8_t exponent) {
  auto value = amount_t{1};
  for (auto i = uint8_t{0}; i < exponent; ++i) {
    value *= 10;
  }
  return value;
}

}  // namespace

bool is_well_formed_currency_code(const std::string_view code) {
  return code.size() == 3 && std::ranges::all_of(code, [](const char c) {
           return c >= 'A' && c <= 'Z';
         });
}

std::optional<currency_info> find_currency(const std::string_view code) {
  if (!is_well_formed_currency_code(code)) {
    return std::nullopt;
  }
  auto it = std::ranges::find(kSupportedCurrencies, code, &currency_info::code);
  if (it == std::end(kSupportedCurrencies)) {
    return std::nullopt;
  }
  return *it;
}

std::optional<amount_t> parse_amount(const std::string_view text,
                                     const currency_info& currency) {
  if (text.empty()) {
    return std::nullopt;
  }
  auto dot = text.find('.');
  auto whole = text.substr(0, dot);
  auto fraction =
      dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);
  if (whole.empty() || (dot != std::string_view::npos && fraction.empty())) {
    return std::nullopt;
  }
  if (fraction.size() > currency.minor_units) {
    return std::nullopt;
  }

  constexpr auto kLimit = std::numeric_limits<amount_t>::max() / 10;
  auto value = amount_t{};
  auto accumulate = [&](const std::string_view digits) {
    for (const auto c : digits) {
      if (c < '0' || c > '9' || value > kLimit) {
        return false;
      }
      value = (value * 10) + (c - '0');
    }
    return true;
  };
  if (!accumulate(whole) || !accumulate(fraction)) {
    return std::nullopt;
  }
  for (auto i = fraction.size(); i < currency.minor_units; ++i) {
    if (value > kLimit) {
      return std::nullopt;
    }
    value *= 10;
  }
  return value;
}

std::string format_amount(const amount_t amount,
                          const currency_info& currency) {
  auto scale = power_of_ten(currency.minor_units);
  auto magnitude = amount < 0 ? -amount : amount;
  auto out = std::string{amount < 0 ? "-" : ""};
  out += std::to_string(magnitude / scale);
  if (currency.minor_units > 0) {
    auto fraction = std::to_string(magnitude % scale);
    out += '.';
    out.append(currency.minor_units - fraction.size(), '0');
    out += fraction;
  }
  return out;
}

cost_t to_major_units(const amount_t amount, const currency_info& currency) {
  return cost_t{amount} / cost_t{power_of_ten(currency.minor_units)};
}

std::string to_string(const currency_pair_t& pair) {
  return pair.source + "/" + pair.destination;
}

}  // namespace clearhouse::schema
