#pragma once
#include <boost/multiprecision/cpp_dec_float.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace clearhouse::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;

/// Integer amount in the minor unit of its currency (cents for USD, yen for
/// JPY).
using amount_t = int64_t;

/// Exact decimal used for every cost figure so that repeated runs price
/// identical inputs identically.
using cost_t = boost::multiprecision::cpp_dec_float_50;

using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

using transaction_id_t = std::string;
using batch_id_t = std::string;
using counterparty_id_t = std::string;
using account_id_t = std::string;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

/// Lower-case hex rendering of arbitrary bytes.
std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

/// Render a cost with a fixed number of fractional digits.
std::string to_string(const cost_t& cost, int digits = 6);

}  // namespace clearhouse::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
