#pragma once

#include <clearhouse/schema/enum_string.hpp>
#include <clearhouse/schema/primitives.hpp>

#include <cstdint>
#include <string>
#include <vector>

// Schema type: netting result.
// Per-participant, per-currency positions of one batch and the transfers that
// settle them.
namespace clearhouse::schema {

enum class netting_method_t : uint8_t { multilateral = 0, bilateral = 1 };

inline constexpr auto kNettingMethodMappings =
    enum_mappings_t<netting_method_t, 2>{
        std::pair{std::string_view{"multilateral"},
                  netting_method_t::multilateral},
        std::pair{std::string_view{"bilateral"}, netting_method_t::bilateral}};

inline constexpr std::string_view to_string(const netting_method_t value) {
  return to_string(value, kNettingMethodMappings).value_or("unknown");
}

struct net_position_t final {
  account_id_t participant;
  std::string currency;
  amount_t receivable{};
  amount_t payable{};
  amount_t net{};  // receivable - payable

  bool operator==(const net_position_t&) const = default;
};

struct net_transfer_t final {
  account_id_t from;
  account_id_t to;
  std::string currency;
  amount_t amount{};

  bool operator==(const net_transfer_t&) const = default;
};

struct currency_netting_summary_t final {
  std::string currency;
  amount_t gross_total{};
  uint32_t gross_transfer_count{};
  uint32_t net_transfer_count{};
  netting_method_t method{netting_method_t::multilateral};

  bool operator==(const currency_netting_summary_t&) const = default;
};

template <uint16_t Version>
struct netting_result;

template <>
struct netting_result<1> final {
  uint16_t version{1};
  batch_id_t batch_id;
  std::vector<net_position_t> positions;
  std::vector<net_transfer_t> transfers;
  std::vector<currency_netting_summary_t> currencies;

  bool operator==(const netting_result&) const = default;
};

using netting_result_t = netting_result<1>;

}  // namespace clearhouse::schema
