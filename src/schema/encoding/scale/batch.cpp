#include <clearhouse/schema/encoding/scale/batch.hpp>

#include <string>
#include <tuple>
#include <vector>

using namespace clearhouse::schema;

namespace {

using position_row_t =
    std::tuple<std::string, std::string, int64_t, int64_t, int64_t>;
using transfer_row_t =
    std::tuple<std::string, std::string, std::string, int64_t>;
using summary_row_t =
    std::tuple<std::string, int64_t, uint32_t, uint32_t, uint8_t>;
using netting_row_t = std::tuple<uint16_t,
                                 std::string,
                                 std::vector<position_row_t>,
                                 std::vector<transfer_row_t>,
                                 std::vector<summary_row_t>>;
using cost_row_t = std::tuple<std::string,
                              std::string,
                              std::string,
                              std::string,
                              uint32_t,
                              uint32_t>;
using subtotal_row_t = std::tuple<std::string, int64_t>;
using batch_row_t = std::tuple<uint16_t,
                               std::string,
                               uint8_t,
                               std::string,
                               std::string,
                               uint64_t,
                               std::vector<std::string>,
                               std::vector<subtotal_row_t>,
                               cost_row_t,
                               uint8_t,
                               std::string,
                               std::optional<netting_row_t>,
                               uint64_t>;

// Costs are stored as decimal text so they survive the round trip exactly.
constexpr auto kCostDigits = 20;

netting_row_t to_row(const netting_result_t& netting) {
  auto row = netting_row_t{};
  std::get<0>(row) = netting.version;
  std::get<1>(row) = netting.batch_id;
  for (const auto& p : netting.positions) {
    std::get<2>(row).emplace_back(p.participant, p.currency, p.receivable,
                                  p.payable, p.net);
  }
  for (const auto& t : netting.transfers) {
    std::get<3>(row).emplace_back(t.from, t.to, t.currency, t.amount);
  }
  for (const auto& s : netting.currencies) {
    std::get<4>(row).emplace_back(s.currency, s.gross_total,
                                  s.gross_transfer_count, s.net_transfer_count,
                                  static_cast<uint8_t>(s.method));
  }
  return row;
}

std::optional<netting_result_t> from_row(netting_row_t& row) {
  auto netting = netting_result_t{};
  if (std::get<0>(row) != 1) {
    return std::nullopt;
  }
  netting.batch_id = std::move(std::get<1>(row));
  for (auto& [participant, currency, receivable, payable, net] :
       std::get<2>(row)) {
    netting.positions.push_back(net_position_t{.participant = participant,
                                               .currency = currency,
                                               .receivable = receivable,
                                               .payable = payable,
                                               .net = net});
  }
  for (auto& [from, to, currency, amount] : std::get<3>(row)) {
    netting.transfers.push_back(net_transfer_t{
        .from = from, .to = to, .currency = currency, .amount = amount});
  }
  for (auto& [currency, gross_total, gross_count, net_count, method] :
       std::get<4>(row)) {
    if (method > static_cast<uint8_t>(netting_method_t::bilateral)) {
      return std::nullopt;
    }
    netting.currencies.push_back(currency_netting_summary_t{
        .currency = currency,
        .gross_total = gross_total,
        .gross_transfer_count = gross_count,
        .net_transfer_count = net_count,
        .method = static_cast<netting_method_t>(method)});
  }
  return netting;
}

}  // namespace

namespace clearhouse::schema::encoding::scale {

bytes_t encode(scale_encoder_t& encoder, const batch_t& batch) {
  auto subtotals = std::vector<subtotal_row_t>{};
  for (const auto& subtotal : batch.subtotals) {
    subtotals.emplace_back(subtotal.currency, subtotal.gross);
  }
  auto cost = cost_row_t{to_string(batch.cost.fx_spread, kCostDigits),
                         to_string(batch.cost.wire, kCostDigits),
                         to_string(batch.cost.consolidation_discount,
                                   kCostDigits),
                         to_string(batch.cost.total, kCostDigits),
                         batch.cost.wire_count,
                         batch.cost.consolidated_wire_count};
  auto netting = std::optional<netting_row_t>{};
  if (batch.netting) {
    netting = to_row(*batch.netting);
  }
  return encoder.encode(batch_row_t{
      batch.version, batch.batch_id, static_cast<uint8_t>(batch.window),
      batch.currencies.source, batch.currencies.destination,
      batch.chunk_sequence, batch.members, std::move(subtotals),
      std::move(cost), static_cast<uint8_t>(batch.status),
      batch.infeasible_reason, std::move(netting), batch.created_at});
}

std::optional<batch_t> decode_batch(scale_encoder_t& encoder,
                                    const bytes_view_t& bytes) {
  auto row = encoder.try_decode<batch_row_t>(bytes);
  if (!row) {
    return std::nullopt;
  }
  auto& [version, batch_id, window, source, destination, chunk_sequence,
         members, subtotals, cost, status, infeasible_reason, netting,
         created_at] = *row;
  if (version != 1 || window > static_cast<uint8_t>(settlement_window_t::t2) ||
      status > static_cast<uint8_t>(batch_status_t::infeasible)) {
    return std::nullopt;
  }

  auto batch = batch_t{};
  batch.batch_id = std::move(batch_id);
  batch.window = static_cast<settlement_window_t>(window);
  batch.currencies = currency_pair_t{.source = std::move(source),
                                     .destination = std::move(destination)};
  batch.chunk_sequence = chunk_sequence;
  batch.members = std::move(members);
  for (auto& [currency, gross] : subtotals) {
    batch.subtotals.push_back(
        currency_subtotal_t{.currency = std::move(currency), .gross = gross});
  }
  batch.cost.fx_spread = cost_t{std::get<0>(cost)};
  batch.cost.wire = cost_t{std::get<1>(cost)};
  batch.cost.consolidation_discount = cost_t{std::get<2>(cost)};
  batch.cost.total = cost_t{std::get<3>(cost)};
  batch.cost.wire_count = std::get<4>(cost);
  batch.cost.consolidated_wire_count = std::get<5>(cost);
  batch.status = static_cast<batch_status_t>(status);
  batch.infeasible_reason = std::move(infeasible_reason);
  if (netting) {
    auto decoded = from_row(*netting);
    if (!decoded) {
      return std::nullopt;
    }
    batch.netting = std::move(decoded);
  }
  batch.created_at = created_at;
  return batch;
}

}  // namespace clearhouse::schema::encoding::scale
