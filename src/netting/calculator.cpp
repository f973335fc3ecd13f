#include <clearhouse/netting/calculator.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <map>
#include <set>
#include <utility>
#include <vector>

using namespace clearhouse::schema;

namespace clearhouse::netting {

namespace {

struct obligation_t final {
  account_id_t payer;
  account_id_t payee;
  amount_t amount{};
};

struct balance_t final {
  account_id_t participant;
  amount_t remaining{};
};

/// Index of the largest balance, ties broken by participant id.
size_t largest(const std::vector<balance_t>& balances) {
  auto best = size_t{0};
  for (size_t i = 1; i < balances.size(); ++i) {
    if (balances[i].remaining > balances[best].remaining ||
        (balances[i].remaining == balances[best].remaining &&
         balances[i].participant < balances[best].participant)) {
      best = i;
    }
  }
  return best;
}

std::vector<net_transfer_t> multilateral(
    const std::string& currency,
    const std::map<account_id_t, net_position_t>& positions) {
  auto debtors = std::vector<balance_t>{};
  auto creditors = std::vector<balance_t>{};
  for (const auto& [participant, position] : positions) {
    if (position.net < 0) {
      debtors.push_back(balance_t{participant, -position.net});
    } else if (position.net > 0) {
      creditors.push_back(balance_t{participant, position.net});
    }
  }

  auto transfers = std::vector<net_transfer_t>{};
  while (!debtors.empty() && !creditors.empty()) {
    auto d = largest(debtors);
    auto c = largest(creditors);
    auto amount = std::min(debtors[d].remaining, creditors[c].remaining);
    transfers.push_back(net_transfer_t{.from = debtors[d].participant,
                                       .to = creditors[c].participant,
                                       .currency = currency,
                                       .amount = amount});
    debtors[d].remaining -= amount;
    creditors[c].remaining -= amount;
    if (debtors[d].remaining == 0) {
      debtors.erase(std::begin(debtors) + static_cast<std::ptrdiff_t>(d));
    }
    if (creditors[c].remaining == 0) {
      creditors.erase(std::begin(creditors) + static_cast<std::ptrdiff_t>(c));
    }
  }
  return transfers;
}

std::vector<net_transfer_t> bilateral(
    const std::string& currency,
    const std::vector<obligation_t>& obligations) {
  // Keyed by the ordered pair (low, high); positive means low owes high.
  auto pairs = std::map<std::pair<account_id_t, account_id_t>, amount_t>{};
  for (const auto& obligation : obligations) {
    if (obligation.payer < obligation.payee) {
      pairs[{obligation.payer, obligation.payee}] += obligation.amount;
    } else {
      pairs[{obligation.payee, obligation.payer}] -= obligation.amount;
    }
  }
  auto transfers = std::vector<net_transfer_t>{};
  for (const auto& [pair, amount] : pairs) {
    if (amount > 0) {
      transfers.push_back(net_transfer_t{
          .from = pair.first, .to = pair.second, .currency = currency,
          .amount = amount});
    } else if (amount < 0) {
      transfers.push_back(net_transfer_t{
          .from = pair.second, .to = pair.first, .currency = currency,
          .amount = -amount});
    }
  }
  return transfers;
}

}  // namespace

netting_outcome_t net(const batch_t& batch,
                      const std::span<const transaction_intent_t> intents) {
  if (batch.status == batch_status_t::infeasible) {
    return netting_failure{.code = netting_error_code::infeasible_batch,
                           .detail = "batch " + batch.batch_id +
                                     " is infeasible and cannot be netted"};
  }

  auto members = std::set<transaction_id_t>{std::begin(batch.members),
                                            std::end(batch.members)};
  auto seen = std::set<transaction_id_t>{};
  auto obligations = std::map<std::string, std::vector<obligation_t>>{};
  for (const auto& intent : intents) {
    if (!members.contains(intent.transaction_id) ||
        !seen.insert(intent.transaction_id).second) {
      return netting_failure{
          .code = netting_error_code::member_mismatch,
          .detail = "transaction " + intent.transaction_id +
                    " is not a unique member of batch " + batch.batch_id};
    }
    obligations[intent.currencies.source].push_back(
        obligation_t{.payer = intent.source_account,
                     .payee = intent.destination_account,
                     .amount = intent.amount});
  }
  if (seen.size() != members.size()) {
    return netting_failure{
        .code = netting_error_code::member_mismatch,
        .detail = std::to_string(members.size() - seen.size()) +
                  " members of batch " + batch.batch_id + " have no intent"};
  }

  auto result = netting_result_t{};
  result.batch_id = batch.batch_id;
  for (const auto& [currency, gross] : obligations) {
    auto positions = std::map<account_id_t, net_position_t>{};
    auto summary = currency_netting_summary_t{
        .currency = currency,
        .gross_transfer_count = static_cast<uint32_t>(gross.size())};
    for (const auto& obligation : gross) {
      auto& payer = positions[obligation.payer];
      payer.payable += obligation.amount;
      auto& payee = positions[obligation.payee];
      payee.receivable += obligation.amount;
      summary.gross_total += obligation.amount;
    }
    for (auto& [participant, position] : positions) {
      position.participant = participant;
      position.currency = currency;
      position.net = position.receivable - position.payable;
      result.positions.push_back(position);
    }

    auto transfers = multilateral(currency, positions);
    if (transfers.size() > gross.size()) {
      transfers = bilateral(currency, gross);
      summary.method = netting_method_t::bilateral;
    }
    summary.net_transfer_count = static_cast<uint32_t>(transfers.size());
    result.transfers.insert(std::end(result.transfers),
                            std::make_move_iterator(std::begin(transfers)),
                            std::make_move_iterator(std::end(transfers)));
    result.currencies.push_back(std::move(summary));
  }

  spdlog::debug("netted batch {}: {} positions, {} transfers", batch.batch_id,
                result.positions.size(), result.transfers.size());
  return result;
}

}  // namespace clearhouse::netting
