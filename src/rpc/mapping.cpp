#include <clearhouse/rpc/mapping.hpp>
#include <clearhouse/schema/currency.hpp>
#include <clearhouse/schema/settlement_window.hpp>

#include <string>
#include <variant>

using namespace clearhouse::schema;

namespace {

std::string render_amount(const amount_t amount, const std::string& currency) {
  auto info = find_currency(currency);
  if (!info) {
    return std::to_string(amount);
  }
  return format_amount(amount, *info);
}

void to_proto(const admission_outcome_t& outcome,
              clearhouse::v1::AdmissionOutcome* response) {
  response->set_transaction_id(outcome.transaction_id);
  response->set_status(outcome.status);
  response->set_amount(outcome.amount);
  response->set_source_currency(outcome.currencies.source);
  response->set_destination_currency(outcome.currencies.destination);
  response->set_settlement_window(std::string{to_string(outcome.window)});
  response->set_counterparty_id(outcome.counterparty_id);
  response->set_submitted_at_ms(outcome.submitted_at);
}

}  // namespace

namespace clearhouse::rpc {

submission_t to_submission(const clearhouse::v1::SubmitRequest& request) {
  return submission_t{.transaction_id = request.transaction_id(),
                      .amount = request.amount(),
                      .source_currency = request.source_currency(),
                      .destination_currency = request.destination_currency(),
                      .source_account = request.source_account(),
                      .destination_account = request.destination_account(),
                      .counterparty_id = request.counterparty_id(),
                      .idempotency_key = request.idempotency_key(),
                      .settlement_window = request.settlement_window()};
}

void to_proto(const admission_result_t& result,
              clearhouse::v1::SubmitResponse* response) {
  std::visit(overloaded{
                 [&](const accepted_t& accepted) {
                   ::to_proto(accepted.outcome, response->mutable_accepted());
                 },
                 [&](const duplicate_t& duplicate) {
                   ::to_proto(duplicate.prior, response->mutable_duplicate());
                 },
                 [&](const rejected_t& rejected) {
                   auto* rejection = response->mutable_rejected();
                   rejection->set_code(std::string{to_string(rejected.code)});
                   rejection->set_detail(rejected.detail);
                   rejection->set_retryable(is_retryable(rejected.code));
                 }},
             result);
}

void to_proto(const batch_t& batch, clearhouse::v1::Batch* response) {
  response->set_batch_id(batch.batch_id);
  response->set_settlement_window(std::string{to_string(batch.window)});
  response->set_source_currency(batch.currencies.source);
  response->set_destination_currency(batch.currencies.destination);
  response->set_chunk_sequence(batch.chunk_sequence);
  for (const auto& member : batch.members) {
    response->add_members(member);
  }
  for (const auto& subtotal : batch.subtotals) {
    auto* entry = response->add_subtotals();
    entry->set_currency(subtotal.currency);
    entry->set_gross(render_amount(subtotal.gross, subtotal.currency));
  }
  auto* cost = response->mutable_cost();
  cost->set_fx_spread(to_string(batch.cost.fx_spread));
  cost->set_wire(to_string(batch.cost.wire));
  cost->set_consolidation_discount(to_string(batch.cost.consolidation_discount));
  cost->set_total(to_string(batch.cost.total));
  cost->set_wire_count(batch.cost.wire_count);
  cost->set_consolidated_wire_count(batch.cost.consolidated_wire_count);
  response->set_status(std::string{to_string(batch.status)});
  response->set_infeasible_reason(batch.infeasible_reason);
  response->set_created_at_ms(batch.created_at);

  if (!batch.netting) {
    return;
  }
  auto* netting = response->mutable_netting();
  for (const auto& position : batch.netting->positions) {
    auto* entry = netting->add_positions();
    entry->set_participant(position.participant);
    entry->set_currency(position.currency);
    entry->set_receivable(render_amount(position.receivable, position.currency));
    entry->set_payable(render_amount(position.payable, position.currency));
    entry->set_net(render_amount(position.net, position.currency));
  }
  for (const auto& transfer : batch.netting->transfers) {
    auto* entry = netting->add_transfers();
    entry->set_from(transfer.from);
    entry->set_to(transfer.to);
    entry->set_currency(transfer.currency);
    entry->set_amount(render_amount(transfer.amount, transfer.currency));
  }
  for (const auto& summary : batch.netting->currencies) {
    auto* entry = netting->add_currencies();
    entry->set_currency(summary.currency);
    entry->set_gross_total(render_amount(summary.gross_total, summary.currency));
    entry->set_gross_transfer_count(summary.gross_transfer_count);
    entry->set_net_transfer_count(summary.net_transfer_count);
    entry->set_method(std::string{to_string(summary.method)});
  }
}

void to_proto(const transaction_status_t& status,
              clearhouse::v1::TransactionStatus* response) {
  response->set_transaction_id(status.transaction_id);
  response->set_state(std::string{to_string(status.state)});
  if (status.batch_id) {
    response->set_batch_id(*status.batch_id);
  }
  response->set_deferrals(status.deferrals);
  response->set_updated_at_ms(status.updated_at);
}

}  // namespace clearhouse::rpc
