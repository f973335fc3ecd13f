#include <clearhouse/common/critical.hpp>
#include <clearhouse/crypto/digest.hpp>
#include <clearhouse/intake/idempotency_gate.hpp>
#include <clearhouse/schema/currency.hpp>
#include <clearhouse/schema/settlement_window.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>

using namespace clearhouse::schema;

namespace clearhouse::intake {

namespace {

rejected_t reject(const validation_error_code code, std::string detail) {
  return rejected_t{.code = code, .detail = std::move(detail)};
}

bool is_identifier_char(const char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '_' || c == '-';
}

bool is_blank(const std::string& value) {
  return std::ranges::all_of(value, [](const char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
  });
}

std::optional<rejected_t> check_currency(const std::string& code,
                                         const std::string_view field) {
  if (!is_well_formed_currency_code(code)) {
    return reject(validation_error_code::invalid_currency,
                  std::string{field} + " must be a three-letter ISO-4217 code");
  }
  if (!find_currency(code)) {
    return reject(validation_error_code::unsupported_currency,
                  std::string{field} + " " + code + " is not supported");
  }
  return std::nullopt;
}

std::optional<rejected_t> check_party(const std::string& value,
                                      const validation_error_code missing,
                                      const std::string_view field) {
  if (value.empty() || is_blank(value)) {
    return reject(missing, std::string{field} + " is required");
  }
  if (value.size() > kMaxIdentifierLength) {
    return reject(validation_error_code::field_too_long,
                  std::string{field} + " exceeds 50 characters");
  }
  return std::nullopt;
}

admission_outcome_t make_outcome(const transaction_intent_t& intent) {
  return admission_outcome_t{
      .transaction_id = intent.transaction_id,
      .amount = format_amount(intent.amount,
                              *find_currency(intent.currencies.source)),
      .currencies = intent.currencies,
      .window = intent.window,
      .counterparty_id = intent.counterparty_id,
      .submitted_at = intent.submitted_at};
}

}  // namespace

validation_result_t validate(const submission_t& submission,
                             const timestamp_milliseconds_t now) {
  const auto& id = submission.transaction_id;
  if (id.empty() || id.size() > kMaxIdentifierLength ||
      !std::ranges::all_of(id, is_identifier_char)) {
    return reject(validation_error_code::invalid_transaction_id,
                  "transaction_id must be 1-50 characters of [A-Za-z0-9_-]");
  }

  if (auto error =
          check_currency(submission.source_currency, "source_currency")) {
    return *error;
  }
  if (auto error = check_currency(submission.destination_currency,
                                  "destination_currency")) {
    return *error;
  }

  auto source_currency = *find_currency(submission.source_currency);
  auto amount = parse_amount(submission.amount, source_currency);
  if (!amount || *amount <= 0) {
    return reject(validation_error_code::invalid_amount,
                  "amount must be a positive decimal with at most " +
                      std::to_string(source_currency.minor_units) +
                      " fraction digits");
  }
  if (to_major_units(*amount, source_currency) >
      cost_t{kMaxAmountHundredths} / 100) {
    return reject(validation_error_code::amount_exceeds_limit,
                  "amount exceeds 999999999.99");
  }

  if (auto error = check_party(submission.source_account,
                               validation_error_code::missing_source_account,
                               "source_account")) {
    return *error;
  }
  if (auto error =
          check_party(submission.destination_account,
                      validation_error_code::missing_destination_account,
                      "destination_account")) {
    return *error;
  }
  if (submission.source_account == submission.destination_account) {
    return reject(validation_error_code::same_source_and_destination,
                  "source and destination accounts must differ");
  }
  if (auto error = check_party(submission.counterparty_id,
                               validation_error_code::missing_counterparty,
                               "counterparty_id")) {
    return *error;
  }

  if (submission.idempotency_key.empty()) {
    return reject(validation_error_code::invalid_idempotency_key,
                  "idempotency_key is required");
  }
  if (submission.idempotency_key.size() > kMaxIdempotencyKeyLength) {
    return reject(validation_error_code::field_too_long,
                  "idempotency_key exceeds 100 characters");
  }

  auto window = settlement_window_t::rtgs;
  if (!submission.settlement_window.empty()) {
    auto parsed =
        try_from_string<settlement_window_t>(submission.settlement_window);
    if (!parsed) {
      return reject(validation_error_code::invalid_settlement_window,
                    "settlement_window must be one of rtgs, t0, t1, t2");
    }
    window = *parsed;
  }

  auto intent = transaction_intent_t{};
  intent.transaction_id = submission.transaction_id;
  intent.amount = *amount;
  intent.currencies = currency_pair_t{
      .source = submission.source_currency,
      .destination = submission.destination_currency};
  intent.source_account = submission.source_account;
  intent.destination_account = submission.destination_account;
  intent.counterparty_id = submission.counterparty_id;
  intent.window = window;
  intent.idempotency_key = submission.idempotency_key;
  intent.submitted_at = now;
  return intent;
}

idempotency_gate::idempotency_gate(dedup_store& dedup,
                                   clearhouse::batching::grouper& grouper,
                                   clearhouse::ledger::emitter& emitter)
    : dedup_{dedup}, grouper_{grouper}, emitter_{emitter} {}

admission_result_t idempotency_gate::admit(const submission_t& submission,
                                           const timestamp_milliseconds_t now) {
  auto validated = validate(submission, now);
  if (auto* rejected = std::get_if<rejected_t>(&validated)) {
    spdlog::debug("rejected {}: {} ({})", submission.transaction_id,
                  to_string(rejected->code), rejected->detail);
    return std::move(*rejected);
  }
  auto& intent = std::get<transaction_intent_t>(validated);

  auto refusal = std::optional<rejected_t>{};
  auto lookup = dedup_.check_and_set(
      clearhouse::crypto::fingerprint(intent.idempotency_key), now,
      [&]() -> std::optional<admission_outcome_t> {
        if (emitter_.saturated()) {
          refusal = reject(validation_error_code::queue_full,
                           "event outbox is full, retry later");
          return std::nullopt;
        }
        {
          auto lock = std::scoped_lock{transaction_ids_mutex_};
          auto it = transaction_ids_.find(intent.transaction_id);
          if (it != std::end(transaction_ids_) && it->second > now) {
            refusal = reject(validation_error_code::duplicate_transaction_id,
                             "transaction_id " + intent.transaction_id +
                                 " was already admitted under another key");
            return std::nullopt;
          }
          if (!grouper_.try_reserve()) {
            refusal = reject(validation_error_code::queue_full,
                             "too many pending transactions, retry later");
            return std::nullopt;
          }
          transaction_ids_.insert_or_assign(intent.transaction_id,
                                            now + dedup_.retention());
        }
        // Still under the key's shard lock, so a duplicate of this key cannot
        // emit DEDUPED ahead of SUBMITTED.
        emitter_.emit(ledger_event_type_t::submitted,
                      entity_kind_t::transaction, intent.transaction_id, now,
                      {{"amount", format_amount(intent.amount,
                                                *find_currency(
                                                    intent.currencies.source))},
                       {"currency_pair", to_string(intent.currencies)},
                       {"window", std::string{to_string(intent.window)}},
                       {"counterparty_id", intent.counterparty_id}});
        grouper_.route(intent);
        return make_outcome(intent);
      });

  switch (lookup.status) {
    case dedup_status_t::inserted:
      spdlog::debug("admitted {} into {}", intent.transaction_id,
                    to_string(intent.currencies));
      return accepted_t{.outcome = std::move(*lookup.outcome),
                        .intent = std::move(intent)};
    case dedup_status_t::existing:
      spdlog::debug("duplicate submission for {}, returning {}",
                    submission.idempotency_key,
                    lookup.outcome->transaction_id);
      emitter_.emit(ledger_event_type_t::deduped, entity_kind_t::transaction,
                    lookup.outcome->transaction_id, now,
                    {{"submitted_transaction_id", submission.transaction_id}});
      return duplicate_t{.prior = std::move(*lookup.outcome)};
    case dedup_status_t::refused:
      break;
  }
  if (!refusal) {
    clearhouse::common::critical("dedup store refused {} without a reason",
                                 intent.transaction_id);
  }
  spdlog::debug("refused {}: {}", intent.transaction_id,
                to_string(refusal->code));
  return std::move(*refusal);
}

size_t idempotency_gate::purge_expired(const timestamp_milliseconds_t now) {
  dedup_.purge_expired(now);
  auto lock = std::scoped_lock{transaction_ids_mutex_};
  auto purged = std::erase_if(transaction_ids_, [&](const auto& entry) {
    return entry.second <= now;
  });
  if (purged > 0) {
    spdlog::debug("forgot {} expired transaction ids", purged);
  }
  return purged;
}

size_t idempotency_gate::tracked_transaction_ids() const {
  auto lock = std::scoped_lock{transaction_ids_mutex_};
  return transaction_ids_.size();
}

}  // namespace clearhouse::intake
