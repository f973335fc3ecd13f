#pragma once

#include <clearhouse/schema/currency.hpp>
#include <clearhouse/schema/primitives.hpp>
#include <clearhouse/schema/settlement_window.hpp>

#include <cstdint>
#include <string>

// Schema type: transaction intent.
// Validated payment instruction admitted by the idempotency gate. Never
// mutated after admission; downstream stages only read it.
namespace clearhouse::schema {

template <uint16_t Version>
struct transaction_intent;

template <>
struct transaction_intent<1> final {
  uint16_t version{1};
  transaction_id_t transaction_id;
  amount_t amount{};
  currency_pair_t currencies;
  account_id_t source_account;
  account_id_t destination_account;
  counterparty_id_t counterparty_id;
  settlement_window_t window{settlement_window_t::rtgs};
  std::string idempotency_key;
  timestamp_milliseconds_t submitted_at{};
};

using transaction_intent_t = transaction_intent<1>;

}  // namespace clearhouse::schema
