#pragma once

#include <clearhouse/schema/primitives.hpp>
#include <clearhouse/schema/transaction_intent.hpp>
#include <clearhouse/schema/validation_error_code.hpp>

#include <string>
#include <variant>

// Schema type: admission result.
// Tagged outcome of one submission. A duplicate carries the exact outcome
// produced for the first submission of the same idempotency key.
namespace clearhouse::schema {

/// Response payload cached per idempotency key.
struct admission_outcome_t final {
  transaction_id_t transaction_id;
  std::string status{"submitted"};
  std::string amount;
  currency_pair_t currencies;
  settlement_window_t window{settlement_window_t::rtgs};
  counterparty_id_t counterparty_id;
  timestamp_milliseconds_t submitted_at{};

  bool operator==(const admission_outcome_t&) const = default;
};

struct accepted_t final {
  admission_outcome_t outcome;
  transaction_intent_t intent;
};

struct duplicate_t final {
  admission_outcome_t prior;
};

struct rejected_t final {
  validation_error_code code{};
  std::string detail;
};

using admission_result_t = std::variant<accepted_t, duplicate_t, rejected_t>;

}  // namespace clearhouse::schema
