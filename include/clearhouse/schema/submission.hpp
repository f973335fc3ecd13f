#pragma once

#include <string>

// Schema type: submission.
// Raw payment instruction as received from a client, before validation.
// Every field is text so that malformed values reach the gate and are
// rejected with a precise error instead of failing in transport decoding.
namespace clearhouse::schema {

struct submission_t final {
  std::string transaction_id;
  std::string amount;
  std::string source_currency;
  std::string destination_currency;
  std::string source_account;
  std::string destination_account;
  std::string counterparty_id;
  std::string idempotency_key;
  std::string settlement_window;
};

}  // namespace clearhouse::schema
