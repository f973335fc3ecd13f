#pragma once

#include <clearhouse/schema/chunk.hpp>
#include <clearhouse/schema/currency.hpp>
#include <clearhouse/schema/primitives.hpp>
#include <clearhouse/schema/submission.hpp>
#include <clearhouse/schema/transaction_intent.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace clearhouse::testing {

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Valid USD->EUR rtgs submission; tests override what they exercise.
inline clearhouse::schema::submission_t make_submission(
    const std::string& transaction_id,
    const std::string& amount = "100.00") {
  return clearhouse::schema::submission_t{
      .transaction_id = transaction_id,
      .amount = amount,
      .source_currency = "USD",
      .destination_currency = "EUR",
      .source_account = "ACC-" + transaction_id + "-SRC",
      .destination_account = "ACC-" + transaction_id + "-DST",
      .counterparty_id = "CP-1",
      .idempotency_key = "key-" + transaction_id,
      .settlement_window = "rtgs"};
}

/// Intent in a USD->EUR rtgs lane, amount in cents.
inline clearhouse::schema::transaction_intent_t make_intent(
    const std::string& transaction_id,
    const clearhouse::schema::amount_t amount,
    const std::string& counterparty = "CP-1",
    const clearhouse::schema::timestamp_milliseconds_t submitted_at = 0) {
  auto intent = clearhouse::schema::transaction_intent_t{};
  intent.transaction_id = transaction_id;
  intent.amount = amount;
  intent.currencies = clearhouse::schema::currency_pair_t{"USD", "EUR"};
  intent.source_account = "ACC-" + transaction_id + "-SRC";
  intent.destination_account = "ACC-" + transaction_id + "-DST";
  intent.counterparty_id = counterparty;
  intent.window = clearhouse::schema::settlement_window_t::rtgs;
  intent.idempotency_key = "key-" + transaction_id;
  intent.submitted_at = submitted_at;
  return intent;
}

inline clearhouse::schema::chunk_t make_chunk(
    std::vector<clearhouse::schema::transaction_intent_t> members,
    const uint64_t sequence = 1) {
  auto chunk = clearhouse::schema::chunk_t{};
  chunk.lane = clearhouse::schema::lane_key_t{
      .window = clearhouse::schema::settlement_window_t::rtgs,
      .currencies = clearhouse::schema::currency_pair_t{"USD", "EUR"}};
  chunk.sequence = sequence;
  chunk.formed_at = 1'000;
  chunk.members = std::move(members);
  return chunk;
}

}  // namespace clearhouse::testing
