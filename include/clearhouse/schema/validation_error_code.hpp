#pragma once

#include <clearhouse/schema/enum_string.hpp>

#include <cstdint>
#include <string_view>

namespace clearhouse::schema {

enum class validation_error_code : uint32_t {
  invalid_transaction_id = 1,
  invalid_amount = 2,
  amount_exceeds_limit = 3,
  invalid_currency = 4,
  unsupported_currency = 5,
  missing_source_account = 6,
  missing_destination_account = 7,
  same_source_and_destination = 8,
  missing_counterparty = 9,
  invalid_idempotency_key = 10,
  invalid_settlement_window = 11,
  field_too_long = 12,
  duplicate_transaction_id = 13,
  queue_full = 14,
};

inline constexpr auto kValidationErrorCodeMappings =
    enum_mappings_t<validation_error_code, 14>{
        std::pair{std::string_view{"invalid_transaction_id"},
                  validation_error_code::invalid_transaction_id},
        std::pair{std::string_view{"invalid_amount"},
                  validation_error_code::invalid_amount},
        std::pair{std::string_view{"amount_exceeds_limit"},
                  validation_error_code::amount_exceeds_limit},
        std::pair{std::string_view{"invalid_currency"},
                  validation_error_code::invalid_currency},
        std::pair{std::string_view{"unsupported_currency"},
                  validation_error_code::unsupported_currency},
        std::pair{std::string_view{"missing_source_account"},
                  validation_error_code::missing_source_account},
        std::pair{std::string_view{"missing_destination_account"},
                  validation_error_code::missing_destination_account},
        std::pair{std::string_view{"same_source_and_destination"},
                  validation_error_code::same_source_and_destination},
        std::pair{std::string_view{"missing_counterparty"},
                  validation_error_code::missing_counterparty},
        std::pair{std::string_view{"invalid_idempotency_key"},
                  validation_error_code::invalid_idempotency_key},
        std::pair{std::string_view{"invalid_settlement_window"},
                  validation_error_code::invalid_settlement_window},
        std::pair{std::string_view{"field_too_long"},
                  validation_error_code::field_too_long},
        std::pair{std::string_view{"duplicate_transaction_id"},
                  validation_error_code::duplicate_transaction_id},
        std::pair{std::string_view{"queue_full"},
                  validation_error_code::queue_full}};

inline constexpr std::string_view to_string(const validation_error_code value) {
  return to_string(value, kValidationErrorCodeMappings).value_or("unknown");
}

/// Only admission-control refusals are worth retrying unchanged.
inline constexpr bool is_retryable(const validation_error_code value) {
  return value == validation_error_code::queue_full;
}

}  // namespace clearhouse::schema
