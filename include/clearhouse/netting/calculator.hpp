#pragma once

#include <clearhouse/schema/batch.hpp>
#include <clearhouse/schema/enum_string.hpp>
#include <clearhouse/schema/netting_result.hpp>
#include <clearhouse/schema/transaction_intent.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <variant>

namespace clearhouse::netting {

enum class netting_error_code : uint8_t {
  infeasible_batch = 1,
  member_mismatch = 2,
};

inline constexpr auto kNettingErrorCodeMappings =
    clearhouse::schema::enum_mappings_t<netting_error_code, 2>{
        std::pair{std::string_view{"infeasible_batch"},
                  netting_error_code::infeasible_batch},
        std::pair{std::string_view{"member_mismatch"},
                  netting_error_code::member_mismatch}};

inline constexpr std::string_view to_string(const netting_error_code value) {
  return clearhouse::schema::to_string(value, kNettingErrorCodeMappings)
      .value_or("unknown");
}

struct netting_failure final {
  netting_error_code code{netting_error_code::member_mismatch};
  std::string detail;
};

using netting_outcome_t =
    std::variant<clearhouse::schema::netting_result_t, netting_failure>;

/// Collapse the gross obligations of a batch into net transfers.
///
/// Every intent is an obligation of its source account to its destination
/// account in the source currency. Positions are kept per currency; nothing
/// is netted across currencies. Transfers pair the largest debtor with the
/// largest creditor. When that would need more transfers than there are
/// gross obligations in a currency, bilateral netting per account pair is
/// used for that currency instead.
///
/// `intents` must hold exactly the batch members, in any order.
netting_outcome_t net(const clearhouse::schema::batch_t& batch,
                      std::span<const clearhouse::schema::transaction_intent_t>
                          intents);

}  // namespace clearhouse::netting
