#pragma once

#include <clearhouse/batching/grouper.hpp>
#include <clearhouse/intake/dedup_store.hpp>
#include <clearhouse/ledger/emitter.hpp>
#include <clearhouse/schema/admission_result.hpp>
#include <clearhouse/schema/submission.hpp>
#include <clearhouse/schema/transaction_intent.hpp>

#include <mutex>
#include <unordered_map>
#include <variant>

namespace clearhouse::intake {

inline constexpr auto kMaxIdentifierLength = size_t{50};
inline constexpr auto kMaxIdempotencyKeyLength = size_t{100};
/// 999,999,999.99 in major units.
inline constexpr auto kMaxAmountHundredths = clearhouse::schema::amount_t{
    99'999'999'999};

using validation_result_t =
    std::variant<clearhouse::schema::transaction_intent_t,
                 clearhouse::schema::rejected_t>;

/// Check every field of a submission and build the intent it describes.
validation_result_t validate(const clearhouse::schema::submission_t& submission,
                             clearhouse::schema::timestamp_milliseconds_t now);

/// Entry point for submissions: validation, idempotent admission, routing.
class idempotency_gate final {
 public:
  idempotency_gate(dedup_store& dedup,
                   clearhouse::batching::grouper& grouper,
                   clearhouse::ledger::emitter& emitter);

  /// Admit a submission.
  ///
  /// The first submission of an idempotency key is validated, routed to its
  /// lane and recorded with a SUBMITTED event. Later submissions of the same
  /// key within the retention horizon return the first outcome unchanged and
  /// emit DEDUPED. Rejections, including queue_full, are not cached.
  /// queue_full is returned while the lanes or the emitter outbox are full.
  clearhouse::schema::admission_result_t admit(
      const clearhouse::schema::submission_t& submission,
      clearhouse::schema::timestamp_milliseconds_t now);

  /// Forget idempotency records and admitted transaction ids older than the
  /// dedup retention horizon. Returns how many transaction ids went.
  size_t purge_expired(clearhouse::schema::timestamp_milliseconds_t now);

  size_t tracked_transaction_ids() const;

 private:
  dedup_store& dedup_;
  clearhouse::batching::grouper& grouper_;
  clearhouse::ledger::emitter& emitter_;
  mutable std::mutex transaction_ids_mutex_;
  /// Admitted transaction id -> when it may be reused.
  std::unordered_map<clearhouse::schema::transaction_id_t,
                     clearhouse::schema::timestamp_milliseconds_t>
      transaction_ids_;
};

}  // namespace clearhouse::intake
