#pragma once

#include <clearhouse/v1/settlement.pb.h>
#include <clearhouse/schema/admission_result.hpp>
#include <clearhouse/schema/batch.hpp>
#include <clearhouse/schema/submission.hpp>
#include <clearhouse/schema/transaction_status.hpp>

namespace clearhouse::rpc {

clearhouse::schema::submission_t to_submission(
    const clearhouse::v1::SubmitRequest& request);

void to_proto(const clearhouse::schema::admission_result_t& result,
              clearhouse::v1::SubmitResponse* response);

/// Amounts are rendered in major units of their currency, costs with six
/// fraction digits.
void to_proto(const clearhouse::schema::batch_t& batch,
              clearhouse::v1::Batch* response);

void to_proto(const clearhouse::schema::transaction_status_t& status,
              clearhouse::v1::TransactionStatus* response);

}  // namespace clearhouse::rpc
