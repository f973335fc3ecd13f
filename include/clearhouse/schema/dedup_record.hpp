#pragma once

#include <clearhouse/schema/admission_result.hpp>
#include <clearhouse/schema/primitives.hpp>

#include <string>

// Schema type: dedup record.
// Idempotency key fingerprint mapped to the outcome of its first admission,
// kept until `expires_at`.
namespace clearhouse::schema {

struct dedup_record_t final {
  std::string fingerprint;
  admission_outcome_t outcome;
  timestamp_milliseconds_t stored_at{};
  timestamp_milliseconds_t expires_at{};
};

}  // namespace clearhouse::schema
