#pragma once

#include <clearhouse/schema/enum_string.hpp>
#include <clearhouse/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: transaction status.
// Progress of one admitted transaction through the batching pipeline.
namespace clearhouse::schema {

enum class transaction_state_t : uint8_t {
  submitted = 0,
  batched = 1,
  deferred = 2,
  failed = 3
};

inline constexpr auto kTransactionStateMappings =
    enum_mappings_t<transaction_state_t, 4>{
        std::pair{std::string_view{"submitted"},
                  transaction_state_t::submitted},
        std::pair{std::string_view{"batched"}, transaction_state_t::batched},
        std::pair{std::string_view{"deferred"}, transaction_state_t::deferred},
        std::pair{std::string_view{"failed"}, transaction_state_t::failed}};

inline constexpr std::string_view to_string(const transaction_state_t value) {
  return to_string(value, kTransactionStateMappings).value_or("unknown");
}

struct transaction_status_t final {
  transaction_id_t transaction_id;
  transaction_state_t state{transaction_state_t::submitted};
  std::optional<batch_id_t> batch_id;
  uint32_t deferrals{};
  timestamp_milliseconds_t updated_at{};
};

}  // namespace clearhouse::schema
