#pragma once

#include <clearhouse/schema/enum_string.hpp>
#include <clearhouse/schema/primitives.hpp>

#include <cstdint>
#include <string>
#include <vector>

// Schema type: ledger event.
// Domain event handed to the external append-only log. `sequence` increases
// by one per entity, so downstream consumers can drop re-delivered events.
namespace clearhouse::schema {

enum class ledger_event_type_t : uint8_t {
  submitted = 0,
  deduped = 1,
  batch_created = 2,
  batch_optimized = 3,
  batch_fallback = 4,
  batch_infeasible = 5,
  batch_netted = 6
};

inline constexpr auto kLedgerEventTypeMappings =
    enum_mappings_t<ledger_event_type_t, 7>{
        std::pair{std::string_view{"SUBMITTED"},
                  ledger_event_type_t::submitted},
        std::pair{std::string_view{"DEDUPED"}, ledger_event_type_t::deduped},
        std::pair{std::string_view{"BATCH_CREATED"},
                  ledger_event_type_t::batch_created},
        std::pair{std::string_view{"BATCH_OPTIMIZED"},
                  ledger_event_type_t::batch_optimized},
        std::pair{std::string_view{"BATCH_FALLBACK"},
                  ledger_event_type_t::batch_fallback},
        std::pair{std::string_view{"BATCH_INFEASIBLE"},
                  ledger_event_type_t::batch_infeasible},
        std::pair{std::string_view{"BATCH_NETTED"},
                  ledger_event_type_t::batch_netted}};

template <>
inline std::optional<ledger_event_type_t> try_from_string<ledger_event_type_t>(
    const std::string_view value) {
  return from_string(value, kLedgerEventTypeMappings);
}

inline constexpr std::string_view to_string(const ledger_event_type_t value) {
  return to_string(value, kLedgerEventTypeMappings).value_or("UNKNOWN");
}

enum class entity_kind_t : uint8_t { transaction = 0, batch = 1 };

inline constexpr std::string_view to_string(const entity_kind_t value) {
  return value == entity_kind_t::transaction ? "transaction" : "batch";
}

struct event_attribute_t final {
  std::string key;
  std::string value;

  bool operator==(const event_attribute_t&) const = default;
};

template <uint16_t Version>
struct ledger_event;

template <>
struct ledger_event<1> final {
  uint16_t version{1};
  ledger_event_type_t type{ledger_event_type_t::submitted};
  entity_kind_t entity_kind{entity_kind_t::transaction};
  std::string entity_id;
  uint64_t sequence{};
  timestamp_milliseconds_t timestamp{};
  std::vector<event_attribute_t> attributes;

  bool operator==(const ledger_event&) const = default;
};

using ledger_event_t = ledger_event<1>;

}  // namespace clearhouse::schema
