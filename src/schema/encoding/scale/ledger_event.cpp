#include <clearhouse/schema/encoding/scale/ledger_event.hpp>

#include <string>
#include <tuple>
#include <vector>

using namespace clearhouse::schema;

namespace {

using attribute_row_t = std::tuple<std::string, std::string>;
using ledger_event_row_t = std::tuple<uint16_t,
                                      uint8_t,
                                      uint8_t,
                                      std::string,
                                      uint64_t,
                                      uint64_t,
                                      std::vector<attribute_row_t>>;

constexpr auto kMaxEventType =
    static_cast<uint8_t>(ledger_event_type_t::batch_netted);

}  // namespace

namespace clearhouse::schema::encoding::scale {

bytes_t encode(scale_encoder_t& encoder, const ledger_event_t& event) {
  auto attributes = std::vector<attribute_row_t>{};
  attributes.reserve(event.attributes.size());
  for (const auto& attribute : event.attributes) {
    attributes.emplace_back(attribute.key, attribute.value);
  }
  return encoder.encode(ledger_event_row_t{
      event.version, static_cast<uint8_t>(event.type),
      static_cast<uint8_t>(event.entity_kind), event.entity_id, event.sequence,
      event.timestamp, std::move(attributes)});
}

std::optional<ledger_event_t> decode_ledger_event(scale_encoder_t& encoder,
                                                  const bytes_view_t& bytes) {
  auto row = encoder.try_decode<ledger_event_row_t>(bytes);
  if (!row) {
    return std::nullopt;
  }
  auto& [version, type, kind, entity_id, sequence, timestamp, attributes] =
      *row;
  if (version != 1 || type > kMaxEventType || kind > 1) {
    return std::nullopt;
  }

  auto event = ledger_event_t{};
  event.type = static_cast<ledger_event_type_t>(type);
  event.entity_kind = static_cast<entity_kind_t>(kind);
  event.entity_id = std::move(entity_id);
  event.sequence = sequence;
  event.timestamp = timestamp;
  event.attributes.reserve(attributes.size());
  for (auto& [key, value] : attributes) {
    event.attributes.push_back(
        event_attribute_t{.key = std::move(key), .value = std::move(value)});
  }
  return event;
}

}  // namespace clearhouse::schema::encoding::scale
