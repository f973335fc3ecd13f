#pragma once
#include <clearhouse/schema/encoding/scale/encoder.hpp>
#include <clearhouse/schema/ledger_event.hpp>
#include <optional>

namespace clearhouse::schema::encoding::scale {

bytes_t encode(scale_encoder_t& encoder, const ledger_event_t& event);
std::optional<ledger_event_t> decode_ledger_event(scale_encoder_t& encoder,
                                                  const bytes_view_t& bytes);

}  // namespace clearhouse::schema::encoding::scale
