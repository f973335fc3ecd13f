#pragma once
#include <clearhouse/schema/batch.hpp>
#include <clearhouse/schema/encoding/scale/encoder.hpp>
#include <optional>

namespace clearhouse::schema::encoding::scale {

bytes_t encode(scale_encoder_t& encoder, const batch_t& batch);
std::optional<batch_t> decode_batch(scale_encoder_t& encoder,
                                    const bytes_view_t& bytes);

}  // namespace clearhouse::schema::encoding::scale
