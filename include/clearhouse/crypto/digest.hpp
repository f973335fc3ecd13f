#pragma once

#include <clearhouse/schema/primitives.hpp>

#include <initializer_list>
#include <span>
#include <string>
#include <string_view>

namespace clearhouse::crypto {

/// SHA-256 of the provided bytes.
clearhouse::schema::hash32_t sha256(const clearhouse::schema::bytes_view_t& bytes);
clearhouse::schema::hash32_t sha256(const std::string_view& str);

/// SHA-256 over length-prefixed parts, so ("ab", "c") and ("a", "bc") differ.
clearhouse::schema::hash32_t sha256_parts(
    std::span<const std::string_view> parts);
clearhouse::schema::hash32_t sha256_parts(
    std::initializer_list<std::string_view> parts);

/// Hex digest of an idempotency key, used as the dedup store key.
std::string fingerprint(const std::string_view& idempotency_key);

}  // namespace clearhouse::crypto
