#pragma once
#include <clearhouse/schema/primitives.hpp>
#include <optional>
#include <span>

namespace clearhouse::schema::encoding {

/// Wire/storage codec selected at build time by tag.
///
/// `decode` treats malformed input as fatal; `try_decode` reports it as
/// std::nullopt for paths that read data they did not write themselves.
template <typename Library>
struct encoder {
  template <typename T>
  clearhouse::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, clearhouse::schema::bytes_t& out);

  template <typename T>
  T decode(const clearhouse::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const clearhouse::schema::bytes_view_t& bytes);
};

}  // namespace clearhouse::schema::encoding
