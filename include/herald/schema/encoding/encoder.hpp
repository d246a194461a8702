#pragma once
#include <herald/schema/primitives.hpp>
#include <optional>

namespace herald::schema::encoding {

// Codec selection is a build time choice: callers name the library tag
// (e.g. encoder<scale_encoder_tag>) and never touch the codec API directly.
template <typename Library>
struct encoder {
  template <typename T>
  herald::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const herald::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const herald::schema::bytes_view_t& bytes);
};

}  // namespace herald::schema::encoding
