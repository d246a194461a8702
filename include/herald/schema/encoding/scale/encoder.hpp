#pragma once
#include <herald/common/critical.hpp>
#include <herald/schema/encoding/encoder.hpp>
#include <herald/schema/transaction.hpp>
#include <scale/scale.hpp>

namespace herald::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  herald::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const herald::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const herald::schema::bytes_view_t& bytes);
};

template <typename T>
herald::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    herald::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const herald::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    herald::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const herald::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace herald::schema::encoding
