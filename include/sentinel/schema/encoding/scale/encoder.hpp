#pragma once
#include <sentinel/common/critical.hpp>
#include <sentinel/schema/encoding/encoder.hpp>
#include <optional>
#include <scale/scale.hpp>

namespace sentinel::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  sentinel::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const sentinel::schema::bytes_view_t& bytes);
};

template <typename T>
sentinel::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    sentinel::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const sentinel::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace sentinel::schema::encoding
