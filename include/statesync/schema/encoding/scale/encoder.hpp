#pragma once
#include <statesync/common/critical.hpp>
#include <statesync/schema/encoding/encoder.hpp>
#include <statesync/schema/encoding/scale/chunk_info.hpp>
#include <statesync/schema/encoding/scale/file_info.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace statesync::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  statesync::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, statesync::schema::bytes_t& out);

  template <typename T>
  T decode(const statesync::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const statesync::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const statesync::schema::bytes_view_t& bytes,
                              std::string& error);
};

template <typename T>
statesync::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    statesync::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        statesync::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const statesync::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    statesync::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const statesync::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const statesync::schema::bytes_view_t& bytes,
    std::string& error) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    error = decoded.error().message();
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace statesync::schema::encoding
