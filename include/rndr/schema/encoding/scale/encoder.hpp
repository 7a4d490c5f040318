#pragma once
#include <rndr/common/critical.hpp>
#include <rndr/schema/encoding/encoder.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace rndr::schema::encoding {

struct scale_encoder_tag {};

/// SCALE codec. Schema structs are aggregates and are encoded field by field
/// in declaration order; variants carry a one byte alternative index.
template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  rndr::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, rndr::schema::bytes_t& out);

  /// Decode engine-owned bytes; a failure is fatal.
  template <typename T>
  T decode(const rndr::schema::bytes_view_t& bytes);

  /// Decode untrusted bytes.
  template <typename T>
  std::optional<T> try_decode(const rndr::schema::bytes_view_t& bytes);
};

template <typename T>
rndr::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    rndr::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        rndr::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const rndr::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    rndr::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const rndr::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace rndr::schema::encoding
