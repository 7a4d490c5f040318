#pragma once
#include <rndr/schema/primitives.hpp>
#include <optional>
#include <span>

namespace rndr::schema::encoding {

// The wire codec is a build time choice: callers name a library tag and the
// matching specialization supplies the implementation.
template <typename Library>
struct encoder {
  template <typename T>
  rndr::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, rndr::schema::bytes_t& out);

  template <typename T>
  T decode(const rndr::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const rndr::schema::bytes_view_t& bytes);
};

}  // namespace rndr::schema::encoding
