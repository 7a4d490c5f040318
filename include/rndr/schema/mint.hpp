#pragma once
#include <rndr/schema/primitives.hpp>

namespace rndr::schema {

template <uint16_t Version>
struct mint;

template <>
struct mint<1> final {
  uint16_t version{1};
  address_t to{};
  amount_t amount{};
};

using mint_t = mint<1>;

}  // namespace rndr::schema
