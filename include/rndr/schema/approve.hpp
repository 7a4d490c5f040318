#pragma once
#include <rndr/schema/primitives.hpp>

namespace rndr::schema {

template <uint16_t Version>
struct approve;

template <>
struct approve<1> final {
  uint16_t version{1};
  address_t spender{};
  amount_t amount{};
};

using approve_t = approve<1>;

}  // namespace rndr::schema
