#pragma once
#include <rndr/schema/primitives.hpp>

namespace rndr::schema {

template <uint16_t Version>
struct increase_allowance;

template <>
struct increase_allowance<1> final {
  uint16_t version{1};
  address_t spender{};
  amount_t added_value{};
};

using increase_allowance_t = increase_allowance<1>;

}  // namespace rndr::schema
