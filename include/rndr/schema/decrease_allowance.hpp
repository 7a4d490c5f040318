#pragma once
#include <rndr/schema/primitives.hpp>

// Lowers an allowance, saturating at zero.
namespace rndr::schema {

template <uint16_t Version>
struct decrease_allowance;

template <>
struct decrease_allowance<1> final {
  uint16_t version{1};
  address_t spender{};
  amount_t subtracted_value{};
};

using decrease_allowance_t = decrease_allowance<1>;

}  // namespace rndr::schema
