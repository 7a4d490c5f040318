#pragma once
#include <rndr/schema/primitives.hpp>

namespace rndr::schema {

template <uint16_t Version>
struct withdraw;

template <>
struct withdraw<1> final {
  uint16_t version{1};
  amount_t amount{};
};

using withdraw_t = withdraw<1>;

}  // namespace rndr::schema
