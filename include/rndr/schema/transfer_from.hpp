#pragma once
#include <rndr/schema/primitives.hpp>

namespace rndr::schema {

template <uint16_t Version>
struct transfer_from;

template <>
struct transfer_from<1> final {
  uint16_t version{1};
  address_t from{};
  address_t to{};
  amount_t amount{};
};

using transfer_from_t = transfer_from<1>;

}  // namespace rndr::schema
