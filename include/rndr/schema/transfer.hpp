#pragma once
#include <rndr/schema/primitives.hpp>

namespace rndr::schema {

template <uint16_t Version>
struct transfer;

template <>
struct transfer<1> final {
  uint16_t version{1};
  address_t to{};
  amount_t amount{};
};

using transfer_t = transfer<1>;

}  // namespace rndr::schema
