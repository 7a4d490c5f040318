#pragma once
#include <rndr/schema/primitives.hpp>

namespace rndr::schema {

template <uint16_t Version>
struct transfer_ownership;

template <>
struct transfer_ownership<1> final {
  uint16_t version{1};
  address_t new_owner{};
};

using transfer_ownership_t = transfer_ownership<1>;

}  // namespace rndr::schema
