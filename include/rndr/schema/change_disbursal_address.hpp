#pragma once
#include <rndr/schema/primitives.hpp>

namespace rndr::schema {

template <uint16_t Version>
struct change_disbursal_address;

template <>
struct change_disbursal_address<1> final {
  uint16_t version{1};
  address_t disbursal_address{};
};

using change_disbursal_address_t = change_disbursal_address<1>;

}  // namespace rndr::schema
