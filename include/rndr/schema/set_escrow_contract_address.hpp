#pragma once
#include <rndr/schema/primitives.hpp>

namespace rndr::schema {

template <uint16_t Version>
struct set_escrow_contract_address;

template <>
struct set_escrow_contract_address<1> final {
  uint16_t version{1};
  address_t escrow_contract_address{};
};

using set_escrow_contract_address_t = set_escrow_contract_address<1>;

}  // namespace rndr::schema
