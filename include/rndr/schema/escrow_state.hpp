#pragma once

#include <rndr/schema/primitives.hpp>
#include <cstdint>

// Schema type: escrow state.
// Singleton configuration row of one escrow ledger contract.
namespace rndr::schema {

template <uint16_t Version>
struct escrow_state;

template <>
struct escrow_state<1> final {
  uint16_t version{1};
  address_t owner{};
  address_t render_token_address{};
  address_t disbursal_address{};
  amount_t total_held{};
};

using escrow_state_t = escrow_state<1>;

}  // namespace rndr::schema
