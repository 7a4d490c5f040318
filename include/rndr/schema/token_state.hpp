#pragma once

#include <rndr/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: token state.
// Singleton configuration and supply row of one token ledger contract.
namespace rndr::schema {

template <uint16_t Version>
struct token_state;

template <>
struct token_state<1> final {
  uint16_t version{1};
  std::string name;
  std::string symbol;
  uint8_t decimals{18};
  address_t owner{};
  address_t bridge_manager{};
  address_t escrow_contract_address{};
  address_t legacy_token_address{};
  bool owner_mintable{};
  amount_t total_supply{};
  amount_t total_minted{};
  amount_t total_burned{};
};

using token_state_t = token_state<1>;

}  // namespace rndr::schema
