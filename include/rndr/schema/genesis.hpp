#pragma once

#include <rndr/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: genesis.
// Contract addresses and initial configuration written on first start.
namespace rndr::schema {

template <uint16_t Version>
struct genesis;

template <>
struct genesis<1> final {
  uint16_t version{1};
  std::string chain_name{"rndr-local-chain"};
  address_t token_address{};
  address_t escrow_address{};
  std::optional<address_t> legacy_token_address;
  address_t token_owner{};
  address_t escrow_owner{};
  address_t legacy_owner{};
  address_t bridge_manager{};
  std::string token_name{"RenderToken"};
  std::string token_symbol{"RNDR"};
};

using genesis_t = genesis<1>;

}  // namespace rndr::schema
