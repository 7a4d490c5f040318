#pragma once

#include <rndr/schema/primitives.hpp>
#include <cstdint>

// Schema type: supply audit.
// Conservation figures for one token contract, computed from committed rows.
// `sum_of_escrow_balances` is the escrow's running `total_held`.
namespace rndr::schema {

template <uint16_t Version>
struct supply_audit;

template <>
struct supply_audit<1> final {
  uint16_t version{1};
  amount_t total_minted{};
  amount_t total_burned{};
  amount_t sum_of_balances{};
  amount_t escrow_contract_balance{};
  amount_t sum_of_escrow_balances{};
};

using supply_audit_t = supply_audit<1>;

}  // namespace rndr::schema
