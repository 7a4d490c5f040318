#pragma once
#include <rndr/schema/primitives.hpp>
#include <string>
#include <vector>

// Pays recipients[i] amounts[i] out of the escrow balance of user_id, in
// order.
namespace rndr::schema {

template <uint16_t Version>
struct disburse_funds;

template <>
struct disburse_funds<1> final {
  uint16_t version{1};
  std::string user_id;
  std::vector<address_t> recipients;
  std::vector<amount_t> amounts;
};

using disburse_funds_t = disburse_funds<1>;

}  // namespace rndr::schema
