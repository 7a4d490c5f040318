#pragma once
#include <rndr/schema/primitives.hpp>
#include <string>

// Moves tokens from the sender into escrow custody and credits user_id.
namespace rndr::schema {

template <uint16_t Version>
struct hold_in_escrow;

template <>
struct hold_in_escrow<1> final {
  uint16_t version{1};
  std::string user_id;
  amount_t amount{};
};

using hold_in_escrow_t = hold_in_escrow<1>;

}  // namespace rndr::schema
