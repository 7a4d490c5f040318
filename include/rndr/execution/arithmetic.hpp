#pragma once

#include <rndr/schema/primitives.hpp>
#include <limits>
#include <optional>

// uint256_t wraps on overflow; every ledger sum goes through these instead.
namespace rndr::execution {

inline std::optional<rndr::schema::amount_t> checked_add(
    const rndr::schema::amount_t& lhs,
    const rndr::schema::amount_t& rhs) {
  if (rhs > std::numeric_limits<rndr::schema::amount_t>::max() - lhs) {
    return std::nullopt;
  }
  return lhs + rhs;
}

inline std::optional<rndr::schema::amount_t> checked_sub(
    const rndr::schema::amount_t& lhs,
    const rndr::schema::amount_t& rhs) {
  if (rhs > lhs) {
    return std::nullopt;
  }
  return lhs - rhs;
}

inline rndr::schema::amount_t saturating_sub(
    const rndr::schema::amount_t& lhs,
    const rndr::schema::amount_t& rhs) {
  return rhs > lhs ? rndr::schema::amount_t{0} : lhs - rhs;
}

}  // namespace rndr::execution
