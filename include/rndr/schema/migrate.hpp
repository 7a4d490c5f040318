#pragma once
#include <rndr/schema/primitives.hpp>

// Swap the caller's whole legacy token balance for new tokens.
namespace rndr::schema {

template <uint16_t Version>
struct migrate;

template <>
struct migrate<1> final {
  uint16_t version{1};
};

using migrate_t = migrate<1>;

}  // namespace rndr::schema
