#pragma once
#include <rndr/schema/primitives.hpp>

namespace rndr::schema {

template <uint16_t Version>
struct update_bridge_manager;

template <>
struct update_bridge_manager<1> final {
  uint16_t version{1};
  address_t bridge_manager{};
};

using update_bridge_manager_t = update_bridge_manager<1>;

}  // namespace rndr::schema
