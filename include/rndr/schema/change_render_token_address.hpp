#pragma once
#include <rndr/schema/primitives.hpp>

namespace rndr::schema {

template <uint16_t Version>
struct change_render_token_address;

template <>
struct change_render_token_address<1> final {
  uint16_t version{1};
  address_t render_token_address{};
};

using change_render_token_address_t = change_render_token_address<1>;

}  // namespace rndr::schema
