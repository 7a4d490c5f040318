#pragma once
#include <rndr/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace rndr::blake3 {

rndr::schema::hash32_t hash(const std::string_view& str);
rndr::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

}  // namespace rndr::blake3
