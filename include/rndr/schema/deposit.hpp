#pragma once
#include <rndr/schema/primitives.hpp>

// Bridge mint. deposit_data carries one ABI encoded uint256 word.
namespace rndr::schema {

template <uint16_t Version>
struct deposit;

template <>
struct deposit<1> final {
  uint16_t version{1};
  address_t user{};
  bytes_t deposit_data;
};

using deposit_t = deposit<1>;

}  // namespace rndr::schema
