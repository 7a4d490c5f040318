#pragma once
#include <rndr/schema/primitives.hpp>
#include <string>

namespace rndr::schema {

template <uint16_t Version>
struct fund_user;

template <>
struct fund_user<1> final {
  uint16_t version{1};
  std::string user_id;
  amount_t amount{};
};

using fund_user_t = fund_user<1>;

}  // namespace rndr::schema
