#pragma once
#include <rndr/schema/primitives.hpp>
#include <string>

namespace rndr::schema {

template <uint16_t Version>
struct fund_job;

template <>
struct fund_job<1> final {
  uint16_t version{1};
  std::string job_id;
  amount_t amount{};
};

using fund_job_t = fund_job<1>;

}  // namespace rndr::schema
