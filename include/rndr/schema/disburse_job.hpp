#pragma once
#include <rndr/schema/primitives.hpp>
#include <string>
#include <vector>

namespace rndr::schema {

template <uint16_t Version>
struct disburse_job;

template <>
struct disburse_job<1> final {
  uint16_t version{1};
  std::string job_id;
  std::vector<address_t> recipients;
  std::vector<amount_t> amounts;
};

using disburse_job_t = disburse_job<1>;

}  // namespace rndr::schema
