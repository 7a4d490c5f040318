#pragma once

#include <rndr/schema/ledger_error_code.hpp>
#include <optional>
#include <string>
#include <utility>

namespace rndr::execution {

/// Why a ledger operation did not complete.
///
/// `partial` marks a failure after which the work already done must still be
/// committed (a disbursal that paid some legs before a leg failed).
struct failure final {
  rndr::schema::ledger_error_code code{};
  std::string message;
  bool partial{};
};

/// std::nullopt on success.
using outcome_t = std::optional<failure>;

inline outcome_t fail(const rndr::schema::ledger_error_code code,
                      std::string message) {
  return failure{.code = code, .message = std::move(message)};
}

inline outcome_t ok() {
  return std::nullopt;
}

}  // namespace rndr::execution
