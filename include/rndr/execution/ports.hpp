#pragma once

#include <rndr/execution/call_context.hpp>
#include <rndr/execution/outcome.hpp>
#include <rndr/schema/primitives.hpp>
#include <rndr/schema/transaction.hpp>
#include <string_view>

namespace rndr::execution {

/// Addressable contract that executes transaction payloads.
class contract {
 public:
  virtual ~contract() = default;

  virtual const rndr::schema::address_t& address() const = 0;

  /// Run one payload; payloads the contract does not implement fail with
  /// `unsupported_operation`.
  virtual outcome_t execute(
      call_context& context,
      const rndr::schema::transaction_payload_t& payload) const = 0;
};

/// Token capabilities other contracts may call.
class token_port {
 public:
  virtual ~token_port() = default;

  virtual rndr::schema::amount_t balance_of(
      const state_scope& scope,
      const rndr::schema::address_t& account) const = 0;

  /// Move `amount` from `context.caller` to `to`.
  virtual outcome_t transfer(call_context& context,
                             const rndr::schema::address_t& to,
                             const rndr::schema::amount_t& amount) const = 0;

  /// Move `amount` from `from` to `to`, spending the allowance `from` granted
  /// to `context.caller`.
  virtual outcome_t transfer_from(
      call_context& context,
      const rndr::schema::address_t& from,
      const rndr::schema::address_t& to,
      const rndr::schema::amount_t& amount) const = 0;
};

/// Escrow capabilities other contracts may call.
class escrow_port {
 public:
  virtual ~escrow_port() = default;

  virtual outcome_t fund_user(call_context& context,
                              std::string_view user_id,
                              const rndr::schema::amount_t& amount) const = 0;
};

}  // namespace rndr::execution
