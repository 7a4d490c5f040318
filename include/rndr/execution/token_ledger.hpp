#pragma once

#include <rndr/execution/call_context.hpp>
#include <rndr/execution/outcome.hpp>
#include <rndr/execution/ports.hpp>
#include <rndr/schema/primitives.hpp>
#include <rndr/schema/token_state.hpp>
#include <string_view>

namespace rndr::execution {

/// Fungible token ledger bound to one contract address.
///
/// Balances, allowances and the token_state row live in the state scope of
/// each call; the ledger object itself only knows its address. Every
/// mutating operation either applies all of its writes and notifications or
/// returns a failure and leaves the scope as it found it.
class token_ledger final : public contract, public token_port {
 public:
  explicit token_ledger(rndr::schema::address_t address);

  const rndr::schema::address_t& address() const override;
  outcome_t execute(
      call_context& context,
      const rndr::schema::transaction_payload_t& payload) const override;

  /// Write the initial token_state row.
  void initialize(state_scope& scope,
                  const rndr::schema::token_state_t& state) const;
  bool initialized(const state_scope& scope) const;

  rndr::schema::token_state_t state(const state_scope& scope) const;
  rndr::schema::amount_t balance_of(
      const state_scope& scope,
      const rndr::schema::address_t& account) const override;
  rndr::schema::amount_t allowance(
      const state_scope& scope,
      const rndr::schema::address_t& owner,
      const rndr::schema::address_t& spender) const;
  rndr::schema::amount_t total_supply(const state_scope& scope) const;

  outcome_t transfer(call_context& context,
                     const rndr::schema::address_t& to,
                     const rndr::schema::amount_t& amount) const override;
  outcome_t approve(call_context& context,
                    const rndr::schema::address_t& spender,
                    const rndr::schema::amount_t& amount) const;
  outcome_t increase_allowance(
      call_context& context,
      const rndr::schema::address_t& spender,
      const rndr::schema::amount_t& added_value) const;
  /// Never fails on underflow; the allowance bottoms out at zero.
  outcome_t decrease_allowance(
      call_context& context,
      const rndr::schema::address_t& spender,
      const rndr::schema::amount_t& subtracted_value) const;
  outcome_t transfer_from(call_context& context,
                          const rndr::schema::address_t& from,
                          const rndr::schema::address_t& to,
                          const rndr::schema::amount_t& amount) const override;

  /// Move tokens to the escrow contract and credit `user_id` there, as one
  /// step.
  outcome_t hold_in_escrow(call_context& context,
                           std::string_view user_id,
                           const rndr::schema::amount_t& amount) const;
  outcome_t set_escrow_contract_address(
      call_context& context,
      const rndr::schema::address_t& escrow_contract_address) const;

  /// Bridge mint; `deposit_data` is a single ABI encoded uint256.
  outcome_t deposit(call_context& context,
                    const rndr::schema::address_t& user,
                    const rndr::schema::bytes_t& deposit_data) const;
  /// Bridge burn of the caller's tokens.
  outcome_t withdraw(call_context& context,
                     const rndr::schema::amount_t& amount) const;
  outcome_t migrate(call_context& context) const;
  outcome_t mint(call_context& context,
                 const rndr::schema::address_t& to,
                 const rndr::schema::amount_t& amount) const;

  outcome_t update_bridge_manager(
      call_context& context,
      const rndr::schema::address_t& bridge_manager) const;
  outcome_t transfer_ownership(call_context& context,
                               const rndr::schema::address_t& new_owner) const;

 private:
  outcome_t require_owner(const call_context& context,
                          const rndr::schema::token_state_t& state) const;
  outcome_t move_balance(state_scope& scope,
                         const rndr::schema::address_t& from,
                         const rndr::schema::address_t& to,
                         const rndr::schema::amount_t& amount) const;
  outcome_t mint_to(state_scope& scope,
                    const rndr::schema::address_t& to,
                    const rndr::schema::amount_t& amount) const;
  void set_balance(state_scope& scope,
                   const rndr::schema::address_t& account,
                   const rndr::schema::amount_t& amount) const;
  void set_allowance(state_scope& scope,
                     const rndr::schema::address_t& owner,
                     const rndr::schema::address_t& spender,
                     const rndr::schema::amount_t& amount) const;
  void save_state(state_scope& scope,
                  const rndr::schema::token_state_t& state) const;
  void emit_transfer(state_scope& scope,
                     const rndr::schema::address_t& from,
                     const rndr::schema::address_t& to,
                     const rndr::schema::amount_t& amount) const;
  void emit_approval(state_scope& scope,
                     const rndr::schema::address_t& owner,
                     const rndr::schema::address_t& spender,
                     const rndr::schema::amount_t& amount) const;

  rndr::schema::address_t address_;
};

}  // namespace rndr::execution
