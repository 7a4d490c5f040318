#pragma once

#include <rndr/execution/call_context.hpp>
#include <rndr/execution/outcome.hpp>
#include <rndr/execution/ports.hpp>
#include <rndr/schema/escrow_state.hpp>
#include <rndr/schema/primitives.hpp>
#include <string_view>
#include <vector>

namespace rndr::execution {

/// Escrow sub-ledger bound to one contract address.
///
/// Holds per-user (per-job) balances that only the configured render token
/// may credit and only the disbursal address may pay out. The tokens backing
/// the balances sit in the token balance of this contract's address.
class escrow_ledger final : public contract, public escrow_port {
 public:
  explicit escrow_ledger(rndr::schema::address_t address);

  const rndr::schema::address_t& address() const override;
  outcome_t execute(
      call_context& context,
      const rndr::schema::transaction_payload_t& payload) const override;

  void initialize(state_scope& scope,
                  const rndr::schema::escrow_state_t& state) const;
  bool initialized(const state_scope& scope) const;

  rndr::schema::escrow_state_t state(const state_scope& scope) const;
  rndr::schema::amount_t user_balance(const state_scope& scope,
                                      std::string_view user_id) const;

  outcome_t fund_user(call_context& context,
                      std::string_view user_id,
                      const rndr::schema::amount_t& amount) const override;

  /// Pay recipients[i] amounts[i] out of the balance of `user_id`, in order.
  ///
  /// Each leg commits on its own. When a leg fails, the legs before it stay
  /// paid and the returned failure is marked partial; later legs never run.
  outcome_t disburse_funds(
      call_context& context,
      std::string_view user_id,
      const std::vector<rndr::schema::address_t>& recipients,
      const std::vector<rndr::schema::amount_t>& amounts) const;

  /// Null is accepted and disables disbursal.
  outcome_t change_disbursal_address(
      call_context& context,
      const rndr::schema::address_t& disbursal_address) const;
  outcome_t change_render_token_address(
      call_context& context,
      const rndr::schema::address_t& render_token_address) const;
  outcome_t transfer_ownership(call_context& context,
                               const rndr::schema::address_t& new_owner) const;

 private:
  outcome_t require_owner(const call_context& context,
                          const rndr::schema::escrow_state_t& state) const;
  void set_user_balance(state_scope& scope,
                        std::string_view user_id,
                        const rndr::schema::amount_t& amount) const;
  void save_state(state_scope& scope,
                  const rndr::schema::escrow_state_t& state) const;
  void emit_user_balance(state_scope& scope,
                         std::string_view user_id,
                         const rndr::schema::amount_t& balance) const;

  rndr::schema::address_t address_;
};

}  // namespace rndr::execution
