#include <spdlog/spdlog.h>
#include <rndr/common/critical.hpp>
#include <rndr/execution/arithmetic.hpp>
#include <rndr/execution/contract_directory.hpp>
#include <rndr/execution/escrow_ledger.hpp>
#include <rndr/execution/events.hpp>
#include <rndr/schema/key/ledger_keys.hpp>

#include <string>
#include <utility>

using rndr::schema::ledger_error_code;

namespace rndr::execution {

escrow_ledger::escrow_ledger(rndr::schema::address_t address)
    : address_{address} {}

const rndr::schema::address_t& escrow_ledger::address() const {
  return address_;
}

outcome_t escrow_ledger::execute(
    call_context& context,
    const rndr::schema::transaction_payload_t& payload) const {
  return std::visit(
      overloaded{
          [&](const rndr::schema::fund_user_t& value) {
            return fund_user(context, value.user_id, value.amount);
          },
          [&](const rndr::schema::fund_job_t& value) {
            return fund_user(context, value.job_id, value.amount);
          },
          [&](const rndr::schema::disburse_funds_t& value) {
            return disburse_funds(context, value.user_id, value.recipients,
                                  value.amounts);
          },
          [&](const rndr::schema::disburse_job_t& value) {
            return disburse_funds(context, value.job_id, value.recipients,
                                  value.amounts);
          },
          [&](const rndr::schema::change_disbursal_address_t& value) {
            return change_disbursal_address(context, value.disbursal_address);
          },
          [&](const rndr::schema::change_render_token_address_t& value) {
            return change_render_token_address(context,
                                               value.render_token_address);
          },
          [&](const rndr::schema::transfer_ownership_t& value) {
            return transfer_ownership(context, value.new_owner);
          },
          [&](const auto&) {
            return fail(ledger_error_code::unsupported_operation,
                        "operation is not implemented by the escrow ledger");
          }},
      payload);
}

void escrow_ledger::initialize(
    state_scope& scope,
    const rndr::schema::escrow_state_t& state) const {
  save_state(scope, state);
  spdlog::info("Initialized escrow ledger {} for token {}",
               rndr::schema::to_string(address_),
               rndr::schema::to_string(state.render_token_address));
}

bool escrow_ledger::initialized(const state_scope& scope) const {
  auto& encoder = scope.encoder();
  return scope
      .get_raw(rndr::schema::key::make_escrow_state_key(encoder, address_))
      .has_value();
}

rndr::schema::escrow_state_t escrow_ledger::state(
    const state_scope& scope) const {
  auto& encoder = scope.encoder();
  auto state = scope.get<rndr::schema::escrow_state_t>(
      rndr::schema::key::make_escrow_state_key(encoder, address_));
  if (!state) {
    spdlog::error("Escrow ledger {} has no state row",
                  rndr::schema::to_string(address_));
    rndr::common::critical("escrow ledger state missing");
  }
  return *state;
}

rndr::schema::amount_t escrow_ledger::user_balance(
    const state_scope& scope,
    const std::string_view user_id) const {
  auto& encoder = scope.encoder();
  return scope
      .get<rndr::schema::amount_t>(rndr::schema::key::make_escrow_balance_key(
          encoder, address_, user_id))
      .value_or(rndr::schema::amount_t{0});
}

outcome_t escrow_ledger::fund_user(call_context& context,
                                   const std::string_view user_id,
                                   const rndr::schema::amount_t& amount) const {
  auto current = state(context.scope);
  if (context.caller != current.render_token_address) {
    return fail(ledger_error_code::not_authorized,
                "caller is not the render token");
  }
  auto held = checked_add(current.total_held, amount);
  auto updated = checked_add(user_balance(context.scope, user_id), amount);
  if (!held || !updated) {
    return fail(ledger_error_code::arithmetic_overflow,
                "escrow balance would overflow");
  }
  current.total_held = *held;
  save_state(context.scope, current);
  set_user_balance(context.scope, user_id, *updated);
  emit_user_balance(context.scope, user_id, *updated);
  return ok();
}

outcome_t escrow_ledger::disburse_funds(
    call_context& context,
    const std::string_view user_id,
    const std::vector<rndr::schema::address_t>& recipients,
    const std::vector<rndr::schema::amount_t>& amounts) const {
  auto current = state(context.scope);
  if (rndr::schema::is_null(current.disbursal_address) ||
      context.caller != current.disbursal_address) {
    return fail(ledger_error_code::not_authorized,
                "caller is not the disbursal address");
  }
  if (user_balance(context.scope, user_id) == 0) {
    return fail(ledger_error_code::no_balance,
                "user has no available balance");
  }
  if (recipients.size() != amounts.size()) {
    return fail(ledger_error_code::length_mismatch,
                "recipients and amounts must be the same length");
  }

  const auto* token =
      context.contracts.find_token(current.render_token_address);
  auto paid = std::size_t{0};
  auto leg_failure = outcome_t{};
  for (; paid < recipients.size(); ++paid) {
    auto leg = state_scope{context.scope};
    auto remaining = checked_sub(user_balance(leg, user_id), amounts[paid]);
    if (!remaining) {
      leg_failure = fail(ledger_error_code::insufficient_escrow_balance,
                         "amount exceeds remaining escrow balance");
      break;
    }
    if (token == nullptr) {
      leg_failure = fail(ledger_error_code::unknown_contract,
                         "render token address does not resolve to a token");
      break;
    }
    set_user_balance(leg, user_id, *remaining);
    auto leg_state = state(leg);
    leg_state.total_held -= amounts[paid];
    save_state(leg, leg_state);
    auto nested = call_context{
        .scope = leg, .caller = address_, .contracts = context.contracts};
    if (auto failed =
            token->transfer(nested, recipients[paid], amounts[paid])) {
      leg_failure = std::move(failed);
      break;
    }
    leg.commit();
  }

  auto remaining = user_balance(context.scope, user_id);
  emit_user_balance(context.scope, user_id, remaining);
  if (!leg_failure) {
    return ok();
  }

  spdlog::warn("Disbursal for '{}' stopped at leg {} of {}: {}", user_id,
               paid + 1, recipients.size(), leg_failure->message);
  leg_failure->partial = paid > 0;
  leg_failure->message = "paid " + std::to_string(paid) + " of " +
                         std::to_string(recipients.size()) +
                         " legs; leg index " + std::to_string(paid) + ": " +
                         leg_failure->message;
  return leg_failure;
}

outcome_t escrow_ledger::change_disbursal_address(
    call_context& context,
    const rndr::schema::address_t& disbursal_address) const {
  auto current = state(context.scope);
  if (auto failed = require_owner(context, current)) {
    return failed;
  }
  current.disbursal_address = disbursal_address;
  save_state(context.scope, current);
  context.scope.emit(
      address_,
      make_event("disbursal_address_update",
                 {{"disbursal_address",
                   rndr::schema::to_string(disbursal_address)}}));
  spdlog::info("Escrow {} disbursal address set to {}",
               rndr::schema::to_string(address_),
               rndr::schema::to_string(disbursal_address));
  return ok();
}

outcome_t escrow_ledger::change_render_token_address(
    call_context& context,
    const rndr::schema::address_t& render_token_address) const {
  auto current = state(context.scope);
  if (auto failed = require_owner(context, current)) {
    return failed;
  }
  if (rndr::schema::is_null(render_token_address)) {
    return fail(ledger_error_code::invalid_address,
                "render token address cannot be null");
  }
  current.render_token_address = render_token_address;
  save_state(context.scope, current);
  context.scope.emit(
      address_,
      make_event("render_token_address_update",
                 {{"render_token_address",
                   rndr::schema::to_string(render_token_address)}}));
  spdlog::info("Escrow {} render token address set to {}",
               rndr::schema::to_string(address_),
               rndr::schema::to_string(render_token_address));
  return ok();
}

outcome_t escrow_ledger::transfer_ownership(
    call_context& context,
    const rndr::schema::address_t& new_owner) const {
  auto current = state(context.scope);
  if (auto failed = require_owner(context, current)) {
    return failed;
  }
  if (rndr::schema::is_null(new_owner)) {
    return fail(ledger_error_code::invalid_address,
                "new owner cannot be null");
  }
  auto previous = current.owner;
  current.owner = new_owner;
  save_state(context.scope, current);
  context.scope.emit(
      address_,
      make_event("ownership_transferred",
                 {{"previous_owner", rndr::schema::to_string(previous)},
                  {"new_owner", rndr::schema::to_string(new_owner)}}));
  return ok();
}

outcome_t escrow_ledger::require_owner(
    const call_context& context,
    const rndr::schema::escrow_state_t& state) const {
  if (context.caller != state.owner) {
    return fail(ledger_error_code::not_owner, "caller is not the owner");
  }
  return ok();
}

void escrow_ledger::set_user_balance(
    state_scope& scope,
    const std::string_view user_id,
    const rndr::schema::amount_t& amount) const {
  auto& encoder = scope.encoder();
  auto key =
      rndr::schema::key::make_escrow_balance_key(encoder, address_, user_id);
  if (amount == 0) {
    scope.erase(key);
    return;
  }
  scope.put(key, amount);
}

void escrow_ledger::save_state(
    state_scope& scope,
    const rndr::schema::escrow_state_t& state) const {
  auto& encoder = scope.encoder();
  scope.put(rndr::schema::key::make_escrow_state_key(encoder, address_),
            state);
}

void escrow_ledger::emit_user_balance(
    state_scope& scope,
    const std::string_view user_id,
    const rndr::schema::amount_t& balance) const {
  scope.emit(address_,
             make_event("user_balance_update",
                        {{"user_id", std::string{user_id}},
                         {"balance", rndr::schema::to_string(balance)}}));
}

}  // namespace rndr::execution
