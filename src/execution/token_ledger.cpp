#include <spdlog/spdlog.h>
#include <rndr/common/critical.hpp>
#include <rndr/execution/arithmetic.hpp>
#include <rndr/execution/contract_directory.hpp>
#include <rndr/execution/events.hpp>
#include <rndr/execution/token_ledger.hpp>
#include <rndr/schema/key/ledger_keys.hpp>

#include <algorithm>
#include <string>
#include <utility>

using rndr::schema::ledger_error_code;

namespace rndr::execution {

namespace {

std::string hex(const rndr::schema::address_t& address) {
  return rndr::schema::to_string(address);
}

std::string decimal(const rndr::schema::amount_t& amount) {
  return rndr::schema::to_string(amount);
}

}  // namespace

token_ledger::token_ledger(rndr::schema::address_t address)
    : address_{address} {}

const rndr::schema::address_t& token_ledger::address() const {
  return address_;
}

outcome_t token_ledger::execute(
    call_context& context,
    const rndr::schema::transaction_payload_t& payload) const {
  return std::visit(
      overloaded{
          [&](const rndr::schema::transfer_t& value) {
            return transfer(context, value.to, value.amount);
          },
          [&](const rndr::schema::approve_t& value) {
            return approve(context, value.spender, value.amount);
          },
          [&](const rndr::schema::increase_allowance_t& value) {
            return increase_allowance(context, value.spender,
                                      value.added_value);
          },
          [&](const rndr::schema::decrease_allowance_t& value) {
            return decrease_allowance(context, value.spender,
                                      value.subtracted_value);
          },
          [&](const rndr::schema::transfer_from_t& value) {
            return transfer_from(context, value.from, value.to, value.amount);
          },
          [&](const rndr::schema::hold_in_escrow_t& value) {
            return hold_in_escrow(context, value.user_id, value.amount);
          },
          [&](const rndr::schema::set_escrow_contract_address_t& value) {
            return set_escrow_contract_address(context,
                                               value.escrow_contract_address);
          },
          [&](const rndr::schema::deposit_t& value) {
            return deposit(context, value.user, value.deposit_data);
          },
          [&](const rndr::schema::withdraw_t& value) {
            return withdraw(context, value.amount);
          },
          [&](const rndr::schema::migrate_t&) { return migrate(context); },
          [&](const rndr::schema::mint_t& value) {
            return mint(context, value.to, value.amount);
          },
          [&](const rndr::schema::update_bridge_manager_t& value) {
            return update_bridge_manager(context, value.bridge_manager);
          },
          [&](const rndr::schema::transfer_ownership_t& value) {
            return transfer_ownership(context, value.new_owner);
          },
          [&](const auto&) {
            return fail(ledger_error_code::unsupported_operation,
                        "operation is not implemented by the token ledger");
          }},
      payload);
}

void token_ledger::initialize(state_scope& scope,
                              const rndr::schema::token_state_t& state) const {
  save_state(scope, state);
  spdlog::info("Initialized token ledger {} ({}/{})", hex(address_),
               state.name, state.symbol);
}

bool token_ledger::initialized(const state_scope& scope) const {
  auto& encoder = scope.encoder();
  return scope
      .get_raw(rndr::schema::key::make_token_state_key(encoder, address_))
      .has_value();
}

rndr::schema::token_state_t token_ledger::state(
    const state_scope& scope) const {
  auto& encoder = scope.encoder();
  auto state = scope.get<rndr::schema::token_state_t>(
      rndr::schema::key::make_token_state_key(encoder, address_));
  if (!state) {
    spdlog::error("Token ledger {} has no state row", hex(address_));
    rndr::common::critical("token ledger state missing");
  }
  return *state;
}

rndr::schema::amount_t token_ledger::balance_of(
    const state_scope& scope,
    const rndr::schema::address_t& account) const {
  auto& encoder = scope.encoder();
  return scope
      .get<rndr::schema::amount_t>(
          rndr::schema::key::make_token_balance_key(encoder, address_,
                                                    account))
      .value_or(rndr::schema::amount_t{0});
}

rndr::schema::amount_t token_ledger::allowance(
    const state_scope& scope,
    const rndr::schema::address_t& owner,
    const rndr::schema::address_t& spender) const {
  auto& encoder = scope.encoder();
  return scope
      .get<rndr::schema::amount_t>(rndr::schema::key::make_token_allowance_key(
          encoder, address_, owner, spender))
      .value_or(rndr::schema::amount_t{0});
}

rndr::schema::amount_t token_ledger::total_supply(
    const state_scope& scope) const {
  return state(scope).total_supply;
}

outcome_t token_ledger::transfer(call_context& context,
                                 const rndr::schema::address_t& to,
                                 const rndr::schema::amount_t& amount) const {
  if (auto failed = move_balance(context.scope, context.caller, to, amount)) {
    return failed;
  }
  emit_transfer(context.scope, context.caller, to, amount);
  return ok();
}

outcome_t token_ledger::approve(call_context& context,
                                const rndr::schema::address_t& spender,
                                const rndr::schema::amount_t& amount) const {
  if (rndr::schema::is_null(spender)) {
    return fail(ledger_error_code::invalid_address,
                "approve to the null address");
  }
  set_allowance(context.scope, context.caller, spender, amount);
  emit_approval(context.scope, context.caller, spender, amount);
  return ok();
}

outcome_t token_ledger::increase_allowance(
    call_context& context,
    const rndr::schema::address_t& spender,
    const rndr::schema::amount_t& added_value) const {
  if (rndr::schema::is_null(spender)) {
    return fail(ledger_error_code::invalid_address,
                "approve to the null address");
  }
  auto updated = checked_add(allowance(context.scope, context.caller, spender),
                             added_value);
  if (!updated) {
    return fail(ledger_error_code::arithmetic_overflow,
                "allowance would overflow");
  }
  set_allowance(context.scope, context.caller, spender, *updated);
  emit_approval(context.scope, context.caller, spender, *updated);
  return ok();
}

outcome_t token_ledger::decrease_allowance(
    call_context& context,
    const rndr::schema::address_t& spender,
    const rndr::schema::amount_t& subtracted_value) const {
  if (rndr::schema::is_null(spender)) {
    return fail(ledger_error_code::invalid_address,
                "approve to the null address");
  }
  auto updated = saturating_sub(
      allowance(context.scope, context.caller, spender), subtracted_value);
  set_allowance(context.scope, context.caller, spender, updated);
  emit_approval(context.scope, context.caller, spender, updated);
  return ok();
}

outcome_t token_ledger::transfer_from(
    call_context& context,
    const rndr::schema::address_t& from,
    const rndr::schema::address_t& to,
    const rndr::schema::amount_t& amount) const {
  if (rndr::schema::is_null(from)) {
    return fail(ledger_error_code::invalid_address,
                "transfer from the null address");
  }
  if (rndr::schema::is_null(to)) {
    return fail(ledger_error_code::invalid_recipient,
                "transfer to the null address");
  }
  auto remaining =
      checked_sub(allowance(context.scope, from, context.caller), amount);
  if (!remaining) {
    return fail(ledger_error_code::insufficient_allowance,
                "transfer amount exceeds allowance");
  }
  if (auto failed = move_balance(context.scope, from, to, amount)) {
    return failed;
  }
  set_allowance(context.scope, from, context.caller, *remaining);
  emit_transfer(context.scope, from, to, amount);
  emit_approval(context.scope, from, context.caller, *remaining);
  return ok();
}

outcome_t token_ledger::hold_in_escrow(
    call_context& context,
    const std::string_view user_id,
    const rndr::schema::amount_t& amount) const {
  auto current = state(context.scope);
  if (rndr::schema::is_null(current.escrow_contract_address)) {
    return fail(ledger_error_code::escrow_not_configured,
                "escrow contract address is not set");
  }
  const auto* escrow =
      context.contracts.find_escrow(current.escrow_contract_address);
  if (escrow == nullptr) {
    return fail(ledger_error_code::unknown_contract,
                "escrow contract address does not resolve to an escrow ledger");
  }

  // The debit must never be visible without the matching escrow credit.
  auto step = state_scope{context.scope};
  if (auto failed = move_balance(step, context.caller,
                                 current.escrow_contract_address, amount)) {
    return failed;
  }
  emit_transfer(step, context.caller, current.escrow_contract_address,
                amount);

  auto nested = call_context{
      .scope = step, .caller = address_, .contracts = context.contracts};
  if (auto failed = escrow->fund_user(nested, user_id, amount)) {
    return failed;
  }
  step.emit(address_, make_event("tokens_escrowed",
                                 {{"sender", hex(context.caller)},
                                  {"user_id", std::string{user_id}},
                                  {"amount", decimal(amount)}}));
  step.commit();
  return ok();
}

outcome_t token_ledger::set_escrow_contract_address(
    call_context& context,
    const rndr::schema::address_t& escrow_contract_address) const {
  auto current = state(context.scope);
  if (auto failed = require_owner(context, current)) {
    return failed;
  }
  if (rndr::schema::is_null(escrow_contract_address)) {
    return fail(ledger_error_code::invalid_address,
                "escrow contract address cannot be null");
  }
  current.escrow_contract_address = escrow_contract_address;
  save_state(context.scope, current);
  context.scope.emit(
      address_, make_event("escrow_contract_address_update",
                           {{"escrow_contract_address",
                             hex(escrow_contract_address)}}));
  spdlog::info("Token {} escrow contract address set to {}", hex(address_),
               hex(escrow_contract_address));
  return ok();
}

outcome_t token_ledger::deposit(call_context& context,
                                const rndr::schema::address_t& user,
                                const rndr::schema::bytes_t& deposit_data)
    const {
  auto current = state(context.scope);
  if (rndr::schema::is_null(current.bridge_manager) ||
      context.caller != current.bridge_manager) {
    return fail(ledger_error_code::not_authorized,
                "caller is not the bridge manager");
  }
  auto word = rndr::schema::amount_word_t{};
  if (deposit_data.size() != word.size()) {
    return fail(ledger_error_code::invalid_deposit_data,
                "deposit data must be one 32 byte word");
  }
  std::copy(std::begin(deposit_data), std::end(deposit_data), std::begin(word));
  auto amount = rndr::schema::from_word(word);
  if (auto failed = mint_to(context.scope, user, amount)) {
    return failed;
  }
  emit_transfer(context.scope, rndr::schema::make_null_address(), user,
                amount);
  return ok();
}

outcome_t token_ledger::withdraw(call_context& context,
                                 const rndr::schema::amount_t& amount) const {
  auto remaining =
      checked_sub(balance_of(context.scope, context.caller), amount);
  if (!remaining) {
    return fail(ledger_error_code::insufficient_balance,
                "burn amount exceeds balance");
  }
  auto current = state(context.scope);
  current.total_supply -= amount;
  auto burned = checked_add(current.total_burned, amount);
  if (!burned) {
    return fail(ledger_error_code::arithmetic_overflow,
                "burned total would overflow");
  }
  current.total_burned = *burned;
  set_balance(context.scope, context.caller, *remaining);
  save_state(context.scope, current);
  emit_transfer(context.scope, context.caller,
                rndr::schema::make_null_address(), amount);
  return ok();
}

outcome_t token_ledger::migrate(call_context& context) const {
  auto current = state(context.scope);
  if (rndr::schema::is_null(current.legacy_token_address)) {
    return fail(ledger_error_code::migration_unavailable,
                "no legacy token is configured");
  }
  const auto* legacy =
      context.contracts.find_token(current.legacy_token_address);
  if (legacy == nullptr) {
    return fail(ledger_error_code::migration_unavailable,
                "legacy token address does not resolve to a token ledger");
  }

  auto amount = legacy->balance_of(context.scope, context.caller);
  auto nested = call_context{.scope = context.scope,
                             .caller = address_,
                             .contracts = context.contracts};
  if (auto failed =
          legacy->transfer_from(nested, context.caller, address_, amount)) {
    return failed;
  }
  if (auto failed = mint_to(context.scope, context.caller, amount)) {
    return failed;
  }
  context.scope.emit(address_, make_event("migration",
                                          {{"account", hex(context.caller)},
                                           {"amount", decimal(amount)}}));
  emit_transfer(context.scope, rndr::schema::make_null_address(),
                context.caller, amount);
  return ok();
}

outcome_t token_ledger::mint(call_context& context,
                             const rndr::schema::address_t& to,
                             const rndr::schema::amount_t& amount) const {
  auto current = state(context.scope);
  if (!current.owner_mintable || context.caller != current.owner) {
    return fail(ledger_error_code::not_authorized,
                "minting is restricted to the owner of a mintable ledger");
  }
  if (auto failed = mint_to(context.scope, to, amount)) {
    return failed;
  }
  emit_transfer(context.scope, rndr::schema::make_null_address(), to, amount);
  return ok();
}

outcome_t token_ledger::update_bridge_manager(
    call_context& context,
    const rndr::schema::address_t& bridge_manager) const {
  auto current = state(context.scope);
  if (auto failed = require_owner(context, current)) {
    return failed;
  }
  if (rndr::schema::is_null(bridge_manager)) {
    return fail(ledger_error_code::invalid_address,
                "bridge manager cannot be null");
  }
  current.bridge_manager = bridge_manager;
  save_state(context.scope, current);
  context.scope.emit(address_,
                     make_event("bridge_manager_update",
                                {{"bridge_manager", hex(bridge_manager)}}));
  spdlog::info("Token {} bridge manager set to {}", hex(address_),
               hex(bridge_manager));
  return ok();
}

outcome_t token_ledger::transfer_ownership(
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
  context.scope.emit(address_, make_event("ownership_transferred",
                                          {{"previous_owner", hex(previous)},
                                           {"new_owner", hex(new_owner)}}));
  spdlog::info("Token {} ownership transferred to {}", hex(address_),
               hex(new_owner));
  return ok();
}

outcome_t token_ledger::require_owner(
    const call_context& context,
    const rndr::schema::token_state_t& state) const {
  if (context.caller != state.owner) {
    return fail(ledger_error_code::not_owner, "caller is not the owner");
  }
  return ok();
}

outcome_t token_ledger::move_balance(
    state_scope& scope,
    const rndr::schema::address_t& from,
    const rndr::schema::address_t& to,
    const rndr::schema::amount_t& amount) const {
  if (rndr::schema::is_null(to)) {
    return fail(ledger_error_code::invalid_recipient,
                "transfer to the null address");
  }
  auto debited = checked_sub(balance_of(scope, from), amount);
  if (!debited) {
    return fail(ledger_error_code::insufficient_balance,
                "transfer amount exceeds balance");
  }
  set_balance(scope, from, *debited);
  // Cannot overflow: total supply bounds every balance.
  set_balance(scope, to, balance_of(scope, to) + amount);
  return ok();
}

outcome_t token_ledger::mint_to(state_scope& scope,
                                const rndr::schema::address_t& to,
                                const rndr::schema::amount_t& amount) const {
  if (rndr::schema::is_null(to)) {
    return fail(ledger_error_code::invalid_recipient,
                "mint to the null address");
  }
  auto current = state(scope);
  auto supply = checked_add(current.total_supply, amount);
  auto minted = checked_add(current.total_minted, amount);
  if (!supply || !minted) {
    return fail(ledger_error_code::arithmetic_overflow,
                "total supply would overflow");
  }
  current.total_supply = *supply;
  current.total_minted = *minted;
  set_balance(scope, to, balance_of(scope, to) + amount);
  save_state(scope, current);
  return ok();
}

void token_ledger::set_balance(state_scope& scope,
                               const rndr::schema::address_t& account,
                               const rndr::schema::amount_t& amount) const {
  auto& encoder = scope.encoder();
  auto key =
      rndr::schema::key::make_token_balance_key(encoder, address_, account);
  if (amount == 0) {
    scope.erase(key);
    return;
  }
  scope.put(key, amount);
}

void token_ledger::set_allowance(state_scope& scope,
                                 const rndr::schema::address_t& owner,
                                 const rndr::schema::address_t& spender,
                                 const rndr::schema::amount_t& amount) const {
  auto& encoder = scope.encoder();
  auto key = rndr::schema::key::make_token_allowance_key(encoder, address_,
                                                         owner, spender);
  if (amount == 0) {
    scope.erase(key);
    return;
  }
  scope.put(key, amount);
}

void token_ledger::save_state(state_scope& scope,
                              const rndr::schema::token_state_t& state) const {
  auto& encoder = scope.encoder();
  scope.put(rndr::schema::key::make_token_state_key(encoder, address_), state);
}

void token_ledger::emit_transfer(state_scope& scope,
                                 const rndr::schema::address_t& from,
                                 const rndr::schema::address_t& to,
                                 const rndr::schema::amount_t& amount) const {
  scope.emit(address_,
             make_event("transfer", {{"from", hex(from)},
                                     {"to", hex(to)},
                                     {"value", decimal(amount)}}));
}

void token_ledger::emit_approval(state_scope& scope,
                                 const rndr::schema::address_t& owner,
                                 const rndr::schema::address_t& spender,
                                 const rndr::schema::amount_t& amount) const {
  scope.emit(address_,
             make_event("approval", {{"owner", hex(owner)},
                                     {"spender", hex(spender)},
                                     {"value", decimal(amount)}}));
}

}  // namespace rndr::execution
