#pragma once

#include <gtest/gtest.h>

#include <rndr/execution/engine.hpp>
#include <rndr/schema/encoding/scale/encoder.hpp>
#include <rndr/schema/escrow_state.hpp>
#include <rndr/schema/event_record.hpp>
#include <rndr/schema/genesis.hpp>
#include <rndr/schema/history_entry.hpp>
#include <rndr/schema/supply_audit.hpp>
#include <rndr/schema/token_state.hpp>
#include <rndr/schema/transaction.hpp>
#include <rndr/testing/common.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace rndr::testing {

using scale_encoder_t = rndr::schema::encoding::encoder<
    rndr::schema::encoding::scale_encoder_tag>;

inline const auto kTokenAddress = make_account(0xA1);
inline const auto kEscrowAddress = make_account(0xA2);
inline const auto kLegacyAddress = make_account(0xA3);
inline const auto kTokenOwner = make_account(0x01);
inline const auto kEscrowOwner = make_account(0x02);
inline const auto kLegacyOwner = make_account(0x03);
inline const auto kBridgeManager = make_account(0x04);
inline const auto kAlice = make_account(0x10);
inline const auto kBob = make_account(0x11);
inline const auto kCarol = make_account(0x12);
inline const auto kDave = make_account(0x13);

inline rndr::schema::genesis_t make_test_genesis(
    const bool with_legacy = true) {
  auto genesis = rndr::schema::genesis_t{};
  genesis.chain_name = "rndr-test-chain";
  genesis.token_address = kTokenAddress;
  genesis.escrow_address = kEscrowAddress;
  if (with_legacy) {
    genesis.legacy_token_address = kLegacyAddress;
  }
  genesis.token_owner = kTokenOwner;
  genesis.escrow_owner = kEscrowOwner;
  genesis.legacy_owner = kLegacyOwner;
  genesis.bridge_manager = kBridgeManager;
  return genesis;
}

inline rndr::schema::transaction_t make_transaction(
    const rndr::schema::hash32_t& chain_id,
    const uint64_t nonce,
    const rndr::schema::signer_id_t& signer,
    const rndr::schema::address_t& target,
    const rndr::schema::transaction_payload_t& payload) {
  return rndr::schema::transaction_t{
      .version = 1,
      .chain_id = chain_id,
      .nonce = nonce,
      .signer = signer,
      .target = target,
      .payload = payload,
      .signature = rndr::schema::ed25519_signature_t{}};
}

inline rndr::schema::bytes_t encode_transaction(
    const rndr::schema::transaction_t& tx) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(tx);
}

inline rndr::schema::bytes_t make_deposit_data(
    const rndr::schema::amount_t& amount) {
  auto word = rndr::schema::to_word(amount);
  return rndr::schema::bytes_t{std::begin(word), std::end(word)};
}

template <typename T>
T decode_query_value(const rndr::schema::query_result_t& result) {
  auto encoder = scale_encoder_t{};
  return encoder.decode<T>(
      rndr::schema::bytes_view_t{result.value.data(), result.value.size()});
}

template <typename Key>
rndr::schema::query_result_t run_query(rndr::execution::engine& engine,
                                       const std::string_view path,
                                       const Key& key) {
  auto encoder = scale_encoder_t{};
  const auto encoded = encoder.encode(key);
  return engine.query(
      path, rndr::schema::bytes_view_t{encoded.data(), encoded.size()});
}

inline uint64_t query_nonce(rndr::execution::engine& engine,
                            const rndr::schema::address_t& account) {
  const auto result = run_query(engine, "/account/nonce", account);
  EXPECT_EQ(result.code, 0u);
  return decode_query_value<uint64_t>(result);
}

inline rndr::schema::amount_t query_balance(
    rndr::execution::engine& engine,
    const rndr::schema::address_t& contract,
    const rndr::schema::address_t& account) {
  const auto result =
      run_query(engine, "/token/balance", std::tuple{contract, account});
  EXPECT_EQ(result.code, 0u);
  return decode_query_value<rndr::schema::amount_t>(result);
}

inline rndr::schema::amount_t query_balance(
    rndr::execution::engine& engine,
    const rndr::schema::address_t& account) {
  return query_balance(engine, kTokenAddress, account);
}

inline rndr::schema::amount_t query_allowance(
    rndr::execution::engine& engine,
    const rndr::schema::address_t& contract,
    const rndr::schema::address_t& owner,
    const rndr::schema::address_t& spender) {
  const auto result = run_query(engine, "/token/allowance",
                                std::tuple{contract, owner, spender});
  EXPECT_EQ(result.code, 0u);
  return decode_query_value<rndr::schema::amount_t>(result);
}

inline rndr::schema::token_state_t query_token_info(
    rndr::execution::engine& engine,
    const rndr::schema::address_t& contract) {
  const auto result = run_query(engine, "/token/info", contract);
  EXPECT_EQ(result.code, 0u);
  return decode_query_value<rndr::schema::token_state_t>(result);
}

inline rndr::schema::supply_audit_t query_audit(
    rndr::execution::engine& engine,
    const rndr::schema::address_t& contract) {
  const auto result = run_query(engine, "/token/audit", contract);
  EXPECT_EQ(result.code, 0u);
  return decode_query_value<rndr::schema::supply_audit_t>(result);
}

inline rndr::schema::amount_t query_user_balance(
    rndr::execution::engine& engine,
    const std::string_view user_id) {
  const auto result =
      run_query(engine, "/escrow/user_balance",
                std::tuple{kEscrowAddress, std::string{user_id}});
  EXPECT_EQ(result.code, 0u);
  return decode_query_value<rndr::schema::amount_t>(result);
}

inline rndr::schema::escrow_state_t query_escrow_info(
    rndr::execution::engine& engine) {
  const auto result = run_query(engine, "/escrow/info", kEscrowAddress);
  EXPECT_EQ(result.code, 0u);
  return decode_query_value<rndr::schema::escrow_state_t>(result);
}

inline std::vector<rndr::schema::event_record_t> query_events(
    rndr::execution::engine& engine,
    const uint64_t from_id,
    const uint64_t to_id) {
  const auto result =
      run_query(engine, "/events/range", std::tuple{from_id, to_id});
  EXPECT_EQ(result.code, 0u);
  return decode_query_value<std::vector<rndr::schema::event_record_t>>(result);
}

inline std::vector<rndr::schema::history_entry_t> query_history(
    rndr::execution::engine& engine,
    const uint64_t from_height,
    const uint64_t to_height) {
  const auto result = run_query(engine, "/history/range",
                                std::tuple{from_height, to_height});
  EXPECT_EQ(result.code, 0u);
  return decode_query_value<std::vector<rndr::schema::history_entry_t>>(
      result);
}

/// Finalize and commit `txs` as the block after the last committed one.
inline rndr::schema::block_result_t submit_block(
    rndr::execution::engine& engine,
    const std::vector<rndr::schema::bytes_t>& txs) {
  const auto height =
      static_cast<uint64_t>(engine.info().last_block_height) + 1;
  auto block = engine.finalize_block(height, txs);
  EXPECT_EQ(block.tx_results.size(), txs.size());
  (void)engine.commit();
  return block;
}

/// Sign as `caller` with the next committed nonce and run the call in its own
/// block.
inline rndr::schema::transaction_result_t submit(
    rndr::execution::engine& engine,
    const rndr::schema::address_t& caller,
    const rndr::schema::address_t& target,
    const rndr::schema::transaction_payload_t& payload) {
  const auto tx = make_transaction(engine.chain_id(),
                                   query_nonce(engine, caller),
                                   make_named_signer(caller), target, payload);
  auto block = submit_block(engine, {encode_transaction(tx)});
  if (block.tx_results.empty()) {
    return rndr::schema::transaction_result_t{.code = 0xFFFFFFFFu};
  }
  return block.tx_results.front();
}

inline rndr::schema::transaction_result_t submit_token(
    rndr::execution::engine& engine,
    const rndr::schema::address_t& caller,
    const rndr::schema::transaction_payload_t& payload) {
  return submit(engine, caller, kTokenAddress, payload);
}

inline rndr::schema::transaction_result_t submit_escrow(
    rndr::execution::engine& engine,
    const rndr::schema::address_t& caller,
    const rndr::schema::transaction_payload_t& payload) {
  return submit(engine, caller, kEscrowAddress, payload);
}

/// Bridge mint of `amount` to `user`.
inline void fund_account(rndr::execution::engine& engine,
                         const rndr::schema::address_t& user,
                         const rndr::schema::amount_t& amount) {
  const auto result = submit_token(
      engine, kBridgeManager,
      rndr::schema::deposit_t{.user = user,
                              .deposit_data = make_deposit_data(amount)});
  ASSERT_EQ(result.code, 0u) << result.info;
}

/// Point the token at the escrow contract installed by the test genesis.
inline void configure_escrow(rndr::execution::engine& engine) {
  const auto result = submit_token(
      engine, kTokenOwner,
      rndr::schema::set_escrow_contract_address_t{
          .escrow_contract_address = kEscrowAddress});
  ASSERT_EQ(result.code, 0u) << result.info;
}

inline uint32_t code_of(const rndr::schema::ledger_error_code code) {
  return static_cast<uint32_t>(code);
}

inline std::optional<std::string> find_attribute(
    const rndr::schema::transaction_event_t& event,
    const std::string_view key) {
  auto it = std::find_if(
      std::begin(event.attributes), std::end(event.attributes),
      [&](const auto& attribute) { return attribute.key == key; });
  if (it == std::end(event.attributes)) {
    return std::nullopt;
  }
  return it->value;
}

inline std::vector<std::string> event_types(
    const rndr::schema::transaction_result_t& result) {
  auto types = std::vector<std::string>{};
  types.reserve(result.events.size());
  for (const auto& event : result.events) {
    types.push_back(event.type);
  }
  return types;
}

}  // namespace rndr::testing
