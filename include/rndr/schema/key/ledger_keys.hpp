#pragma once

#include <rndr/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>

// Schema key type: ledger keys.
// Canonical key prefixes and key codecs for token, escrow, engine, history
// and event rows. Every key is SCALE(prefix) followed by SCALE(id), so a key
// built from a leading subset of the id tuple is a prefix of every full key.
namespace rndr::schema::key {

inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kGenesisKey{"SYS|STATE|GENESIS|"};
inline constexpr std::string_view kEventSeqKey{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kTokenStatePrefix{"TOKEN|STATE|"};
inline constexpr std::string_view kTokenBalancePrefix{"TOKEN|BAL|"};
inline constexpr std::string_view kTokenAllowancePrefix{"TOKEN|ALW|"};
inline constexpr std::string_view kEscrowStatePrefix{"ESCROW|STATE|"};
inline constexpr std::string_view kEscrowBalancePrefix{"ESCROW|BAL|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

template <typename Encoder, typename T>
rndr::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                        std::string_view prefix,
                                        const T& id) {
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
rndr::schema::bytes_t make_prefix_key(Encoder& encoder,
                                      std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
rndr::schema::bytes_t make_nonce_key(Encoder& encoder,
                                     const rndr::schema::address_t& account) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, account);
}

template <typename Encoder>
rndr::schema::bytes_t make_genesis_key(Encoder& encoder) {
  return make_prefix_key(encoder, kGenesisKey);
}

template <typename Encoder>
rndr::schema::bytes_t make_event_seq_key(Encoder& encoder) {
  return make_prefix_key(encoder, kEventSeqKey);
}

template <typename Encoder>
rndr::schema::bytes_t make_token_state_key(
    Encoder& encoder,
    const rndr::schema::address_t& contract) {
  return make_prefixed_key(encoder, kTokenStatePrefix, contract);
}

template <typename Encoder>
rndr::schema::bytes_t make_token_balance_key(
    Encoder& encoder,
    const rndr::schema::address_t& contract,
    const rndr::schema::address_t& account) {
  return make_prefixed_key(encoder, kTokenBalancePrefix,
                           std::tuple{contract, account});
}

/// Prefix shared by every balance row of one token contract.
template <typename Encoder>
rndr::schema::bytes_t make_token_balance_prefix(
    Encoder& encoder,
    const rndr::schema::address_t& contract) {
  return make_prefixed_key(encoder, kTokenBalancePrefix, contract);
}

template <typename Encoder>
rndr::schema::bytes_t make_token_allowance_key(
    Encoder& encoder,
    const rndr::schema::address_t& contract,
    const rndr::schema::address_t& owner,
    const rndr::schema::address_t& spender) {
  return make_prefixed_key(encoder, kTokenAllowancePrefix,
                           std::tuple{contract, owner, spender});
}

template <typename Encoder>
rndr::schema::bytes_t make_escrow_state_key(
    Encoder& encoder,
    const rndr::schema::address_t& contract) {
  return make_prefixed_key(encoder, kEscrowStatePrefix, contract);
}

template <typename Encoder>
rndr::schema::bytes_t make_escrow_balance_key(
    Encoder& encoder,
    const rndr::schema::address_t& contract,
    const std::string_view user_id) {
  return make_prefixed_key(encoder, kEscrowBalancePrefix,
                           std::tuple{contract, std::string{user_id}});
}

template <typename Encoder>
rndr::schema::bytes_t make_history_key(Encoder& encoder,
                                       const uint64_t height,
                                       const uint32_t index) {
  return make_prefixed_key(encoder, kHistoryPrefix, std::tuple{height, index});
}

template <typename Encoder>
rndr::schema::bytes_t make_event_key(Encoder& encoder,
                                     const uint64_t event_id) {
  return make_prefixed_key(encoder, kEventPrefix, event_id);
}

}  // namespace rndr::schema::key
