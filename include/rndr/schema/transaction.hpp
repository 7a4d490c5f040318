#pragma once
#include <rndr/schema/approve.hpp>
#include <rndr/schema/change_disbursal_address.hpp>
#include <rndr/schema/change_render_token_address.hpp>
#include <rndr/schema/decrease_allowance.hpp>
#include <rndr/schema/deposit.hpp>
#include <rndr/schema/disburse_funds.hpp>
#include <rndr/schema/disburse_job.hpp>
#include <rndr/schema/fund_job.hpp>
#include <rndr/schema/fund_user.hpp>
#include <rndr/schema/hold_in_escrow.hpp>
#include <rndr/schema/increase_allowance.hpp>
#include <rndr/schema/migrate.hpp>
#include <rndr/schema/mint.hpp>
#include <rndr/schema/primitives.hpp>
#include <rndr/schema/set_escrow_contract_address.hpp>
#include <rndr/schema/transfer.hpp>
#include <rndr/schema/transfer_from.hpp>
#include <rndr/schema/transfer_ownership.hpp>
#include <rndr/schema/update_bridge_manager.hpp>
#include <rndr/schema/withdraw.hpp>
#include <tuple>
#include <variant>

namespace rndr::schema {

// Alternative order is part of the wire format; append only.
using transaction_payload_t = std::variant<transfer_t,
                                           approve_t,
                                           increase_allowance_t,
                                           decrease_allowance_t,
                                           transfer_from_t,
                                           hold_in_escrow_t,
                                           set_escrow_contract_address_t,
                                           deposit_t,
                                           withdraw_t,
                                           migrate_t,
                                           mint_t,
                                           update_bridge_manager_t,
                                           transfer_ownership_t,
                                           fund_user_t,
                                           fund_job_t,
                                           disburse_funds_t,
                                           disburse_job_t,
                                           change_disbursal_address_t,
                                           change_render_token_address_t>;

template <uint16_t Version>
struct transaction;

/// Signed call of one operation on the contract at `target`.
template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  signer_id_t signer{};
  address_t target{};
  transaction_payload_t payload{};
  signature_t signature;
};

using transaction_t = transaction<1>;

/// Bytes covered by the signature: every field except the signature.
template <typename Encoder>
bytes_t make_signing_payload(Encoder& encoder, const transaction_t& tx) {
  return encoder.encode(std::tuple{tx.version, tx.chain_id, tx.nonce,
                                   tx.signer, tx.target, tx.payload});
}

}  // namespace rndr::schema
