#pragma once

#include <rndr/execution/contract_directory.hpp>
#include <rndr/execution/escrow_ledger.hpp>
#include <rndr/execution/signature_verifier.hpp>
#include <rndr/execution/state_scope.hpp>
#include <rndr/execution/token_ledger.hpp>
#include <rndr/schema/app_info.hpp>
#include <rndr/schema/block_result.hpp>
#include <rndr/schema/commit_result.hpp>
#include <rndr/schema/encoding/scale/encoder.hpp>
#include <rndr/schema/event_record.hpp>
#include <rndr/schema/genesis.hpp>
#include <rndr/schema/history_entry.hpp>
#include <rndr/schema/primitives.hpp>
#include <rndr/schema/query_result.hpp>
#include <rndr/schema/transaction.hpp>
#include <rndr/schema/transaction_result.hpp>
#include <rndr/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace rndr::execution {

/// Deterministic state machine hosting the token, escrow and legacy token
/// ledgers behind the gRPC service.
///
/// Every entry point takes the same mutex, so one transaction runs to
/// completion before the next one starts. Transactions of a block execute in
/// order against a block scope that `commit()` flushes to RocksDB in one
/// write batch; queries only ever see committed state.
class engine final {
 public:
  /// Open the engine over `storage`.
  ///
  /// On an empty database `genesis` is written as block 0. On an existing
  /// database the persisted genesis wins and a differing `genesis` is only
  /// reported. `require_strict_crypto` enables signature verification;
  /// when false, signatures are not checked and named signers are accepted.
  explicit engine(encoder_t& encoder,
                  storage_t& storage,
                  const rndr::schema::genesis_t& genesis,
                  bool require_strict_crypto = true);

  /// Admit a transaction for the mempool (CheckTx semantics).
  ///
  /// Decodes and validates the envelope against committed state only; never
  /// mutates state.
  rndr::schema::transaction_result_t check_transaction(
      const rndr::schema::bytes_view_t& raw_tx);

  /// Execute a candidate block and compute its resulting state root.
  ///
  /// Transactions are processed in order; per-tx results are returned even on
  /// failures.
  rndr::schema::block_result_t finalize_block(
      uint64_t height,
      const std::vector<rndr::schema::bytes_t>& txs);

  /// Persist the latest finalized block and its checkpoint.
  rndr::schema::commit_result_t commit();

  /// Return application metadata (latest committed height and state root).
  rndr::schema::app_info_t info() const;

  /// Execute a read-path query by route against committed state.
  rndr::schema::query_result_t query(std::string_view path,
                                     const rndr::schema::bytes_view_t& data);

  /// History entries in the inclusive height range.
  std::vector<rndr::schema::history_entry_t> history(uint64_t from_height,
                                                     uint64_t to_height) const;

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

  const rndr::schema::hash32_t& chain_id() const;

 private:
  rndr::schema::transaction_result_t validate_transaction(
      const rndr::schema::transaction_t& tx,
      const state_scope& scope,
      std::string_view codespace) const;

  rndr::schema::transaction_result_t execute_transaction(
      state_scope& block,
      const rndr::schema::bytes_t& raw_tx,
      uint64_t height,
      uint32_t index,
      uint64_t& next_event_id);

  std::vector<rndr::schema::history_entry_t> load_history(
      uint64_t from_height,
      uint64_t to_height) const;
  std::vector<rndr::schema::event_record_t> load_events(uint64_t from_id,
                                                        uint64_t to_id) const;

  const token_ledger* find_token_ledger(
      const rndr::schema::address_t& address) const;
  const escrow_ledger* find_escrow_ledger(
      const rndr::schema::address_t& address) const;

  void install_contracts(const rndr::schema::genesis_t& genesis);
  void apply_genesis(const rndr::schema::genesis_t& genesis);
  void load_persisted_state(const rndr::schema::genesis_t& configured);

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  rndr::schema::genesis_t genesis_;
  contract_directory contracts_;
  const token_ledger* token_{nullptr};
  const token_ledger* legacy_token_{nullptr};
  const escrow_ledger* escrow_{nullptr};
  int64_t last_committed_height_{};
  rndr::schema::hash32_t last_committed_state_root_{};
  int64_t pending_height_{};
  rndr::schema::hash32_t pending_state_root_{};
  std::unique_ptr<state_scope> pending_block_;
  rndr::schema::hash32_t chain_id_{};
  bool require_strict_crypto_{true};
  signature_verifier_t signature_verifier_;
};

}  // namespace rndr::execution
