#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <limits>
#include <rndr/blake3/hash.hpp>
#include <rndr/common/critical.hpp>
#include <rndr/crypto/verify.hpp>
#include <rndr/execution/engine.hpp>
#include <rndr/schema/key/ledger_keys.hpp>
#include <rndr/schema/query_error_code.hpp>
#include <rndr/schema/supply_audit.hpp>
#include <string>
#include <tuple>
#include <utility>

using namespace rndr::schema;

namespace {

constexpr auto kCheckTxCodespace = std::string_view{"rndr.checktx"};
constexpr auto kFinalizeCodespace = std::string_view{"rndr.finalize"};
constexpr auto kLedgerCodespace = std::string_view{"rndr.ledger"};
constexpr auto kQueryCodespace = std::string_view{"rndr.query"};
constexpr auto kMaxQueryRange = uint64_t{1024};
constexpr auto kFirstNonce = uint64_t{1};
constexpr auto kFirstEventId = uint64_t{1};

hash32_t fold_state_root(rndr::execution::encoder_t& encoder,
                         const hash32_t& seed,
                         const bytes_t& tx,
                         uint64_t height,
                         uint32_t index,
                         uint32_t code) {
  auto material = bytes_t{};
  material.reserve(seed.size() + tx.size() + 32);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));
  encoder.encode(std::tuple{height, index, code}, material);
  return rndr::blake3::hash(bytes_view_t{material.data(), material.size()});
}

transaction_result_t make_error_result(const ledger_error_code code,
                                       std::string info,
                                       const std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

void fail_query(query_result_t& result,
                const query_error_code code,
                std::string log) {
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.value.clear();
}

rndr::execution::emitted_event with_contract(
    rndr::execution::emitted_event emitted) {
  emitted.event.attributes.push_back(transaction_event_attribute_t{
      .key = "contract", .value = to_string(emitted.contract), .index = true});
  return emitted;
}

}  // namespace

namespace rndr::execution {

engine::engine(encoder_t& encoder,
               storage_t& storage,
               const genesis_t& genesis,
               const bool require_strict_crypto)
    : encoder_{encoder},
      storage_{storage},
      require_strict_crypto_{require_strict_crypto},
      signature_verifier_{rndr::crypto::verify_signature} {
  auto lock = std::scoped_lock{mutex_};
  spdlog::info("Initializing execution engine (strict crypto: {})",
               require_strict_crypto_);
  if (require_strict_crypto_ && !rndr::crypto::available()) {
    rndr::common::critical(
        "strict crypto requested but signature verification is unavailable");
  }

  load_persisted_state(genesis);
  chain_id_ = rndr::blake3::hash(genesis_.chain_name);
  spdlog::info(
      "Execution engine ready at height {} on chain '{}' (token {}, escrow "
      "{})",
      last_committed_height_, genesis_.chain_name,
      to_string(genesis_.token_address), to_string(genesis_.escrow_address));
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto maybe_tx = encoder_.try_decode<transaction_t>(raw_tx);
  if (!maybe_tx) {
    return make_error_result(ledger_error_code::invalid_transaction,
                             "transaction bytes are not a SCALE transaction",
                             kCheckTxCodespace);
  }
  auto committed = state_scope{encoder_, storage_};
  auto result = validate_transaction(*maybe_tx, committed, kCheckTxCodespace);
  if (result.code == 0) {
    result.gas_wanted = 1000;
  }
  return result;
}

block_result_t engine::finalize_block(const uint64_t height,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());

  pending_block_ = std::make_unique<state_scope>(encoder_, storage_);
  auto& block = *pending_block_;
  auto event_seq_key = rndr::schema::key::make_event_seq_key(encoder_);
  auto next_event_id =
      block.get<uint64_t>(event_seq_key).value_or(kFirstEventId);

  auto rolling_root = last_committed_state_root_;
  for (size_t i = 0; i < txs.size(); ++i) {
    auto index = static_cast<uint32_t>(i);
    auto tx_result =
        execute_transaction(block, txs[i], height, index, next_event_id);
    block.put(rndr::schema::key::make_history_key(encoder_, height, index),
              history_entry_t{.height = height,
                              .index = index,
                              .code = tx_result.code,
                              .tx = txs[i]});
    rolling_root = fold_state_root(encoder_, rolling_root, txs[i], height,
                                   index, tx_result.code);
    result.tx_results.push_back(std::move(tx_result));
  }
  block.put(event_seq_key, next_event_id);

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  spdlog::debug("Finalized height {} with {} transaction(s)", height,
                txs.size());
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_block_) {
    auto writes = pending_block_->take_writes();
    storage_.commit_block(
        writes, rndr::storage::committed_state{
                    .height = pending_height_,
                    .state_root = pending_state_root_});
    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    pending_block_.reset();
    spdlog::info("Committed height {} ({} row mutation(s))",
                 last_committed_height_, writes.size());
  }

  auto result = commit_result_t{};
  result.retain_height = 0;
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = last_committed_height_;
  result.codespace = std::string{kQueryCodespace};

  auto committed = state_scope{encoder_, storage_};

  if (path == "/engine/info") {
    result.value = encoder_.encode(
        std::tuple{last_committed_height_, last_committed_state_root_,
                   chain_id_});
    return result;
  }

  if (path == "/engine/contracts") {
    result.value =
        encoder_.encode(std::tuple{genesis_.token_address,
                                   genesis_.escrow_address,
                                   genesis_.legacy_token_address});
    return result;
  }

  if (path == "/account/nonce") {
    auto account = encoder_.try_decode<address_t>(data);
    if (!account) {
      fail_query(result, query_error_code::invalid_key,
                 "expected SCALE address");
      return result;
    }
    auto nonce_key = rndr::schema::key::make_nonce_key(encoder_, *account);
    auto nonce = committed.get<uint64_t>(nonce_key).value_or(kFirstNonce);
    result.value = encoder_.encode(nonce);
    return result;
  }

  if (path == "/token/balance") {
    auto key = encoder_.try_decode<std::tuple<address_t, address_t>>(data);
    if (!key) {
      fail_query(result, query_error_code::invalid_key,
                 "expected SCALE (contract, account)");
      return result;
    }
    const auto* token = find_token_ledger(std::get<0>(*key));
    if (token == nullptr) {
      fail_query(result, query_error_code::not_found, "unknown token contract");
      return result;
    }
    result.value =
        encoder_.encode(token->balance_of(committed, std::get<1>(*key)));
    return result;
  }

  if (path == "/token/allowance") {
    auto key =
        encoder_.try_decode<std::tuple<address_t, address_t, address_t>>(data);
    if (!key) {
      fail_query(result, query_error_code::invalid_key,
                 "expected SCALE (contract, owner, spender)");
      return result;
    }
    const auto* token = find_token_ledger(std::get<0>(*key));
    if (token == nullptr) {
      fail_query(result, query_error_code::not_found, "unknown token contract");
      return result;
    }
    result.value = encoder_.encode(
        token->allowance(committed, std::get<1>(*key), std::get<2>(*key)));
    return result;
  }

  if (path == "/token/info" || path == "/token/audit") {
    auto contract = encoder_.try_decode<address_t>(data);
    if (!contract) {
      fail_query(result, query_error_code::invalid_key,
                 "expected SCALE contract address");
      return result;
    }
    const auto* token = find_token_ledger(*contract);
    if (token == nullptr) {
      fail_query(result, query_error_code::not_found, "unknown token contract");
      return result;
    }
    auto state = token->state(committed);
    if (path == "/token/info") {
      result.value = encoder_.encode(state);
      return result;
    }

    auto audit = supply_audit_t{};
    audit.total_minted = state.total_minted;
    audit.total_burned = state.total_burned;
    // Scans every balance row of the contract; operator audit only.
    auto balance_prefix =
        rndr::schema::key::make_token_balance_prefix(encoder_, *contract);
    for (const auto& [_, value] : storage_.list_by_prefix(
             bytes_view_t{balance_prefix.data(), balance_prefix.size()})) {
      audit.sum_of_balances += encoder_.decode<amount_t>(
          bytes_view_t{value.data(), value.size()});
    }
    if (!is_null(state.escrow_contract_address)) {
      audit.escrow_contract_balance =
          token->balance_of(committed, state.escrow_contract_address);
      if (const auto* escrow =
              find_escrow_ledger(state.escrow_contract_address)) {
        audit.sum_of_escrow_balances = escrow->state(committed).total_held;
      }
    }
    result.value = encoder_.encode(audit);
    return result;
  }

  if (path == "/escrow/user_balance" || path == "/escrow/job_balance") {
    auto key = encoder_.try_decode<std::tuple<address_t, std::string>>(data);
    if (!key) {
      fail_query(result, query_error_code::invalid_key,
                 "expected SCALE (contract, user_id)");
      return result;
    }
    const auto* escrow = find_escrow_ledger(std::get<0>(*key));
    if (escrow == nullptr) {
      fail_query(result, query_error_code::not_found,
                 "unknown escrow contract");
      return result;
    }
    result.value =
        encoder_.encode(escrow->user_balance(committed, std::get<1>(*key)));
    return result;
  }

  if (path == "/escrow/info") {
    auto contract = encoder_.try_decode<address_t>(data);
    if (!contract) {
      fail_query(result, query_error_code::invalid_key,
                 "expected SCALE contract address");
      return result;
    }
    const auto* escrow = find_escrow_ledger(*contract);
    if (escrow == nullptr) {
      fail_query(result, query_error_code::not_found,
                 "unknown escrow contract");
      return result;
    }
    result.value = encoder_.encode(escrow->state(committed));
    return result;
  }

  if (path == "/events/range" || path == "/history/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range) {
      fail_query(result, query_error_code::invalid_key,
                 "expected SCALE (from, to)");
      return result;
    }
    auto [from, to] = *range;
    if (to < from || (to - from) >= kMaxQueryRange) {
      fail_query(result, query_error_code::invalid_key,
                 "range must be ordered and span at most " +
                     std::to_string(kMaxQueryRange) + " entries");
      return result;
    }
    if (path == "/events/range") {
      result.value = encoder_.encode(load_events(from, to));
      return result;
    }
    result.value = encoder_.encode(load_history(from, to));
    return result;
  }

  fail_query(result, query_error_code::unsupported_path,
             "unsupported query path '" + std::string{path} + "'");
  return result;
}

std::vector<history_entry_t> engine::history(const uint64_t from_height,
                                             const uint64_t to_height) const {
  auto lock = std::scoped_lock{mutex_};
  return load_history(from_height, to_height);
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  if (!require_strict_crypto_) {
    spdlog::debug("Ignoring signature verifier; strict crypto is disabled");
    return;
  }
  signature_verifier_ = std::move(verifier);
}

const hash32_t& engine::chain_id() const {
  return chain_id_;
}

transaction_result_t engine::validate_transaction(
    const transaction_t& tx,
    const state_scope& scope,
    const std::string_view codespace) const {
  if (tx.version != 1) {
    return make_error_result(ledger_error_code::unsupported_transaction_version,
                             "expected version 1", codespace);
  }
  if (tx.chain_id != chain_id_) {
    return make_error_result(ledger_error_code::invalid_chain_id,
                             "transaction is for a different chain", codespace);
  }

  auto signer = rndr::crypto::signer_address(tx.signer);
  if (is_null(signer)) {
    return make_error_result(ledger_error_code::invalid_transaction,
                             "signer resolves to the null address", codespace);
  }
  if (contracts_.find(signer) != nullptr) {
    return make_error_result(ledger_error_code::invalid_transaction,
                             "signer resolves to a hosted contract address",
                             codespace);
  }
  auto expected_nonce =
      scope.get<uint64_t>(rndr::schema::key::make_nonce_key(encoder_, signer))
          .value_or(kFirstNonce);
  if (tx.nonce != expected_nonce) {
    return make_error_result(ledger_error_code::invalid_nonce,
                             "expected nonce " + std::to_string(expected_nonce),
                             codespace);
  }

  if (require_strict_crypto_) {
    if (std::holds_alternative<named_signer_t>(tx.signer)) {
      return make_error_result(
          ledger_error_code::invalid_signature_type,
          "named signers are not accepted with strict crypto", codespace);
    }
    auto message = make_signing_payload(encoder_, tx);
    if (!signature_verifier_ ||
        !signature_verifier_(bytes_view_t{message.data(), message.size()},
                             tx.signer, tx.signature)) {
      return make_error_result(ledger_error_code::signature_verification_failed,
                               "signature does not match signer", codespace);
    }
  }

  return transaction_result_t{};
}

transaction_result_t engine::execute_transaction(state_scope& block,
                                                 const bytes_t& raw_tx,
                                                 const uint64_t height,
                                                 const uint32_t index,
                                                 uint64_t& next_event_id) {
  auto maybe_tx = encoder_.try_decode<transaction_t>(
      bytes_view_t{raw_tx.data(), raw_tx.size()});
  if (!maybe_tx) {
    return make_error_result(ledger_error_code::invalid_transaction,
                             "transaction bytes are not a SCALE transaction",
                             kFinalizeCodespace);
  }
  const auto& tx = *maybe_tx;
  auto result = validate_transaction(tx, block, kFinalizeCodespace);
  if (result.code != 0) {
    return result;
  }

  auto caller = rndr::crypto::signer_address(tx.signer);
  block.put(rndr::schema::key::make_nonce_key(encoder_, caller), tx.nonce + 1);

  auto scope = state_scope{block};
  auto context =
      call_context{.scope = scope, .caller = caller, .contracts = contracts_};
  auto outcome = outcome_t{};
  if (const auto* target = contracts_.find(tx.target)) {
    outcome = target->execute(context, tx.payload);
  } else {
    outcome = fail(ledger_error_code::unknown_contract,
                   "no contract at " + to_string(tx.target));
  }

  if (outcome && !outcome->partial) {
    spdlog::debug("Transaction {} at height {} failed: {} ({})", index, height,
                  to_string(outcome->code), outcome->message);
    return make_error_result(outcome->code, std::move(outcome->message),
                             kLedgerCodespace);
  }

  auto emitted = scope.events();
  scope.commit();

  if (outcome) {
    result = make_error_result(outcome->code, std::move(outcome->message),
                               kLedgerCodespace);
  } else {
    result.gas_wanted = 1000;
    result.gas_used = 750;
  }
  result.events.reserve(emitted.size());
  for (auto& event : emitted) {
    auto annotated = with_contract(event);
    result.events.push_back(std::move(annotated.event));
    block.put(rndr::schema::key::make_event_key(encoder_, next_event_id),
              event_record_t{.event_id = next_event_id,
                             .height = height,
                             .tx_index = index,
                             .contract = event.contract,
                             .event = std::move(event.event)});
    ++next_event_id;
  }
  return result;
}

std::vector<history_entry_t> engine::load_history(
    const uint64_t from_height,
    const uint64_t to_height) const {
  auto entries = std::vector<history_entry_t>{};
  if (to_height < from_height) {
    return entries;
  }
  for (auto offset = uint64_t{0}; offset <= to_height - from_height;
       ++offset) {
    auto prefix = rndr::schema::key::make_prefixed_key(
        encoder_, rndr::schema::key::kHistoryPrefix, from_height + offset);
    auto at_height = std::vector<history_entry_t>{};
    for (const auto& [_, value] :
         storage_.list_by_prefix(bytes_view_t{prefix.data(), prefix.size()})) {
      at_height.push_back(encoder_.decode<history_entry_t>(
          bytes_view_t{value.data(), value.size()}));
    }
    // Row keys order indexes by their SCALE bytes, not numerically.
    std::sort(std::begin(at_height), std::end(at_height),
              [](const auto& lhs, const auto& rhs) {
                return lhs.index < rhs.index;
              });
    std::move(std::begin(at_height), std::end(at_height),
              std::back_inserter(entries));
    if (offset == std::numeric_limits<uint64_t>::max()) {
      break;
    }
  }
  return entries;
}

std::vector<event_record_t> engine::load_events(const uint64_t from_id,
                                                const uint64_t to_id) const {
  auto records = std::vector<event_record_t>{};
  if (to_id < from_id) {
    return records;
  }
  auto committed = state_scope{encoder_, storage_};
  for (auto offset = uint64_t{0}; offset <= to_id - from_id; ++offset) {
    auto record = committed.get<event_record_t>(
        rndr::schema::key::make_event_key(encoder_, from_id + offset));
    if (!record) {
      break;
    }
    records.push_back(std::move(*record));
    if (offset == std::numeric_limits<uint64_t>::max()) {
      break;
    }
  }
  return records;
}

const token_ledger* engine::find_token_ledger(const address_t& address) const {
  if (token_ != nullptr && token_->address() == address) {
    return token_;
  }
  if (legacy_token_ != nullptr && legacy_token_->address() == address) {
    return legacy_token_;
  }
  return nullptr;
}

const escrow_ledger* engine::find_escrow_ledger(
    const address_t& address) const {
  if (escrow_ != nullptr && escrow_->address() == address) {
    return escrow_;
  }
  return nullptr;
}

void engine::install_contracts(const genesis_t& genesis) {
  if (is_null(genesis.token_address) || is_null(genesis.escrow_address)) {
    rndr::common::critical("genesis token and escrow addresses must be set");
  }
  if (genesis.token_address == genesis.escrow_address ||
      (genesis.legacy_token_address &&
       (*genesis.legacy_token_address == genesis.token_address ||
        *genesis.legacy_token_address == genesis.escrow_address ||
        is_null(*genesis.legacy_token_address)))) {
    rndr::common::critical("genesis contract addresses must be distinct");
  }

  token_ =
      &contracts_.add(std::make_unique<token_ledger>(genesis.token_address));
  escrow_ =
      &contracts_.add(std::make_unique<escrow_ledger>(genesis.escrow_address));
  if (genesis.legacy_token_address) {
    legacy_token_ = &contracts_.add(
        std::make_unique<token_ledger>(*genesis.legacy_token_address));
  }
}

void engine::apply_genesis(const genesis_t& genesis) {
  auto scope = state_scope{encoder_, storage_};

  auto token = token_state_t{};
  token.name = genesis.token_name;
  token.symbol = genesis.token_symbol;
  token.owner = genesis.token_owner;
  token.bridge_manager = genesis.bridge_manager;
  token.legacy_token_address =
      genesis.legacy_token_address.value_or(make_null_address());
  token_->initialize(scope, token);

  auto escrow = escrow_state_t{};
  escrow.owner = genesis.escrow_owner;
  escrow.render_token_address = genesis.token_address;
  escrow.disbursal_address = genesis.escrow_owner;
  escrow_->initialize(scope, escrow);

  if (legacy_token_ != nullptr) {
    auto legacy = token_state_t{};
    legacy.name = "Legacy Token";
    legacy.symbol = "LTX";
    legacy.owner = genesis.legacy_owner;
    legacy.owner_mintable = true;
    legacy_token_->initialize(scope, legacy);
  }

  scope.put(rndr::schema::key::make_genesis_key(encoder_), genesis);

  auto encoded = encoder_.encode(genesis);
  last_committed_height_ = 0;
  last_committed_state_root_ =
      rndr::blake3::hash(bytes_view_t{encoded.data(), encoded.size()});
  storage_.commit_block(scope.take_writes(),
                        rndr::storage::committed_state{
                            .height = last_committed_height_,
                            .state_root = last_committed_state_root_});
  spdlog::info("Wrote genesis for chain '{}'", genesis.chain_name);
}

void engine::load_persisted_state(const genesis_t& configured) {
  spdlog::debug("Loading persisted engine state");
  auto genesis_key = rndr::schema::key::make_genesis_key(encoder_);
  auto stored = storage_.get<genesis_t>(
      encoder_, bytes_view_t{genesis_key.data(), genesis_key.size()});
  if (!stored) {
    genesis_ = configured;
    install_contracts(genesis_);
    apply_genesis(genesis_);
    return;
  }

  if (encoder_.encode(*stored) != encoder_.encode(configured)) {
    spdlog::warn(
        "Configured genesis differs from the persisted one; using persisted "
        "genesis for chain '{}'",
        stored->chain_name);
  }
  genesis_ = std::move(*stored);
  install_contracts(genesis_);
  auto committed = state_scope{encoder_, storage_};
  if (!token_->initialized(committed) || !escrow_->initialized(committed) ||
      (legacy_token_ != nullptr && !legacy_token_->initialized(committed))) {
    rndr::common::critical("persisted genesis has no contract state rows");
  }
  if (auto checkpoint = storage_.load_committed_state()) {
    last_committed_height_ = checkpoint->height;
    last_committed_state_root_ = checkpoint->state_root;
  }
}

}  // namespace rndr::execution
