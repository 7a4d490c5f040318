#include <boost/program_options.hpp>
#include <rndr/blake3/hash.hpp>
#include <rndr/common/critical.hpp>
#include <rndr/schema/encoding/scale/encoder.hpp>
#include <rndr/schema/transaction.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace {

using encoder_t = rndr::schema::encoding::encoder<
    rndr::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

std::string require_string(const po::variables_map& vm,
                           const std::string& name) {
  if (!vm.contains(name)) {
    rndr::common::critical("missing required argument --" + name);
  }
  return vm[name].as<std::string>();
}

rndr::schema::address_t get_address(const po::variables_map& vm,
                                    const std::string& name) {
  auto address = rndr::schema::try_make_address(require_string(vm, name));
  if (!address) {
    rndr::common::critical("--" + name +
                           " must be 0x followed by 40 hex digits");
  }
  return *address;
}

rndr::schema::amount_t parse_amount(const std::string& decimal) {
  auto amount = rndr::schema::try_make_amount(decimal);
  if (!amount) {
    rndr::common::critical("amounts must be unsigned decimal integers below "
                           "2^256");
  }
  return *amount;
}

rndr::schema::amount_t get_amount(const po::variables_map& vm,
                                  const std::string& name) {
  return parse_amount(require_string(vm, name));
}

template <size_t N>
std::array<uint8_t, N> get_fixed_bytes(const std::string& hex,
                                       std::string_view what) {
  auto bytes = rndr::schema::try_from_hex(hex);
  if (!bytes || bytes->size() != N) {
    rndr::common::critical(std::string{what} + " has the wrong length");
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(std::begin(*bytes), std::end(*bytes), std::begin(out));
  return out;
}

rndr::schema::hash32_t get_chain_id(const po::variables_map& vm) {
  if (vm.contains("chain-id")) {
    return get_fixed_bytes<32>(vm["chain-id"].as<std::string>(), "chain id");
  }
  return rndr::blake3::hash(vm["chain-name"].as<std::string>());
}

rndr::schema::signer_id_t make_signer(const po::variables_map& vm) {
  auto kind = vm["signer-kind"].as<std::string>();
  auto value = require_string(vm, "signer");
  if (kind == "named") {
    return rndr::schema::signer_id_t{get_address(vm, "signer")};
  }
  if (kind == "ed25519") {
    return rndr::schema::signer_id_t{rndr::schema::ed25519_signer_id{
        .public_key = get_fixed_bytes<32>(value, "ed25519 public key")}};
  }
  if (kind == "secp256k1") {
    return rndr::schema::signer_id_t{rndr::schema::secp256k1_signer_id{
        .public_key = get_fixed_bytes<33>(value, "secp256k1 public key")}};
  }
  rndr::common::critical("signer-kind must be named|ed25519|secp256k1");
}

rndr::schema::signature_t make_signature(const po::variables_map& vm) {
  auto kind = vm["signature-kind"].as<std::string>();
  auto hex = vm["signature-hex"].as<std::string>();
  if (kind == "ed25519") {
    return rndr::schema::signature_t{
        hex.empty() ? rndr::schema::ed25519_signature_t{}
                    : get_fixed_bytes<64>(hex, "ed25519 signature")};
  }
  if (kind == "secp256k1") {
    return rndr::schema::signature_t{
        hex.empty() ? rndr::schema::secp256k1_signature_t{}
                    : get_fixed_bytes<65>(hex, "secp256k1 signature")};
  }
  rndr::common::critical("unsupported signature-kind");
}

std::vector<rndr::schema::address_t> get_recipients(
    const po::variables_map& vm) {
  auto out = std::vector<rndr::schema::address_t>{};
  if (!vm.contains("recipient")) {
    return out;
  }
  for (const auto& value : vm["recipient"].as<std::vector<std::string>>()) {
    auto address = rndr::schema::try_make_address(value);
    if (!address) {
      rndr::common::critical(
          "--recipient must be 0x followed by 40 hex digits");
    }
    out.push_back(*address);
  }
  return out;
}

std::vector<rndr::schema::amount_t> get_amounts(const po::variables_map& vm) {
  auto out = std::vector<rndr::schema::amount_t>{};
  if (!vm.contains("amounts")) {
    return out;
  }
  for (const auto& value : vm["amounts"].as<std::vector<std::string>>()) {
    out.push_back(parse_amount(value));
  }
  return out;
}

rndr::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = vm["payload"].as<std::string>();
  if (payload == "transfer") {
    return rndr::schema::transfer_t{.to = get_address(vm, "to"),
                                    .amount = get_amount(vm, "amount")};
  }
  if (payload == "approve") {
    return rndr::schema::approve_t{.spender = get_address(vm, "spender"),
                                   .amount = get_amount(vm, "amount")};
  }
  if (payload == "increase_allowance") {
    return rndr::schema::increase_allowance_t{
        .spender = get_address(vm, "spender"),
        .added_value = get_amount(vm, "amount")};
  }
  if (payload == "decrease_allowance") {
    return rndr::schema::decrease_allowance_t{
        .spender = get_address(vm, "spender"),
        .subtracted_value = get_amount(vm, "amount")};
  }
  if (payload == "transfer_from") {
    return rndr::schema::transfer_from_t{.from = get_address(vm, "from"),
                                         .to = get_address(vm, "to"),
                                         .amount = get_amount(vm, "amount")};
  }
  if (payload == "hold_in_escrow") {
    return rndr::schema::hold_in_escrow_t{
        .user_id = require_string(vm, "user-id"),
        .amount = get_amount(vm, "amount")};
  }
  if (payload == "set_escrow_contract_address") {
    return rndr::schema::set_escrow_contract_address_t{
        .escrow_contract_address = get_address(vm, "address")};
  }
  if (payload == "deposit") {
    auto word = rndr::schema::to_word(get_amount(vm, "amount"));
    return rndr::schema::deposit_t{
        .user = get_address(vm, "to"),
        .deposit_data =
            rndr::schema::bytes_t{std::begin(word), std::end(word)}};
  }
  if (payload == "withdraw") {
    return rndr::schema::withdraw_t{.amount = get_amount(vm, "amount")};
  }
  if (payload == "migrate") {
    return rndr::schema::migrate_t{};
  }
  if (payload == "mint") {
    return rndr::schema::mint_t{.to = get_address(vm, "to"),
                                .amount = get_amount(vm, "amount")};
  }
  if (payload == "update_bridge_manager") {
    return rndr::schema::update_bridge_manager_t{
        .bridge_manager = get_address(vm, "address")};
  }
  if (payload == "transfer_ownership") {
    return rndr::schema::transfer_ownership_t{
        .new_owner = get_address(vm, "address")};
  }
  if (payload == "fund_user") {
    return rndr::schema::fund_user_t{.user_id = require_string(vm, "user-id"),
                                     .amount = get_amount(vm, "amount")};
  }
  if (payload == "fund_job") {
    return rndr::schema::fund_job_t{.job_id = require_string(vm, "user-id"),
                                    .amount = get_amount(vm, "amount")};
  }
  if (payload == "disburse_funds") {
    return rndr::schema::disburse_funds_t{
        .user_id = require_string(vm, "user-id"),
        .recipients = get_recipients(vm),
        .amounts = get_amounts(vm)};
  }
  if (payload == "disburse_job") {
    return rndr::schema::disburse_job_t{.job_id = require_string(vm, "user-id"),
                                        .recipients = get_recipients(vm),
                                        .amounts = get_amounts(vm)};
  }
  if (payload == "change_disbursal_address") {
    return rndr::schema::change_disbursal_address_t{
        .disbursal_address = get_address(vm, "address")};
  }
  if (payload == "change_render_token_address") {
    return rndr::schema::change_render_token_address_t{
        .render_token_address = get_address(vm, "address")};
  }
  rndr::common::critical("unsupported payload type");
}

rndr::schema::transaction_t build_transaction(const po::variables_map& vm) {
  if (!vm.contains("payload")) {
    rndr::common::critical("transaction mode requires --payload");
  }
  return rndr::schema::transaction_t{.version = 1,
                                     .chain_id = get_chain_id(vm),
                                     .nonce = vm["nonce"].as<uint64_t>(),
                                     .signer = make_signer(vm),
                                     .target = get_address(vm, "target"),
                                     .payload = build_payload(vm),
                                     .signature = make_signature(vm)};
}

rndr::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info" || path == "/engine/contracts") {
    return {};
  }
  if (path == "/account/nonce") {
    return encoder.encode(get_address(vm, "account"));
  }
  if (path == "/token/balance") {
    return encoder.encode(
        std::tuple{get_address(vm, "contract"), get_address(vm, "account")});
  }
  if (path == "/token/allowance") {
    return encoder.encode(std::tuple{get_address(vm, "contract"),
                                     get_address(vm, "owner"),
                                     get_address(vm, "spender")});
  }
  if (path == "/token/info" || path == "/token/audit" ||
      path == "/escrow/info") {
    return encoder.encode(get_address(vm, "contract"));
  }
  if (path == "/escrow/user_balance" || path == "/escrow/job_balance") {
    return encoder.encode(std::tuple{get_address(vm, "contract"),
                                     require_string(vm, "user-id")});
  }
  if (path == "/history/range" || path == "/events/range") {
    return encoder.encode(std::tuple{vm["range-from"].as<uint64_t>(),
                                     vm["range-to"].as<uint64_t>()});
  }
  rndr::common::critical("unsupported query path");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  rndr_tx transaction [options]\n"
            << "  rndr_tx signing-payload [options]\n"
            << "  rndr_tx query-key [options]\n"
            << "  rndr_tx chain-id [--chain-name NAME]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"rndr_tx options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|signing-payload|query-key|chain-id")(
      "payload", po::value<std::string>(), "transaction payload type")(
      "path", po::value<std::string>(), "query path")(
      "chain-name", po::value<std::string>()->default_value("rndr-local-chain"),
      "chain name hashed into the chain id")(
      "chain-id", po::value<std::string>(),
      "32-byte chain id hex; overrides --chain-name")(
      "nonce", po::value<uint64_t>()->default_value(1), "transaction nonce")(
      "signer-kind", po::value<std::string>()->default_value("named"),
      "named|ed25519|secp256k1")(
      "signer", po::value<std::string>(),
      "signer address (named) or public key hex")(
      "signature-kind", po::value<std::string>()->default_value("ed25519"),
      "ed25519|secp256k1")("signature-hex",
                           po::value<std::string>()->default_value(""),
                           "signature bytes hex")(
      "target", po::value<std::string>(), "called contract address")(
      "to", po::value<std::string>(), "recipient address")(
      "from", po::value<std::string>(),
      "token owner address for transfer_from")(
      "spender", po::value<std::string>(), "spender address")(
      "owner", po::value<std::string>(), "allowance owner address")(
      "account", po::value<std::string>(), "account address")(
      "contract", po::value<std::string>(), "queried contract address")(
      "address", po::value<std::string>(),
      "new address for configuration payloads")(
      "user-id", po::value<std::string>(), "escrow user or job id")(
      "amount", po::value<std::string>(), "decimal token amount")(
      "recipient", po::value<std::vector<std::string>>()->multitoken(),
      "disbursal recipient addresses")(
      "amounts", po::value<std::vector<std::string>>()->multitoken(),
      "disbursal amounts, one per recipient")(
      "range-from", po::value<uint64_t>()->default_value(1),
      "first height or event id")(
      "range-to", po::value<uint64_t>()->default_value(1),
      "last height or event id");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    auto encoded = encoder_t{}.encode(build_transaction(vm));
    std::cout << rndr::schema::to_base64(encoded) << '\n';
    return 0;
  }

  if (command == "signing-payload") {
    auto encoder = encoder_t{};
    auto message =
        rndr::schema::make_signing_payload(encoder, build_transaction(vm));
    std::cout << rndr::schema::to_hex(message) << '\n';
    return 0;
  }

  if (command == "query-key") {
    if (!vm.contains("path")) {
      rndr::common::critical("query-key mode requires --path");
    }
    auto key = build_query_key(vm);
    std::cout << rndr::schema::to_base64(key) << '\n';
    return 0;
  }

  if (command == "chain-id") {
    auto chain_id = get_chain_id(vm);
    std::cout << rndr::schema::to_hex(
                     rndr::schema::bytes_view_t{chain_id.data(),
                                                chain_id.size()})
              << '\n';
    return 0;
  }

  rndr::common::critical(
      "command must be transaction|signing-payload|query-key|chain-id");
}
