#include <boost/program_options.hpp>
#include <rndr/config/options.hpp>
#include <rndr/schema/primitives.hpp>
#include <sstream>
#include <string_view>
#include <utility>

namespace po = boost::program_options;

namespace rndr::config {

namespace {

std::optional<rndr::schema::address_t> read_address(
    const po::variables_map& vm,
    const std::string_view key,
    const bool required,
    std::vector<std::string>& errors) {
  auto name = std::string{key};
  if (!vm.contains(name)) {
    if (required) {
      errors.push_back("missing required option '" + name + "'");
    }
    return std::nullopt;
  }
  const auto& value = vm[name].as<std::string>();
  auto address = rndr::schema::try_make_address(value);
  if (!address) {
    errors.push_back("option '" + name + "' is not a 0x-prefixed 20 byte " +
                     "address: '" + value + "'");
  }
  return address;
}

}  // namespace

parse_result parse_node_options(const int argc, const char* const argv[]) {
  auto result = parse_result{};
  auto options = node_options{};
  auto config_file = std::string{};
  auto log_level = std::string{};

  auto generic = po::options_description{"Generic"};
  generic.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "INI file with any of the settings below");

  auto settings = po::options_description{"Settings"};
  settings.add_options()(
      "grpc-address,g",
      po::value<std::string>(&options.grpc_address)
          ->default_value(options.grpc_address),
      "IP:Port for the ledger gRPC service")(
      "db-path", po::value<std::string>(&options.db_path)
                     ->default_value(options.db_path),
      "RocksDB directory")(
      "log-file",
      po::value<std::string>(&options.log_file)
          ->default_value(options.log_file),
      "Log file path")(
      "log-level", po::value<std::string>(&log_level)->default_value("info"),
      "trace, debug, info, warn, error or critical")(
      "strict-crypto",
      po::value<bool>(&options.strict_crypto)->default_value(true),
      "Verify transaction signatures")(
      "chain-name",
      po::value<std::string>(&options.genesis.chain_name)
          ->default_value(options.genesis.chain_name),
      "Chain name; the chain id is its blake3 hash")(
      "token-address", po::value<std::string>(), "Token contract address")(
      "escrow-address", po::value<std::string>(), "Escrow contract address")(
      "legacy-token-address", po::value<std::string>(),
      "Legacy token contract address; enables migration")(
      "token-owner", po::value<std::string>(), "Token owner")(
      "escrow-owner", po::value<std::string>(), "Escrow owner")(
      "legacy-owner", po::value<std::string>(),
      "Legacy token owner; required with a legacy token address")(
      "bridge-manager", po::value<std::string>(),
      "Bridge manager; deposits are disabled when unset")(
      "token-name",
      po::value<std::string>(&options.genesis.token_name)
          ->default_value(options.genesis.token_name),
      "Token name")(
      "token-symbol",
      po::value<std::string>(&options.genesis.token_symbol)
          ->default_value(options.genesis.token_symbol),
      "Token symbol");

  auto all = po::options_description{"rndr_node"};
  all.add(generic).add(settings);

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, all), vm);
    if (vm.contains("config")) {
      po::store(po::parse_config_file<char>(
                    vm["config"].as<std::string>().c_str(), settings),
                vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    result.messages.emplace_back(ex.what());
    return result;
  }

  if (vm.contains("help")) {
    auto help = std::ostringstream{};
    help << all;
    result.help_requested = true;
    result.messages.push_back(help.str());
    return result;
  }

  options.log_level = spdlog::level::from_str(log_level);
  if (options.log_level == spdlog::level::off && log_level != "off") {
    result.messages.push_back("unknown log level '" + log_level + "'");
  }

  auto& errors = result.messages;
  auto& genesis = options.genesis;
  auto token = read_address(vm, "token-address", true, errors);
  auto escrow = read_address(vm, "escrow-address", true, errors);
  auto token_owner = read_address(vm, "token-owner", true, errors);
  auto escrow_owner = read_address(vm, "escrow-owner", true, errors);
  auto bridge_manager = read_address(vm, "bridge-manager", false, errors);
  auto legacy = read_address(vm, "legacy-token-address", false, errors);
  auto legacy_owner =
      read_address(vm, "legacy-owner", legacy.has_value(), errors);

  if (token && escrow && *token == *escrow) {
    errors.push_back("token-address and escrow-address must differ");
  }
  if (legacy && ((token && *legacy == *token) ||
                 (escrow && *legacy == *escrow))) {
    errors.push_back("legacy-token-address must differ from the token and "
                     "escrow addresses");
  }
  for (const auto& [name, value] :
       {std::pair{"token-address", token}, std::pair{"escrow-address", escrow},
        std::pair{"legacy-token-address", legacy}}) {
    if (value && rndr::schema::is_null(*value)) {
      errors.push_back(std::string{name} + " cannot be the null address");
    }
  }
  if (!errors.empty()) {
    return result;
  }

  genesis.token_address = *token;
  genesis.escrow_address = *escrow;
  genesis.token_owner = *token_owner;
  genesis.escrow_owner = *escrow_owner;
  genesis.bridge_manager =
      bridge_manager.value_or(rndr::schema::make_null_address());
  genesis.legacy_token_address = legacy;
  genesis.legacy_owner =
      legacy_owner.value_or(rndr::schema::make_null_address());
  result.options = std::move(options);
  return result;
}

}  // namespace rndr::config
