#pragma once

#include <spdlog/common.h>
#include <rndr/schema/genesis.hpp>
#include <optional>
#include <string>
#include <vector>

namespace rndr::config {

/// Everything `rndr_node` needs to start.
struct node_options final {
  std::string grpc_address{"0.0.0.0:26658"};
  std::string db_path{"rndr-data"};
  std::string log_file{"rndr.log"};
  spdlog::level::level_enum log_level{spdlog::level::info};
  bool strict_crypto{true};
  rndr::schema::genesis_t genesis;
};

struct parse_result final {
  std::optional<node_options> options;
  bool help_requested{};
  /// Help text when `help_requested`, otherwise one line per problem.
  std::vector<std::string> messages;
};

/// Parse the command line, then the INI file named by `--config` if any.
///
/// Command line values take precedence over the config file.
parse_result parse_node_options(int argc, const char* const argv[]);

}  // namespace rndr::config
