#pragma once

#include "chatfetch/common/result.hpp"
#include "chatfetch/config/schema.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chatfetch::cli {

/// Command-line values; unset fields leave the loaded config alone.
struct CliOptions {
  std::optional<std::string> config_path;
  std::optional<std::string> video_id;
  std::optional<std::string> api_key_path;
  std::optional<std::string> oauth_token_path;
  std::optional<std::string> oauth_client_id;
  std::optional<std::string> oauth_client_secret;
  std::optional<std::uint64_t> reconnect_wait_secs;
  std::optional<std::string> output_file;
  bool resume = false;
  bool fail_fast = false;
  bool show_help = false;
  bool show_version = false;
};

/// args excludes the program name. Unknown options are an error.
[[nodiscard]] common::Result<CliOptions> parse_args(std::vector<std::string> args);

void apply_cli_options(const CliOptions &options, config::Config &config);

[[nodiscard]] std::string version_string();
void print_help();

/// 0 after a clean shutdown, 1 on any fatal error.
int run_cli(int argc, char **argv);

} // namespace chatfetch::cli
