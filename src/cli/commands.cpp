#include "chatfetch/cli/commands.hpp"

#include "chatfetch/common/fs.hpp"
#include "chatfetch/config/config.hpp"
#include "chatfetch/observability/factory.hpp"
#include "chatfetch/observability/global.hpp"
#include "chatfetch/runtime/app.hpp"

#include <filesystem>
#include <iostream>

namespace chatfetch::cli {

namespace {

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

/// Removes "--name VALUE" or "--name=VALUE" from args. Returns false only when the
/// option is present without a value.
bool take_option(std::vector<std::string> &args, const std::string &name,
                 std::optional<std::string> &out_value, std::string &error) {
  const std::string prefix = name + "=";
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      if (i + 1 >= args.size() || common::starts_with(args[i + 1], "--")) {
        error = "missing value for " + name;
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
    if (common::starts_with(args[i], prefix)) {
      const auto value = args[i].substr(prefix.size());
      if (value.empty()) {
        error = "missing value for " + name;
        return false;
      }
      out_value = value;
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return true;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

std::optional<std::uint64_t> parse_u64(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    return static_cast<std::uint64_t>(std::stoull(value));
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

void print_usage_error(const std::string &message) {
  std::cerr << "chatfetch: " << message << "\n";
  std::cerr << "Try 'chatfetch --help' for usage.\n";
}

} // namespace

common::Result<CliOptions> parse_args(std::vector<std::string> args) {
  CliOptions options;
  std::string error;

  const bool help_long = take_flag(args, "--help");
  const bool help_short = take_flag(args, "-h");
  const bool version_long = take_flag(args, "--version");
  const bool version_short = take_flag(args, "-V");
  options.show_help = help_long || help_short;
  options.show_version = version_long || version_short;
  options.resume = take_flag(args, "--resume");
  options.fail_fast = take_flag(args, "--fail-fast");

  std::optional<std::string> wait_secs;
  const bool taken = take_option(args, "--config", options.config_path, error) &&
                     take_option(args, "--video-id", options.video_id, error) &&
                     take_option(args, "--api-key-path", options.api_key_path, error) &&
                     take_option(args, "--oauth-token-path", options.oauth_token_path, error) &&
                     take_option(args, "--oauth-client-id", options.oauth_client_id, error) &&
                     take_option(args, "--oauth-client-secret", options.oauth_client_secret,
                                 error) &&
                     take_option(args, "--reconnect-wait-secs", wait_secs, error) &&
                     take_option(args, "--output-file", options.output_file, error);
  if (!taken) {
    return common::Result<CliOptions>::failure(error);
  }

  if (wait_secs.has_value()) {
    const auto parsed = parse_u64(*wait_secs);
    if (!parsed.has_value()) {
      return common::Result<CliOptions>::failure("invalid value for --reconnect-wait-secs: " +
                                                 *wait_secs);
    }
    options.reconnect_wait_secs = *parsed;
  }

  if (!args.empty()) {
    return common::Result<CliOptions>::failure("unrecognized argument: " + args.front());
  }
  return common::Result<CliOptions>::success(std::move(options));
}

void apply_cli_options(const CliOptions &options, config::Config &config) {
  if (options.video_id.has_value()) {
    config.video_id = *options.video_id;
  }
  if (options.api_key_path.has_value()) {
    config.auth.api_key_path = common::expand_path(*options.api_key_path);
  }
  if (options.oauth_token_path.has_value()) {
    config.auth.oauth_token_path = common::expand_path(*options.oauth_token_path);
  }
  if (options.oauth_client_id.has_value()) {
    config.auth.oauth_client_id = *options.oauth_client_id;
  }
  if (options.oauth_client_secret.has_value()) {
    config.auth.oauth_client_secret = *options.oauth_client_secret;
  }
  if (options.reconnect_wait_secs.has_value()) {
    config.reconnect.wait_secs = *options.reconnect_wait_secs;
  }
  if (options.output_file.has_value()) {
    config.output.file = common::expand_path(*options.output_file);
  }
  if (options.resume) {
    config.output.resume = true;
  }
  if (options.fail_fast) {
    config.reconnect.fail_fast = true;
  }
}

std::string version_string() {
#ifdef CHATFETCH_VERSION
  std::string version = CHATFETCH_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "chatfetch " + version;
}

void print_help() {
  std::cout << version_string() << "\n";
  std::cout << "Stream live chat messages for a video and keep them in a resumable log.\n\n";
  std::cout << "USAGE\n";
  std::cout << "  chatfetch [--config PATH] [options]\n\n";
  std::cout << "OPTIONS\n";
  std::cout << "  --video-id ID               Video whose live chat to stream\n";
  std::cout << "  --api-key-path PATH         File holding an API key\n";
  std::cout << "  --oauth-token-path PATH     OAuth token file (refreshed in place)\n";
  std::cout << "  --oauth-client-id ID        OAuth client id used for refresh\n";
  std::cout << "  --oauth-client-secret S     OAuth client secret used for refresh\n";
  std::cout << "  --reconnect-wait-secs N     Wait between reconnect attempts (default 5)\n";
  std::cout << "  --output-file PATH          Append batches here instead of stdout\n";
  std::cout << "  --resume                    Continue from the last batch in --output-file\n";
  std::cout << "  --fail-fast                 Exit if the first connection attempt fails\n";
  std::cout << "  --config PATH               Config file (default ~/.chatfetch/config.toml)\n";
  std::cout << "  -h, --help                  Show this help\n";
  std::cout << "  -V, --version               Show version\n\n";
  std::cout << "ENVIRONMENT\n";
  std::cout << "  SERVER_ADDRESS, REST_API_ADDRESS, CHATFETCH_CONFIG_PATH,\n";
  std::cout << "  CHATFETCH_OBSERVABILITY, CHATFETCH_RECONNECT_WAIT_SECS\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = argc > 1 ? collect_args(argc - 1, argv + 1)
                                           : std::vector<std::string>{};

  auto parsed = parse_args(std::move(args));
  if (!parsed.ok()) {
    print_usage_error(parsed.error());
    return 1;
  }
  const auto &options = parsed.value();

  if (options.show_help) {
    print_help();
    return 0;
  }
  if (options.show_version) {
    std::cout << version_string() << "\n";
    return 0;
  }

  if (options.config_path.has_value()) {
    config::set_config_path_override(std::filesystem::path(*options.config_path));
  }

  auto loaded = config::load_config();
  if (!loaded.ok()) {
    std::cerr << "Error: " << loaded.error() << "\n";
    return 1;
  }
  config::Config config = std::move(loaded.value());
  apply_cli_options(options, config);

  const auto problems = config::validate_config(config);
  if (!problems.empty()) {
    for (const auto &problem : problems) {
      std::cerr << "Error: " << problem << "\n";
    }
    return 1;
  }

  observability::set_global_observer(observability::create_observer(config));

  runtime::Application app(std::move(config));
  const auto result = app.run();
  if (!result.ok()) {
    std::cerr << "Error: " << result.error().to_string() << "\n";
    return 1;
  }
  std::cerr << "Shutdown complete\n";
  return 0;
}

} // namespace chatfetch::cli
