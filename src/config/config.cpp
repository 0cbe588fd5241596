#include "chatfetch/config/config.hpp"

#include "chatfetch/common/fs.hpp"
#include "chatfetch/common/toml.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace chatfetch::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".chatfetch";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("CHATFETCH_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::optional<std::uint64_t> parse_env_u64(const char *raw) {
  const std::string value = common::trim(raw);
  if (value.empty()) {
    return std::nullopt;
  }
  for (const char ch : value) {
    if (ch < '0' || ch > '9') {
      return std::nullopt;
    }
  }
  try {
    return static_cast<std::uint64_t>(std::stoull(value));
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::Result<std::filesystem::path>::success(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

std::string normalize_server_address(const std::string &address) {
  std::string out = common::trim(address);
  if (out.empty()) {
    return out;
  }
  if (out.find("://") == std::string::npos) {
    out = "https://" + out;
  }
  while (out.size() > 1 && out.back() == '/') {
    out.pop_back();
  }
  return out;
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  config.video_id = common::trim(doc.get_string("video_id", config.video_id));

  auto &stream = config.stream;
  stream.server_address = normalize_server_address(
      expand_config_value(doc.get_string("stream.server_address", stream.server_address)));
  stream.rest_api_address = normalize_server_address(
      expand_config_value(doc.get_string("stream.rest_api_address", stream.rest_api_address)));
  stream.connect_timeout_secs =
      doc.get_u64("stream.connect_timeout_secs", stream.connect_timeout_secs);
  stream.idle_timeout_secs = doc.get_u64("stream.idle_timeout_secs", stream.idle_timeout_secs);
  stream.parts = doc.get_string_array("stream.parts", stream.parts);
  stream.max_results = doc.get_u64("stream.max_results", stream.max_results);
  stream.hl = doc.get_string("stream.hl", stream.hl);
  stream.profile_image_size = doc.get_u64("stream.profile_image_size", stream.profile_image_size);

  config.reconnect.wait_secs = doc.get_u64("reconnect.wait_secs", config.reconnect.wait_secs);
  config.reconnect.fail_fast = doc.get_bool("reconnect.fail_fast", config.reconnect.fail_fast);

  config.output.file = expand_config_value(doc.get_string("output.file", config.output.file));
  config.output.resume = doc.get_bool("output.resume", config.output.resume);
  config.output.sync = doc.get_bool("output.sync", config.output.sync);

  auto &auth = config.auth;
  auth.api_key_path = expand_config_value(doc.get_string("auth.api_key_path", auth.api_key_path));
  auth.oauth_token_path =
      expand_config_value(doc.get_string("auth.oauth_token_path", auth.oauth_token_path));
  auth.oauth_client_id = doc.get_string("auth.oauth_client_id", auth.oauth_client_id);
  auth.oauth_client_secret =
      expand_config_value(doc.get_string("auth.oauth_client_secret", auth.oauth_client_secret));
  auth.oauth_token_url = doc.get_string("auth.oauth_token_url", auth.oauth_token_url);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

void apply_env_overrides(Config &config) {
  if (const char *server = std::getenv("SERVER_ADDRESS"); server != nullptr && *server) {
    config.stream.server_address = normalize_server_address(server);
  }

  if (const char *rest = std::getenv("REST_API_ADDRESS"); rest != nullptr && *rest) {
    config.stream.rest_api_address = normalize_server_address(rest);
  }

  if (const char *backend = std::getenv("CHATFETCH_OBSERVABILITY");
      backend != nullptr && *backend) {
    config.observability.backend = backend;
  }

  if (const char *wait = std::getenv("CHATFETCH_RECONNECT_WAIT_SECS");
      wait != nullptr && *wait) {
    if (const auto secs = parse_env_u64(wait); secs.has_value()) {
      config.reconnect.wait_secs = *secs;
    }
  }
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto parsed = parse_config(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }

  Config config = std::move(parsed.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

std::vector<std::string> validate_config(const Config &config) {
  std::vector<std::string> problems;

  if (common::trim(config.video_id).empty() && !config.output.resume) {
    problems.push_back("a video id is required unless resuming from an output file");
  }

  if (config.output.resume && common::trim(config.output.file).empty()) {
    problems.push_back("resume requires an output file");
  }

  const bool has_api_key = !common::trim(config.auth.api_key_path).empty();
  const bool has_oauth = !common::trim(config.auth.oauth_token_path).empty();
  if (has_api_key && has_oauth) {
    problems.push_back("auth.api_key_path and auth.oauth_token_path are mutually exclusive");
  }

  if (has_oauth) {
    std::error_code ec;
    const bool token_present = std::filesystem::exists(config.auth.oauth_token_path, ec);
    const bool can_authorize = !common::trim(config.auth.oauth_client_id).empty() &&
                               !common::trim(config.auth.oauth_client_secret).empty();
    if (!token_present && !can_authorize) {
      problems.push_back("OAuth token file not found: " + config.auth.oauth_token_path +
                         " (interactive authorization is not supported; provide a token file, "
                         "or a client id and secret to refresh one)");
    }
  }

  if (config.reconnect.wait_secs > kMaxReconnectWaitSecs) {
    problems.push_back("reconnect.wait_secs must be at most " +
                       std::to_string(kMaxReconnectWaitSecs));
  }

  if (common::trim(config.stream.server_address).empty()) {
    problems.push_back("stream.server_address must not be empty");
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  std::stringstream parts(backend);
  std::string part;
  while (std::getline(parts, part, ',')) {
    part = common::trim(part);
    if (!part.empty() && part != "log" && part != "none" && part != "noop") {
      problems.push_back("Invalid observability.backend: " + config.observability.backend);
      break;
    }
  }

  return problems;
}

} // namespace chatfetch::config
