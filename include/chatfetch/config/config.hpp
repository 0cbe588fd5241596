#pragma once

#include "chatfetch/common/result.hpp"
#include "chatfetch/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace chatfetch::config {

inline constexpr std::uint64_t kMaxReconnectWaitSecs = 3600;

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Parse TOML text on top of the defaults.
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);

/// Load the config file (absent file = defaults) and apply environment overrides.
[[nodiscard]] common::Result<Config> load_config();

void apply_env_overrides(Config &config);

/// Prefix scheme-less addresses with https:// and drop trailing slashes.
[[nodiscard]] std::string normalize_server_address(const std::string &address);

/// Empty result vector means the config is usable.
[[nodiscard]] std::vector<std::string> validate_config(const Config &config);

} // namespace chatfetch::config
