#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace chatfetch::config {

struct StreamConfig {
  std::string server_address = "https://youtube.googleapis.com";
  std::string rest_api_address = "https://www.googleapis.com";
  std::uint64_t connect_timeout_secs = 10;
  std::uint64_t idle_timeout_secs = 0;
  std::vector<std::string> parts = {"snippet", "authorDetails"};
  std::uint64_t max_results = 0;
  std::string hl;
  std::uint64_t profile_image_size = 0;
};

struct ReconnectConfig {
  std::uint64_t wait_secs = 5;
  bool fail_fast = false;
};

struct OutputConfig {
  std::string file;
  bool resume = false;
  bool sync = true;
};

struct AuthConfig {
  std::string api_key_path;
  std::string oauth_token_path;
  std::string oauth_client_id;
  std::string oauth_client_secret;
  std::string oauth_token_url = "https://oauth2.googleapis.com/token";
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  std::string video_id;
  StreamConfig stream;
  ReconnectConfig reconnect;
  OutputConfig output;
  AuthConfig auth;
  ObservabilityConfig observability;
};

} // namespace chatfetch::config
