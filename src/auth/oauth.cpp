#include "chatfetch/auth/oauth.hpp"

#include "chatfetch/common/fs.hpp"
#include "chatfetch/common/json_util.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>

#include <sys/stat.h>

namespace chatfetch::auth {

namespace {

constexpr std::uint64_t HTTP_TIMEOUT_MS = 30000;

std::int64_t now_unix() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::int64_t parse_i64(const std::string &raw, const std::int64_t fallback) {
  if (raw.empty()) {
    return fallback;
  }
  try {
    return std::stoll(raw);
  } catch (const std::exception &) {
    return fallback;
  }
}

} // namespace

// ── Token storage ─────────────────────────────────────────────────────────────

common::Result<OAuthTokens> load_tokens(const std::filesystem::path &path) {
  const auto content = common::read_text_file(path);
  if (!content.ok()) {
    return common::Result<OAuthTokens>::failure("failed to read OAuth token file: " +
                                                content.error());
  }
  const std::string &json = content.value();
  if (!common::json_is_complete_object(json)) {
    return common::Result<OAuthTokens>::failure("OAuth token file is not a JSON object: " +
                                                path.string());
  }

  const auto fields = common::json_parse_flat(json);
  const auto field = [&fields](const char *key) {
    const auto it = fields.find(key);
    return it == fields.end() ? std::string() : it->second;
  };

  OAuthTokens tokens;
  tokens.access_token = field("access_token");
  tokens.refresh_token = field("refresh_token");
  if (const std::string type = field("token_type"); !type.empty()) {
    tokens.token_type = type;
  }
  tokens.expires_at = parse_i64(field("expires_at"), 0);

  if (tokens.access_token.empty() && tokens.refresh_token.empty()) {
    return common::Result<OAuthTokens>::failure("OAuth token file contains no tokens: " +
                                                path.string());
  }
  return common::Result<OAuthTokens>::success(std::move(tokens));
}

common::Status save_tokens(const std::filesystem::path &path, const OAuthTokens &tokens) {
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("unable to write " + tmp_path.string());
  }

  file << "{\n";
  file << "  \"access_token\": \"" << common::json_escape(tokens.access_token) << "\",\n";
  file << "  \"refresh_token\": \"" << common::json_escape(tokens.refresh_token) << "\",\n";
  file << "  \"token_type\": \"" << common::json_escape(tokens.token_type) << "\",\n";
  file << "  \"expires_at\": " << tokens.expires_at << "\n";
  file << "}\n";

  file.close();
  if (!file) {
    return common::Status::error("failed writing " + tmp_path.string());
  }

  if (::chmod(tmp_path.c_str(), 0600) != 0) {
    return common::Status::error("failed to restrict permissions on " + tmp_path.string());
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error("failed to replace " + path.string() + ": " + ec.message());
  }
  return common::Status::success();
}

// ── Token management ──────────────────────────────────────────────────────────

bool needs_refresh(const OAuthTokens &tokens, const std::int64_t now) {
  return tokens.access_token.empty() || now + EXPIRY_BUFFER_SECS >= tokens.expires_at;
}

common::Result<OAuthTokens> refresh_access_token(http::HttpClient &http,
                                                 const OAuthClient &client,
                                                 const std::string &refresh_token) {
  std::string body = "grant_type=refresh_token";
  body += "&refresh_token=" + http::url_encode_component(refresh_token);
  body += "&client_id=" + http::url_encode_component(client.client_id);
  body += "&client_secret=" + http::url_encode_component(client.client_secret);

  const auto response = http.post_form(client.token_url, {}, body, HTTP_TIMEOUT_MS);
  if (response.network_error) {
    return common::Result<OAuthTokens>::failure("network error refreshing token: " +
                                                response.network_error_message);
  }
  if (response.status != 200) {
    return common::Result<OAuthTokens>::failure(
        "token refresh failed (HTTP " + std::to_string(response.status) + "): " + response.body);
  }

  OAuthTokens tokens;
  tokens.access_token = common::json_get_string(response.body, "access_token");
  tokens.refresh_token = common::json_get_string(response.body, "refresh_token");
  if (const std::string type = common::json_get_string(response.body, "token_type");
      !type.empty()) {
    tokens.token_type = type;
  }

  // Google only returns a refresh token on the first exchange.
  if (tokens.refresh_token.empty()) {
    tokens.refresh_token = refresh_token;
  }

  const std::string expires_in = common::json_get_number(response.body, "expires_in");
  if (expires_in.empty()) {
    return common::Result<OAuthTokens>::failure("refresh response has no expires_in");
  }
  tokens.expires_at = now_unix() + parse_i64(expires_in, 0);

  if (tokens.access_token.empty()) {
    return common::Result<OAuthTokens>::failure("refresh returned no access_token");
  }
  return common::Result<OAuthTokens>::success(std::move(tokens));
}

common::Result<std::string> get_valid_access_token(http::HttpClient &http,
                                                   const OAuthClient &client,
                                                   const std::filesystem::path &token_path) {
  const auto loaded = load_tokens(token_path);
  if (!loaded.ok()) {
    return common::Result<std::string>::failure(loaded.error());
  }
  const auto &tokens = loaded.value();

  if (!needs_refresh(tokens, now_unix())) {
    return common::Result<std::string>::success(tokens.access_token);
  }

  if (tokens.refresh_token.empty()) {
    return common::Result<std::string>::failure(
        "access token expired and no refresh token available");
  }
  if (common::trim(client.client_id).empty() || common::trim(client.client_secret).empty()) {
    return common::Result<std::string>::failure(
        "access token expired; an OAuth client id and secret are required to refresh it");
  }

  std::cerr << "[oauth] access token expiring, refreshing\n";
  const auto refreshed = refresh_access_token(http, client, tokens.refresh_token);
  if (!refreshed.ok()) {
    return common::Result<std::string>::failure("failed to refresh access token: " +
                                                refreshed.error());
  }

  if (const auto saved = save_tokens(token_path, refreshed.value()); !saved.ok()) {
    std::cerr << "[oauth] refreshed token not saved: " << saved.error() << "\n";
  }
  return common::Result<std::string>::success(refreshed.value().access_token);
}

} // namespace chatfetch::auth
