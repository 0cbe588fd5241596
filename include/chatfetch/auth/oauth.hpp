#pragma once

#include "chatfetch/common/result.hpp"
#include "chatfetch/http/client.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace chatfetch::auth {

// ── Constants ─────────────────────────────────────────────────────────────────

inline constexpr const char *GOOGLE_TOKEN_URL = "https://oauth2.googleapis.com/token";
inline constexpr std::int64_t EXPIRY_BUFFER_SECS = 60;

// ── Types ─────────────────────────────────────────────────────────────────────

struct OAuthClient {
  std::string client_id;
  std::string client_secret;
  std::string token_url = GOOGLE_TOKEN_URL;
};

struct OAuthTokens {
  std::string access_token;
  std::string refresh_token;
  std::string token_type = "Bearer";
  std::int64_t expires_at = 0; // Unix timestamp (seconds)
};

// ── Token storage ─────────────────────────────────────────────────────────────

[[nodiscard]] common::Result<OAuthTokens> load_tokens(const std::filesystem::path &path);

/// Write-temp-then-rename; the file ends up 0600.
[[nodiscard]] common::Status save_tokens(const std::filesystem::path &path,
                                         const OAuthTokens &tokens);

// ── Token management ──────────────────────────────────────────────────────────

/// True when the access token is missing or expires within EXPIRY_BUFFER_SECS of now.
[[nodiscard]] bool needs_refresh(const OAuthTokens &tokens, std::int64_t now_unix);

[[nodiscard]] common::Result<OAuthTokens> refresh_access_token(http::HttpClient &http,
                                                               const OAuthClient &client,
                                                               const std::string &refresh_token);

/// Load the token file, refreshing and saving it first when needed.
[[nodiscard]] common::Result<std::string>
get_valid_access_token(http::HttpClient &http, const OAuthClient &client,
                       const std::filesystem::path &token_path);

} // namespace chatfetch::auth
