#pragma once

#include "chatfetch/auth/oauth.hpp"
#include "chatfetch/common/result.hpp"
#include "chatfetch/http/client.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace chatfetch::config {
struct Config;
}

namespace chatfetch::auth {

enum class CredentialKind {
  None,
  ApiKey,
  Bearer,
};

struct Credential {
  CredentialKind kind = CredentialKind::None;
  std::string value;

  [[nodiscard]] static Credential none() { return {}; }
  [[nodiscard]] static Credential api_key(std::string key) {
    return Credential{CredentialKind::ApiKey, std::move(key)};
  }
  [[nodiscard]] static Credential bearer(std::string token) {
    return Credential{CredentialKind::Bearer, std::move(token)};
  }
};

/// Adds x-goog-api-key or Authorization: Bearer to a request's headers.
void apply_credential(const Credential &credential, http::HeaderMap &headers);

class CredentialProvider {
public:
  virtual ~CredentialProvider() = default;

  /// Called before every connection attempt; implementations may return a
  /// different credential each time.
  [[nodiscard]] virtual common::Result<Credential> fetch() = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

class NoCredentialProvider final : public CredentialProvider {
public:
  [[nodiscard]] common::Result<Credential> fetch() override {
    return common::Result<Credential>::success(Credential::none());
  }
  [[nodiscard]] std::string_view name() const override { return "none"; }
};

/// Re-reads the key file on every fetch.
class ApiKeyFileProvider final : public CredentialProvider {
public:
  explicit ApiKeyFileProvider(std::filesystem::path path);

  [[nodiscard]] common::Result<Credential> fetch() override;
  [[nodiscard]] std::string_view name() const override { return "api-key"; }

private:
  std::filesystem::path path_;
};

class OAuthTokenProvider final : public CredentialProvider {
public:
  OAuthTokenProvider(http::HttpClient &http, OAuthClient client, std::filesystem::path token_path);

  [[nodiscard]] common::Result<Credential> fetch() override;
  [[nodiscard]] std::string_view name() const override { return "oauth"; }

private:
  http::HttpClient &http_;
  OAuthClient client_;
  std::filesystem::path token_path_;
};

/// Picks the provider named by config.auth: API key file, OAuth token file, or none.
[[nodiscard]] std::unique_ptr<CredentialProvider>
create_credential_provider(const config::Config &config, http::HttpClient &http);

} // namespace chatfetch::auth
