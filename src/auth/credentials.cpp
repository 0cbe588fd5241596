#include "chatfetch/auth/credentials.hpp"

#include "chatfetch/common/fs.hpp"
#include "chatfetch/config/schema.hpp"

namespace chatfetch::auth {

void apply_credential(const Credential &credential, http::HeaderMap &headers) {
  switch (credential.kind) {
  case CredentialKind::None:
    break;
  case CredentialKind::ApiKey:
    headers["x-goog-api-key"] = credential.value;
    break;
  case CredentialKind::Bearer:
    headers["Authorization"] = "Bearer " + credential.value;
    break;
  }
}

ApiKeyFileProvider::ApiKeyFileProvider(std::filesystem::path path) : path_(std::move(path)) {}

common::Result<Credential> ApiKeyFileProvider::fetch() {
  const auto content = common::read_text_file(path_);
  if (!content.ok()) {
    return common::Result<Credential>::failure("failed to read API key: " + content.error());
  }
  std::string key = common::trim(content.value());
  if (key.empty()) {
    return common::Result<Credential>::failure("API key file is empty: " + path_.string());
  }
  return common::Result<Credential>::success(Credential::api_key(std::move(key)));
}

OAuthTokenProvider::OAuthTokenProvider(http::HttpClient &http, OAuthClient client,
                                       std::filesystem::path token_path)
    : http_(http), client_(std::move(client)), token_path_(std::move(token_path)) {}

common::Result<Credential> OAuthTokenProvider::fetch() {
  auto token = get_valid_access_token(http_, client_, token_path_);
  if (!token.ok()) {
    return common::Result<Credential>::failure(token.error());
  }
  return common::Result<Credential>::success(Credential::bearer(std::move(token.value())));
}

std::unique_ptr<CredentialProvider> create_credential_provider(const config::Config &config,
                                                               http::HttpClient &http) {
  if (!common::trim(config.auth.api_key_path).empty()) {
    return std::make_unique<ApiKeyFileProvider>(common::expand_path(config.auth.api_key_path));
  }
  if (!common::trim(config.auth.oauth_token_path).empty()) {
    OAuthClient client{.client_id = config.auth.oauth_client_id,
                       .client_secret = config.auth.oauth_client_secret,
                       .token_url = config.auth.oauth_token_url};
    return std::make_unique<OAuthTokenProvider>(http, std::move(client),
                                                common::expand_path(config.auth.oauth_token_path));
  }
  return std::make_unique<NoCredentialProvider>();
}

} // namespace chatfetch::auth
