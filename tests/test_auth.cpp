#include "test_framework.hpp"

#include "chatfetch/auth/credentials.hpp"
#include "chatfetch/auth/oauth.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <filesystem>

namespace {

std::int64_t now_unix() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace

void register_auth_tests(std::vector<chatfetch::tests::TestCase> &tests) {
  using chatfetch::tests::require;
  namespace auth = chatfetch::auth;
  namespace http = chatfetch::http;
  namespace testing = chatfetch::testing;

  tests.push_back({"apply_credential_headers", [] {
                     http::HeaderMap headers;
                     auth::apply_credential(auth::Credential::none(), headers);
                     require(headers.empty(), "no credential adds nothing");
                     auth::apply_credential(auth::Credential::api_key("k"), headers);
                     require(headers.at("x-goog-api-key") == "k", "api key header");
                     auth::apply_credential(auth::Credential::bearer("t"), headers);
                     require(headers.at("Authorization") == "Bearer t", "bearer header");
                   }});

  tests.push_back({"api_key_provider_trims_and_rereads", [] {
                     testing::TempWorkspace workspace;
                     workspace.create_file("key.txt", "  AIza-first \n");
                     auth::ApiKeyFileProvider provider(workspace.path() / "key.txt");
                     const auto first = provider.fetch();
                     require(first.ok(), first.error());
                     require(first.value().kind == auth::CredentialKind::ApiKey, "api key kind");
                     require(first.value().value == "AIza-first", "key is trimmed");

                     workspace.create_file("key.txt", "AIza-second");
                     const auto second = provider.fetch();
                     require(second.ok() && second.value().value == "AIza-second",
                             "file is read again on every fetch");
                   }});

  tests.push_back({"api_key_provider_errors", [] {
                     testing::TempWorkspace workspace;
                     auth::ApiKeyFileProvider missing(workspace.path() / "absent.txt");
                     require(!missing.fetch().ok(), "missing file fails");

                     workspace.create_file("empty.txt", "\n\n");
                     auth::ApiKeyFileProvider empty(workspace.path() / "empty.txt");
                     const auto result = empty.fetch();
                     require(!result.ok(), "blank file fails");
                     require(result.error().find("empty") != std::string::npos,
                             "message: " + result.error());
                   }});

  tests.push_back({"oauth_tokens_save_and_load", [] {
                     testing::TempWorkspace workspace;
                     const auto path = workspace.path() / "token.json";
                     auth::OAuthTokens tokens;
                     tokens.access_token = "ya29.a\"b";
                     tokens.refresh_token = "1//r";
                     tokens.expires_at = 1700000000;
                     const auto saved = auth::save_tokens(path, tokens);
                     require(saved.ok(), saved.error());

                     const auto perms = std::filesystem::status(path).permissions();
                     require((perms & std::filesystem::perms::group_all) ==
                                     std::filesystem::perms::none &&
                                 (perms & std::filesystem::perms::others_all) ==
                                     std::filesystem::perms::none,
                             "token file must be private");
                     require(!std::filesystem::exists(path.string() + ".tmp"),
                             "temp file renamed away");

                     const auto loaded = auth::load_tokens(path);
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().access_token == "ya29.a\"b", "access token");
                     require(loaded.value().refresh_token == "1//r", "refresh token");
                     require(loaded.value().token_type == "Bearer", "token type");
                     require(loaded.value().expires_at == 1700000000, "expiry");
                   }});

  tests.push_back({"oauth_load_rejects_bad_files", [] {
                     testing::TempWorkspace workspace;
                     workspace.create_file("bad.json", "access_token=x");
                     require(!auth::load_tokens(workspace.path() / "bad.json").ok(),
                             "non-JSON token file fails");
                     workspace.create_file("empty.json", "{}");
                     require(!auth::load_tokens(workspace.path() / "empty.json").ok(),
                             "token file without tokens fails");
                   }});

  tests.push_back({"oauth_needs_refresh_window", [] {
                     auth::OAuthTokens tokens;
                     tokens.access_token = "a";
                     tokens.expires_at = 1000;
                     require(!auth::needs_refresh(tokens, 900), "valid well before expiry");
                     require(auth::needs_refresh(tokens, 1000 - auth::EXPIRY_BUFFER_SECS),
                             "refresh inside the buffer");
                     tokens.access_token.clear();
                     require(auth::needs_refresh(tokens, 0), "missing token needs refresh");
                   }});

  tests.push_back({"oauth_refresh_keeps_refresh_token", [] {
                     testing::FakeHttpClient http;
                     http.push_post(testing::json_response(
                         200, R"({"access_token":"fresh","expires_in":3599,"token_type":"Bearer"})"));
                     const auth::OAuthClient client{.client_id = "cid",
                                                    .client_secret = "s&cret",
                                                    .token_url = "http://127.0.0.1:9/token"};

                     const auto before = now_unix();
                     const auto refreshed = auth::refresh_access_token(http, client, "1//keep");
                     require(refreshed.ok(), refreshed.error());
                     require(refreshed.value().access_token == "fresh", "new access token");
                     require(refreshed.value().refresh_token == "1//keep",
                             "old refresh token kept when none returned");
                     require(refreshed.value().expires_at >= before + 3599, "expiry computed");

                     const auto requests = http.requests();
                     require(requests.size() == 1 && requests[0].method == "POST", "one POST");
                     require(requests[0].url == "http://127.0.0.1:9/token", "token url");
                     require(requests[0].body.find("grant_type=refresh_token") == 0,
                             "grant type first");
                     require(requests[0].body.find("client_secret=s%26cret") != std::string::npos,
                             "form values are encoded: " + requests[0].body);
                   }});

  tests.push_back({"oauth_refresh_failures", [] {
                     testing::FakeHttpClient http;
                     http.push_post(testing::json_response(400, R"({"error":"invalid_grant"})"));
                     http.push_post(testing::json_response(200, R"({"access_token":"x"})"));
                     const auth::OAuthClient client{.client_id = "cid", .client_secret = "s"};

                     const auto rejected = auth::refresh_access_token(http, client, "r");
                     require(!rejected.ok(), "HTTP 400 fails");
                     require(rejected.error().find("invalid_grant") != std::string::npos,
                             "server body reported");

                     const auto no_expiry = auth::refresh_access_token(http, client, "r");
                     require(!no_expiry.ok(), "missing expires_in fails");
                   }});

  tests.push_back({"oauth_provider_uses_valid_token_without_refresh", [] {
                     testing::TempWorkspace workspace;
                     const auto path = workspace.path() / "token.json";
                     auth::OAuthTokens tokens;
                     tokens.access_token = "still-good";
                     tokens.refresh_token = "r";
                     tokens.expires_at = now_unix() + 3600;
                     require(auth::save_tokens(path, tokens).ok(), "save");

                     testing::FakeHttpClient http;
                     auth::OAuthTokenProvider provider(http, auth::OAuthClient{}, path);
                     const auto credential = provider.fetch();
                     require(credential.ok(), credential.error());
                     require(credential.value().kind == auth::CredentialKind::Bearer, "bearer");
                     require(credential.value().value == "still-good", "token from file");
                     require(http.requests().empty(), "no refresh request");
                   }});

  tests.push_back({"oauth_provider_refreshes_and_persists", [] {
                     testing::TempWorkspace workspace;
                     const auto path = workspace.path() / "token.json";
                     auth::OAuthTokens tokens;
                     tokens.access_token = "stale";
                     tokens.refresh_token = "r";
                     tokens.expires_at = now_unix() - 10;
                     require(auth::save_tokens(path, tokens).ok(), "save");

                     testing::FakeHttpClient http;
                     http.push_post(testing::json_response(
                         200, R"({"access_token":"renewed","expires_in":3600})"));
                     auth::OAuthTokenProvider provider(
                         http, auth::OAuthClient{.client_id = "id", .client_secret = "secret"},
                         path);
                     const auto credential = provider.fetch();
                     require(credential.ok(), credential.error());
                     require(credential.value().value == "renewed", "refreshed token used");

                     const auto reloaded = auth::load_tokens(path);
                     require(reloaded.ok(), reloaded.error());
                     require(reloaded.value().access_token == "renewed", "refresh persisted");
                     require(reloaded.value().refresh_token == "r", "refresh token preserved");
                   }});

  tests.push_back({"oauth_provider_expired_without_client_fails", [] {
                     testing::TempWorkspace workspace;
                     const auto path = workspace.path() / "token.json";
                     auth::OAuthTokens tokens;
                     tokens.access_token = "stale";
                     tokens.refresh_token = "r";
                     tokens.expires_at = 1;
                     require(auth::save_tokens(path, tokens).ok(), "save");

                     testing::FakeHttpClient http;
                     auth::OAuthTokenProvider provider(http, auth::OAuthClient{}, path);
                     const auto credential = provider.fetch();
                     require(!credential.ok(), "cannot refresh without client credentials");
                     require(http.requests().empty(), "no request attempted");
                   }});

  tests.push_back({"credential_provider_factory", [] {
                     testing::FakeHttpClient http;
                     auto config = testing::mock_config();
                     require(auth::create_credential_provider(config, http)->name() == "none",
                             "no auth configured");
                     config.auth.oauth_token_path = "/tmp/token.json";
                     require(auth::create_credential_provider(config, http)->name() == "oauth",
                             "oauth token path");
                     config.auth.api_key_path = "/tmp/key.txt";
                     require(auth::create_credential_provider(config, http)->name() == "api-key",
                             "api key takes precedence");
                   }});
}
