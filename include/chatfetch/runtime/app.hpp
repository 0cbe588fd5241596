#pragma once

#include "chatfetch/auth/credentials.hpp"
#include "chatfetch/common/result.hpp"
#include "chatfetch/config/schema.hpp"
#include "chatfetch/http/client.hpp"
#include "chatfetch/stream/cancellation.hpp"
#include "chatfetch/stream/cursor.hpp"
#include "chatfetch/stream/error.hpp"
#include "chatfetch/stream/manager.hpp"
#include "chatfetch/stream/resolver.hpp"

#include <memory>

namespace chatfetch::runtime {

/// Starting cursor: recovered from the output file when resuming, otherwise resolved from
/// the video id. Resume with nothing to resume from is a ConfigError; every resolver
/// failure is fatal.
[[nodiscard]] common::Result<stream::Cursor, stream::StreamError>
bootstrap_cursor(const config::Config &config, stream::VideoResolver &resolver,
                 auth::CredentialProvider &credentials);

[[nodiscard]] stream::ManagerOptions manager_options_from_config(const config::Config &config);

struct ApplicationOptions {
  bool install_signal_handlers = true;
};

/// Owns the fetcher's object graph for one run: HTTP client, credentials, resolver,
/// transport, output sink, signal watcher and resilience manager.
class Application {
public:
  explicit Application(config::Config config, std::unique_ptr<http::HttpClient> http = nullptr,
                       ApplicationOptions options = {});
  ~Application();

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  /// Blocks until cancelled (success) or a fatal error.
  [[nodiscard]] stream::RunResult run();

  [[nodiscard]] stream::CancellationGate &gate() { return gate_; }
  [[nodiscard]] const config::Config &config() const { return config_; }
  /// Null until run() has built the manager.
  [[nodiscard]] const stream::ResilienceManager *manager() const { return manager_.get(); }

private:
  config::Config config_;
  ApplicationOptions options_;
  std::unique_ptr<http::HttpClient> http_;
  stream::CancellationGate gate_;
  std::unique_ptr<auth::CredentialProvider> credentials_;
  std::unique_ptr<stream::VideoResolver> resolver_;
  std::unique_ptr<stream::Transport> transport_;
  std::unique_ptr<stream::BatchSink> sink_;
  std::unique_ptr<stream::ResilienceManager> manager_;
};

} // namespace chatfetch::runtime
