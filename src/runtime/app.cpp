#include "chatfetch/runtime/app.hpp"

#include "chatfetch/common/fs.hpp"
#include "chatfetch/observability/global.hpp"
#include "chatfetch/stream/http_transport.hpp"
#include "chatfetch/stream/resume_log.hpp"

#include <iostream>

namespace chatfetch::runtime {

namespace {

using CursorResult = common::Result<stream::Cursor, stream::StreamError>;

stream::StreamError from_resolve_error(const stream::ResolveError &error) {
  switch (error.code) {
  case stream::ResolveErrorCode::NotFound:
  case stream::ResolveErrorCode::NotLive:
  case stream::ResolveErrorCode::Auth:
    return stream::StreamError::config(error.to_string());
  case stream::ResolveErrorCode::Transport:
    break;
  }
  return stream::StreamError::transport(error.to_string());
}

} // namespace

CursorResult bootstrap_cursor(const config::Config &config, stream::VideoResolver &resolver,
                              auth::CredentialProvider &credentials) {
  if (config.output.resume) {
    const std::string file = common::expand_path(config.output.file);
    if (common::trim(file).empty()) {
      return CursorResult::failure(stream::StreamError::config("resume requires an output file"));
    }
    const auto recovered = stream::ResumeLog::recover_last(file);
    if (!recovered.ok()) {
      return CursorResult::failure(recovered.error());
    }
    if (!recovered.value().has_value()) {
      return CursorResult::failure(stream::StreamError::config(
          "resume requested but no resume point found in " + file));
    }
    const auto &cursor = *recovered.value();
    std::cerr << "[bootstrap] resuming stream_id=" << cursor.stream_id << " page_token="
              << cursor.page_token.value_or("<none>") << "\n";
    return CursorResult::success(cursor);
  }

  const std::string video_id = common::trim(config.video_id);
  if (video_id.empty()) {
    return CursorResult::failure(
        stream::StreamError::config("a video id is required for a fresh start"));
  }

  const auto credential = credentials.fetch();
  if (!credential.ok()) {
    return CursorResult::failure(
        stream::StreamError::connect("credential unavailable: " + credential.error()));
  }

  const auto resolved = resolver.resolve(video_id, credential.value());
  if (!resolved.ok()) {
    return CursorResult::failure(from_resolve_error(resolved.error()));
  }
  std::cerr << "[bootstrap] video_id=" << video_id << " stream_id=" << resolved.value() << "\n";
  return CursorResult::success(stream::Cursor{resolved.value(), std::nullopt});
}

stream::ManagerOptions manager_options_from_config(const config::Config &config) {
  stream::ManagerOptions options;
  options.reconnect_wait = std::chrono::seconds(config.reconnect.wait_secs);
  options.fail_fast_initial_connect = config.reconnect.fail_fast;
  return options;
}

Application::Application(config::Config config, std::unique_ptr<http::HttpClient> http,
                         ApplicationOptions options)
    : config_(std::move(config)), options_(options), http_(std::move(http)) {
  if (http_ == nullptr) {
    http_ = std::make_unique<http::CurlHttpClient>();
  }
}

Application::~Application() = default;

stream::RunResult Application::run() {
  stream::SignalWatcher signals(gate_);
  if (options_.install_signal_handlers) {
    if (const auto started = signals.start(); !started.ok()) {
      return stream::RunResult::failure(
          stream::StreamError::config("cannot install signal handlers: " + started.error()));
    }
  }

  credentials_ = auth::create_credential_provider(config_, *http_);
  resolver_ = std::make_unique<stream::RestVideoResolver>(*http_, config_.stream.rest_api_address);

  const auto cursor = bootstrap_cursor(config_, *resolver_, *credentials_);
  if (!cursor.ok()) {
    observability::record_error("bootstrap", cursor.error().to_string());
    return stream::RunResult::failure(cursor.error());
  }

  transport_ = std::make_unique<stream::HttpTransport>(
      *http_, stream::HttpTransportOptions::from_config(config_.stream), gate_);

  if (common::trim(config_.output.file).empty()) {
    sink_ = std::make_unique<stream::ConsoleSink>();
  } else {
    auto log = std::make_unique<stream::ResumeLog>(common::expand_path(config_.output.file),
                                                   config_.output.sync);
    if (const auto opened = log->open(); !opened.ok()) {
      return stream::RunResult::failure(stream::StreamError::io(opened.error()));
    }
    sink_ = std::move(log);
  }

  std::cerr << "[fetcher] stream_id=" << cursor.value().stream_id
            << " output=" << sink_->name() << " reconnect_wait_secs="
            << config_.reconnect.wait_secs << "\n";

  manager_ = std::make_unique<stream::ResilienceManager>(
      *transport_, *credentials_, *sink_, gate_, manager_options_from_config(config_));
  auto result = manager_->run(cursor.value());

  signals.stop();
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return result;
}

} // namespace chatfetch::runtime
