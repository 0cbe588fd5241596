#pragma once

#include "chatfetch/auth/credentials.hpp"
#include "chatfetch/config/schema.hpp"
#include "chatfetch/http/client.hpp"
#include "chatfetch/observability/observer.hpp"
#include "chatfetch/stream/cancellation.hpp"
#include "chatfetch/stream/resolver.hpp"
#include "chatfetch/stream/resume_log.hpp"
#include "chatfetch/stream/transport.hpp"

#include <chrono>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chatfetch::testing {

/// Defaults for tests: no observer output, an unroutable server, a one second reconnect.
config::Config mock_config();

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;
  [[nodiscard]] std::string read_file(const std::string &name) const;
  [[nodiscard]] std::vector<std::string> read_lines(const std::string &name) const;

private:
  std::filesystem::path path_;
};

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();

  EnvGuard(const EnvGuard &) = delete;
  EnvGuard &operator=(const EnvGuard &) = delete;
};

/// Polls until predicate holds or timeout passes; returns the last predicate value.
bool wait_until(const std::function<bool()> &predicate,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

// ── Chat data ─────────────────────────────────────────────────────────────────

stream::ChatMessage make_message(const std::string &id, const std::string &stream_id,
                                 const std::string &text = "hello");

/// A batch of item_count messages for stream_id, ending at page_token.
stream::Batch make_batch(const std::string &stream_id, std::optional<std::string> page_token,
                         std::size_t item_count = 1);

/// Wire form of make_batch, as the stream endpoint would send it.
std::string batch_json(const std::string &stream_id, std::optional<std::string> page_token,
                       std::size_t item_count = 1);

// ── Scripted transport ────────────────────────────────────────────────────────

struct ScriptedEvent {
  stream::SessionEvent event;
  /// Trigger the gate right before this event is handed out.
  bool cancel_before = false;
};

struct SessionScript {
  std::vector<ScriptedEvent> events;
  /// Once events run out: block until the gate fires (true) or report EndOfStream (false).
  bool block_at_end = false;
};

/// Hands out one scripted session per open(). When the scripts run out it cancels the
/// gate with reason "script exhausted" and fails the open.
class ScriptedTransport final : public stream::Transport {
public:
  explicit ScriptedTransport(stream::CancellationGate &gate);

  void push_session(SessionScript script);
  void push_open_failure(std::string message);

  [[nodiscard]] stream::OpenResult open(const stream::Cursor &cursor,
                                        const auth::Credential &credential) override;

  [[nodiscard]] std::vector<stream::Cursor> opened_cursors() const;
  [[nodiscard]] std::vector<auth::Credential> credentials() const;

private:
  struct Step {
    bool fail = false;
    std::string message;
    SessionScript script;
  };

  stream::CancellationGate &gate_;
  mutable std::mutex mutex_;
  std::deque<Step> steps_;
  std::vector<stream::Cursor> cursors_;
  std::vector<auth::Credential> credentials_;
};

// ── Fake HTTP ─────────────────────────────────────────────────────────────────

struct RecordedRequest {
  std::string method;
  std::string url;
  http::HeaderMap headers;
  std::string body;
};

struct StreamScript {
  std::uint16_t status = 200;
  std::vector<std::string> chunks;
  /// Fail the transfer after the chunks instead of closing cleanly.
  bool network_error = false;
  std::string error_message = "connection reset by peer";
  /// Keep the transfer open after the chunks until the caller aborts it.
  bool hold_open = false;
};

/// Replays queued responses. An unscripted stream behaves like a refused connection.
class FakeHttpClient final : public http::HttpClient {
public:
  void push_get(http::HttpResponse response);
  void push_post(http::HttpResponse response);
  void push_stream(StreamScript script);

  [[nodiscard]] http::HttpResponse get(const std::string &url, const http::HeaderMap &headers,
                                       std::uint64_t timeout_ms) override;
  [[nodiscard]] http::HttpResponse post_form(const std::string &url,
                                             const http::HeaderMap &headers,
                                             const std::string &body,
                                             std::uint64_t timeout_ms) override;
  [[nodiscard]] http::HttpResponse get_stream(const std::string &url,
                                              const http::HeaderMap &headers,
                                              const http::StreamRequestOptions &options,
                                              const http::StreamCallbacks &callbacks) override;

  [[nodiscard]] std::vector<RecordedRequest> requests() const;
  [[nodiscard]] std::size_t stream_calls() const;

private:
  mutable std::mutex mutex_;
  std::deque<http::HttpResponse> gets_;
  std::deque<http::HttpResponse> posts_;
  std::deque<StreamScript> streams_;
  std::vector<RecordedRequest> requests_;
  std::size_t stream_calls_ = 0;
};

http::HttpResponse json_response(std::uint16_t status, std::string body);

// ── Observers, sinks, credentials, resolvers ─────────────────────────────────

class CapturingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "capture"; }

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::vector<observability::ObserverMetric> metrics() const;

  template <typename T> [[nodiscard]] std::size_t count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t n = 0;
    for (const auto &event : events_) {
      if (std::holds_alternative<T>(event)) {
        ++n;
      }
    }
    return n;
  }

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::vector<observability::ObserverMetric> metrics_;
};

/// Installs a CapturingObserver as the global observer for the lifetime of the guard.
class ObserverCapture {
public:
  ObserverCapture();
  ~ObserverCapture();

  ObserverCapture(const ObserverCapture &) = delete;
  ObserverCapture &operator=(const ObserverCapture &) = delete;

  [[nodiscard]] CapturingObserver &observer() { return *observer_; }

private:
  CapturingObserver *observer_ = nullptr;
};

class MemorySink final : public stream::BatchSink {
public:
  [[nodiscard]] stream::AppendResult append(const stream::Batch &batch) override;
  [[nodiscard]] std::string_view name() const override { return "memory"; }

  /// Appends after the first n succeed fail with an IoError.
  void fail_after(std::size_t n) { fail_after_ = n; }
  void on_append(std::function<void(const stream::Batch &)> hook) { hook_ = std::move(hook); }

  [[nodiscard]] const std::vector<stream::Batch> &batches() const { return batches_; }
  [[nodiscard]] std::size_t attempts() const { return attempts_; }

private:
  std::vector<stream::Batch> batches_;
  std::optional<std::size_t> fail_after_;
  std::function<void(const stream::Batch &)> hook_;
  std::size_t attempts_ = 0;
};

/// Hands out "token-1", "token-2", ... as bearer credentials; queued failures come first.
class CountingCredentialProvider final : public auth::CredentialProvider {
public:
  [[nodiscard]] common::Result<auth::Credential> fetch() override;
  [[nodiscard]] std::string_view name() const override { return "counting"; }

  void fail_next(std::string message) { failures_.push_back(std::move(message)); }
  [[nodiscard]] std::size_t fetches() const { return fetches_; }

private:
  std::deque<std::string> failures_;
  std::size_t fetches_ = 0;
  std::size_t issued_ = 0;
};

class FakeResolver final : public stream::VideoResolver {
public:
  explicit FakeResolver(stream::ResolveResult result) : result_(std::move(result)) {}

  [[nodiscard]] stream::ResolveResult resolve(const std::string &video_id,
                                              const auth::Credential &credential) override;

  [[nodiscard]] const std::vector<std::string> &video_ids() const { return video_ids_; }
  [[nodiscard]] const std::vector<auth::Credential> &credentials() const {
    return credentials_;
  }

private:
  stream::ResolveResult result_;
  std::vector<std::string> video_ids_;
  std::vector<auth::Credential> credentials_;
};

} // namespace chatfetch::testing
