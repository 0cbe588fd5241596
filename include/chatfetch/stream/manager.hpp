#pragma once

#include "chatfetch/auth/credentials.hpp"
#include "chatfetch/common/result.hpp"
#include "chatfetch/stream/cancellation.hpp"
#include "chatfetch/stream/cursor.hpp"
#include "chatfetch/stream/error.hpp"
#include "chatfetch/stream/resume_log.hpp"
#include "chatfetch/stream/transport.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>

namespace chatfetch::stream {

enum class SessionState {
  Disconnected,
  Connected,
  ReconnectPending,
  Terminated,
};

[[nodiscard]] std::string_view session_state_name(SessionState state);

struct ManagerOptions {
  /// Fixed wait between losing a session and the next connection attempt.
  std::chrono::milliseconds reconnect_wait{5000};
  /// Return a ConnectError from the very first open() instead of retrying it.
  bool fail_fast_initial_connect = false;
};

using RunResult = common::Result<void, StreamError>;

/// Drives one transport session at a time: connect, consume, persist, and reconnect after
/// a fixed wait whenever the stream ends or fails. A batch is appended to the sink before
/// the cursor moves past it; empty batches move the cursor without being persisted.
class ResilienceManager {
public:
  using StateListener = std::function<void(SessionState, const Cursor &)>;

  ResilienceManager(Transport &transport, auth::CredentialProvider &credentials, BatchSink &sink,
                    CancellationGate &gate, ManagerOptions options = {});

  /// Runs until cancelled (success) or until a sink append fails (IoError). With
  /// fail_fast_initial_connect, a failed first connection is returned as ConnectError.
  [[nodiscard]] RunResult run(Cursor cursor);

  [[nodiscard]] SessionState state() const { return state_; }
  [[nodiscard]] std::optional<std::chrono::steady_clock::time_point> reconnect_deadline() const {
    return reconnect_deadline_;
  }
  [[nodiscard]] const Cursor &cursor() const { return cursor_; }

  /// Called on the manager's thread after every state change.
  void set_state_listener(StateListener listener) { listener_ = std::move(listener); }

  [[nodiscard]] std::uint64_t batches_received() const { return batches_received_; }
  [[nodiscard]] std::uint64_t batches_persisted() const { return batches_persisted_; }
  [[nodiscard]] std::uint64_t reconnect_attempts() const { return reconnect_attempts_; }

private:
  enum class Step { Continue, Stop };

  Step connect(bool initial, RunResult &outcome);
  Step consume(RunResult &outcome);
  void wait_for_deadline();
  [[nodiscard]] common::Result<void, StreamError> handle_batch(const Batch &batch);
  void schedule_reconnect();
  void terminate(const std::string &reason);
  void transition(SessionState next);

  Transport &transport_;
  auth::CredentialProvider &credentials_;
  BatchSink &sink_;
  CancellationGate &gate_;
  ManagerOptions options_;
  StateListener listener_;

  SessionState state_ = SessionState::Disconnected;
  std::optional<std::chrono::steady_clock::time_point> reconnect_deadline_;
  Cursor cursor_;
  std::unique_ptr<TransportSession> session_;
  std::optional<std::string> offline_at_;

  std::uint64_t batches_received_ = 0;
  std::uint64_t batches_persisted_ = 0;
  std::uint64_t reconnect_attempts_ = 0;
};

} // namespace chatfetch::stream
