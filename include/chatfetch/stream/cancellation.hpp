#pragma once

#include "chatfetch/common/result.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include <signal.h>

namespace chatfetch::stream {

/// One-shot stop signal shared by the manager, the active session and the signal watcher.
/// Triggering twice has the same effect as triggering once.
class CancellationGate {
public:
  using Callback = std::function<void()>;

  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;
    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    void reset();

  private:
    friend class CancellationGate;
    Subscription(CancellationGate *gate, std::uint64_t id) : gate_(gate), id_(id) {}

    CancellationGate *gate_ = nullptr;
    std::uint64_t id_ = 0;
  };

  /// Returns true for the call that actually cancelled.
  bool trigger(const std::string &reason);
  [[nodiscard]] bool is_cancelled() const;
  [[nodiscard]] std::string reason() const;

  /// Sleeps up to timeout; returns true as soon as the gate is triggered.
  bool wait_for(std::chrono::milliseconds timeout);

  /// The callback runs on the triggering thread, or immediately if already triggered.
  /// It stops being eligible once the subscription is destroyed.
  [[nodiscard]] Subscription subscribe(Callback callback);

private:
  void unsubscribe(std::uint64_t id);

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> cancelled_{false};
  std::string reason_;

  std::mutex callbacks_mutex_;
  std::map<std::uint64_t, Callback> callbacks_;
  std::uint64_t next_id_ = 1;
};

/// Routes SIGINT and SIGTERM into a CancellationGate through a self-pipe. Only one
/// watcher may be started per process.
class SignalWatcher {
public:
  explicit SignalWatcher(CancellationGate &gate);
  ~SignalWatcher();

  SignalWatcher(const SignalWatcher &) = delete;
  SignalWatcher &operator=(const SignalWatcher &) = delete;

  [[nodiscard]] common::Status start();
  /// Restores the previous handlers and joins the watcher thread.
  void stop();
  [[nodiscard]] bool running() const { return running_; }

private:
  void watch_loop();

  CancellationGate &gate_;
  std::thread thread_;
  int pipe_read_ = -1;
  int pipe_write_ = -1;
  bool running_ = false;
  struct sigaction previous_int_ {};
  struct sigaction previous_term_ {};
  struct sigaction previous_pipe_ {};
};

} // namespace chatfetch::stream
