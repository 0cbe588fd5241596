#include "chatfetch/stream/cancellation.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>

#include <fcntl.h>
#include <unistd.h>

namespace chatfetch::stream {

// ── CancellationGate ──────────────────────────────────────────────────────────

CancellationGate::Subscription::~Subscription() { reset(); }

CancellationGate::Subscription::Subscription(Subscription &&other) noexcept
    : gate_(other.gate_), id_(other.id_) {
  other.gate_ = nullptr;
  other.id_ = 0;
}

CancellationGate::Subscription &
CancellationGate::Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    reset();
    gate_ = other.gate_;
    id_ = other.id_;
    other.gate_ = nullptr;
    other.id_ = 0;
  }
  return *this;
}

void CancellationGate::Subscription::reset() {
  if (gate_ != nullptr) {
    gate_->unsubscribe(id_);
    gate_ = nullptr;
    id_ = 0;
  }
}

bool CancellationGate::trigger(const std::string &reason) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.load()) {
      return false;
    }
    reason_ = reason;
    cancelled_.store(true);
  }
  cv_.notify_all();

  // Held while dispatching so a subscription cannot be destroyed mid-callback.
  std::lock_guard<std::mutex> lock(callbacks_mutex_);
  for (auto &[id, callback] : callbacks_) {
    if (callback) {
      callback();
    }
  }
  return true;
}

bool CancellationGate::is_cancelled() const { return cancelled_.load(); }

std::string CancellationGate::reason() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reason_;
}

bool CancellationGate::wait_for(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this]() { return cancelled_.load(); });
}

CancellationGate::Subscription CancellationGate::subscribe(Callback callback) {
  std::uint64_t id = 0;
  {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    if (!cancelled_.load()) {
      id = next_id_++;
      callbacks_.emplace(id, std::move(callback));
      return Subscription(this, id);
    }
  }
  if (callback) {
    callback();
  }
  return Subscription();
}

void CancellationGate::unsubscribe(const std::uint64_t id) {
  std::lock_guard<std::mutex> lock(callbacks_mutex_);
  callbacks_.erase(id);
}

// ── SignalWatcher ─────────────────────────────────────────────────────────────

namespace {

volatile sig_atomic_t g_signal_pipe_write = -1;

extern "C" void forward_signal(int signo) {
  const int fd = g_signal_pipe_write;
  if (fd < 0) {
    return;
  }
  const int saved_errno = errno;
  const unsigned char byte = static_cast<unsigned char>(signo);
  [[maybe_unused]] const ssize_t rc = ::write(fd, &byte, 1);
  errno = saved_errno;
}

const char *signal_name(const int signo) {
  switch (signo) {
  case SIGINT:
    return "SIGINT";
  case SIGTERM:
    return "SIGTERM";
  default:
    return "signal";
  }
}

} // namespace

SignalWatcher::SignalWatcher(CancellationGate &gate) : gate_(gate) {}

SignalWatcher::~SignalWatcher() { stop(); }

common::Status SignalWatcher::start() {
  if (running_) {
    return common::Status::success();
  }
  if (g_signal_pipe_write >= 0) {
    return common::Status::error("another signal watcher is already running");
  }

  int fds[2] = {-1, -1};
  if (::pipe(fds) != 0) {
    return common::Status::error(std::string("pipe failed: ") + std::strerror(errno));
  }
  ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
  ::fcntl(fds[1], F_SETFL, O_NONBLOCK);
  pipe_read_ = fds[0];
  pipe_write_ = fds[1];
  g_signal_pipe_write = pipe_write_;

  struct sigaction action {};
  action.sa_handler = forward_signal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = SA_RESTART;
  sigaction(SIGINT, &action, &previous_int_);
  sigaction(SIGTERM, &action, &previous_term_);

  // Writes to a closed connection must surface as errors, not kill the process.
  struct sigaction ignore {};
  ignore.sa_handler = SIG_IGN;
  sigemptyset(&ignore.sa_mask);
  sigaction(SIGPIPE, &ignore, &previous_pipe_);

  running_ = true;
  thread_ = std::thread([this]() { watch_loop(); });
  return common::Status::success();
}

void SignalWatcher::stop() {
  if (!running_) {
    return;
  }

  sigaction(SIGINT, &previous_int_, nullptr);
  sigaction(SIGTERM, &previous_term_, nullptr);
  sigaction(SIGPIPE, &previous_pipe_, nullptr);
  g_signal_pipe_write = -1;

  // A zero byte tells the watcher thread to exit.
  const unsigned char stop_byte = 0;
  while (::write(pipe_write_, &stop_byte, 1) < 0 && errno == EINTR) {
  }
  if (thread_.joinable()) {
    thread_.join();
  }

  ::close(pipe_read_);
  ::close(pipe_write_);
  pipe_read_ = -1;
  pipe_write_ = -1;
  running_ = false;
}

void SignalWatcher::watch_loop() {
  while (true) {
    unsigned char byte = 0;
    const ssize_t rc = ::read(pipe_read_, &byte, 1);
    if (rc < 0 && errno == EINTR) {
      continue;
    }
    if (rc <= 0 || byte == 0) {
      return;
    }
    const int signo = static_cast<int>(byte);
    std::cerr << "Received " << signal_name(signo) << ", shutting down...\n";
    gate_.trigger(signal_name(signo));
  }
}

} // namespace chatfetch::stream
