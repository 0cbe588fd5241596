#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace chatfetch::observability {

struct SessionConnectedEvent {
  std::string stream_id;
  std::optional<std::string> page_token;
};

struct ConnectFailedEvent {
  std::string message;
};

struct StreamEndedEvent {
  std::optional<std::string> offline_at;
};

struct TransportErrorEvent {
  std::string message;
};

/// Entered ReconnectPending.
struct ReconnectScheduledEvent {
  std::chrono::milliseconds wait{0};
  std::uint64_t attempt = 0;
};

/// Left ReconnectPending; a new open() follows.
struct ReconnectAttemptEvent {
  std::uint64_t attempt = 0;
  std::optional<std::string> page_token;
};

struct BatchEvent {
  std::size_t items = 0;
  std::optional<std::string> page_token;
  bool persisted = false;
};

struct ShutdownEvent {
  std::string reason;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<SessionConnectedEvent, ConnectFailedEvent, StreamEndedEvent, TransportErrorEvent,
                 ReconnectScheduledEvent, ReconnectAttemptEvent, BatchEvent, ShutdownEvent,
                 ErrorEvent>;

struct BatchesPersistedMetric {
  std::uint64_t count = 0;
};

struct ReconnectAttemptsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<BatchesPersistedMetric, ReconnectAttemptsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace chatfetch::observability
