#include "chatfetch/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace chatfetch::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

std::string token_or_none(const std::optional<std::string> &token) {
  return token.has_value() ? *token : std::string("<none>");
}

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SessionConnectedEvent>) {
          log_line("INFO", "session.connected stream_id=" + evt.stream_id +
                               " page_token=" + token_or_none(evt.page_token));
        } else if constexpr (std::is_same_v<T, ConnectFailedEvent>) {
          log_line("WARN", "session.connect_failed error=" + evt.message);
        } else if constexpr (std::is_same_v<T, StreamEndedEvent>) {
          if (evt.offline_at.has_value()) {
            log_line("INFO", "stream.ended offline_at=" + *evt.offline_at);
          } else {
            log_line("INFO", "stream.ended");
          }
        } else if constexpr (std::is_same_v<T, TransportErrorEvent>) {
          log_line("WARN", "stream.transport_error error=" + evt.message);
        } else if constexpr (std::is_same_v<T, ReconnectScheduledEvent>) {
          log_line("INFO", "reconnect.scheduled wait_ms=" + std::to_string(evt.wait.count()) +
                               " attempt=" + std::to_string(evt.attempt));
        } else if constexpr (std::is_same_v<T, ReconnectAttemptEvent>) {
          log_line("INFO", "reconnect.attempt attempt=" + std::to_string(evt.attempt) +
                               " page_token=" + token_or_none(evt.page_token));
        } else if constexpr (std::is_same_v<T, BatchEvent>) {
          log_line("DEBUG", "stream.batch items=" + std::to_string(evt.items) +
                                " page_token=" + token_or_none(evt.page_token) + " persisted=" +
                                (evt.persisted ? std::string("true") : std::string("false")));
        } else if constexpr (std::is_same_v<T, ShutdownEvent>) {
          log_line("INFO", "shutdown reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, BatchesPersistedMetric>) {
          log_line("DEBUG", "metric.batches_persisted=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, ReconnectAttemptsMetric>) {
          log_line("DEBUG", "metric.reconnect_attempts=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() { std::cerr.flush(); }

} // namespace chatfetch::observability
