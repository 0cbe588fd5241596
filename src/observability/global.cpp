#include "chatfetch/observability/global.hpp"

#include <mutex>

namespace chatfetch::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_session_connected(const std::string &stream_id,
                              const std::optional<std::string> &page_token) {
  record_event(SessionConnectedEvent{.stream_id = stream_id, .page_token = page_token});
}

void record_connect_failed(const std::string &message) {
  record_event(ConnectFailedEvent{.message = message});
}

void record_stream_ended(const std::optional<std::string> &offline_at) {
  record_event(StreamEndedEvent{.offline_at = offline_at});
}

void record_transport_error(const std::string &message) {
  record_event(TransportErrorEvent{.message = message});
}

void record_reconnect_scheduled(std::chrono::milliseconds wait, const std::uint64_t attempt) {
  record_event(ReconnectScheduledEvent{.wait = wait, .attempt = attempt});
}

void record_reconnect_attempt(const std::uint64_t attempt,
                              const std::optional<std::string> &page_token) {
  record_event(ReconnectAttemptEvent{.attempt = attempt, .page_token = page_token});
}

void record_batch(const std::size_t items, const std::optional<std::string> &page_token,
                  const bool persisted) {
  record_event(BatchEvent{.items = items, .page_token = page_token, .persisted = persisted});
}

void record_shutdown(const std::string &reason) { record_event(ShutdownEvent{.reason = reason}); }

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace chatfetch::observability
