#pragma once

#include "chatfetch/observability/observer.hpp"

#include <memory>

namespace chatfetch::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_session_connected(const std::string &stream_id,
                              const std::optional<std::string> &page_token);
void record_connect_failed(const std::string &message);
void record_stream_ended(const std::optional<std::string> &offline_at = std::nullopt);
void record_transport_error(const std::string &message);
void record_reconnect_scheduled(std::chrono::milliseconds wait, std::uint64_t attempt);
void record_reconnect_attempt(std::uint64_t attempt, const std::optional<std::string> &page_token);
void record_batch(std::size_t items, const std::optional<std::string> &page_token,
                  bool persisted);
void record_shutdown(const std::string &reason);
void record_error(const std::string &component, const std::string &message);

} // namespace chatfetch::observability
