#pragma once

#include "chatfetch/observability/observer.hpp"

namespace chatfetch::observability {

/// Writes one "[LEVEL] event key=value" line per event to stderr.
class LogObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }
};

} // namespace chatfetch::observability
