#pragma once

#include "hitlgate/observability/observer.hpp"

namespace hitlgate::observability {

/// Writes one `[LEVEL] message` line per event to stderr. Stdout belongs to the stdio
/// transport and is never touched here.
class LogObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "log"; }
};

[[nodiscard]] std::string describe_event(const ObserverEvent &event);

} // namespace hitlgate::observability
