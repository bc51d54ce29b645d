#include "hitlgate/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace hitlgate::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

std::string bool_text(const bool value) { return value ? "true" : "false"; }

std::string level_for(const ObserverEvent &event) {
  if (std::holds_alternative<ErrorEvent>(event)) {
    return "ERROR";
  }
  if (std::holds_alternative<ResolveMissEvent>(event)) {
    return "WARN";
  }
  if (const auto *relay = std::get_if<RelayEvent>(&event); relay != nullptr && !relay->success) {
    return "WARN";
  }
  if (std::holds_alternative<SubscriberEvent>(event)) {
    return "DEBUG";
  }
  return "INFO";
}

} // namespace

std::string describe_event(const ObserverEvent &event) {
  return std::visit(
      [](auto &&evt) -> std::string {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, DialogSubmittedEvent>) {
          return "dialog.submitted id=" + evt.id + " workspace=" + evt.workspace +
                 " seq=" + std::to_string(evt.sequence_number);
        } else if constexpr (std::is_same_v<T, DialogResolvedEvent>) {
          return "dialog.resolved id=" + evt.id + " workspace=" + evt.workspace +
                 " continued=" + bool_text(evt.continued);
        } else if constexpr (std::is_same_v<T, ResolveMissEvent>) {
          return "dialog.resolve_miss id=" + evt.id;
        } else if constexpr (std::is_same_v<T, RoleChangedEvent>) {
          return "node.role role=" + evt.role + " port=" + std::to_string(evt.port);
        } else if constexpr (std::is_same_v<T, SubscriberEvent>) {
          return std::string("stream.") + (evt.connected ? "connected" : "disconnected") +
                 " subscribers=" + std::to_string(evt.count);
        } else if constexpr (std::is_same_v<T, RelayEvent>) {
          std::string line = "bridge.relay id=" + evt.id + " success=" + bool_text(evt.success);
          if (!evt.detail.empty()) {
            line += " detail=" + evt.detail;
          }
          return line;
        } else {
          return evt.component + ": " + evt.message;
        }
      },
      event);
}

void LogObserver::record_event(const ObserverEvent &event) {
  log_line(level_for(event), describe_event(event));
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, PendingDialogsMetric>) {
          log_line("DEBUG", "metric.pending_dialogs=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, SubscribersMetric>) {
          log_line("DEBUG", "metric.subscribers=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, DialogWaitMetric>) {
          log_line("DEBUG", "metric.dialog_wait_ms=" + std::to_string(m.wait.count()));
        }
      },
      metric);
}

} // namespace hitlgate::observability
