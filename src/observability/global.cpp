#include "hitlgate/observability/global.hpp"

#include <mutex>

namespace hitlgate::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

// The lock is held across the call so a concurrent set_global_observer cannot free the
// observer mid-record, and log lines from connection threads do not interleave.
void record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_metric(metric);
  }
}

void record_dialog_submitted(const std::string &id, const std::string &workspace,
                             const std::uint64_t sequence_number) {
  record_event(DialogSubmittedEvent{
      .id = id, .workspace = workspace, .sequence_number = sequence_number});
}

void record_dialog_resolved(const std::string &id, const std::string &workspace,
                            const bool continued, const std::chrono::milliseconds wait) {
  record_event(DialogResolvedEvent{.id = id, .workspace = workspace, .continued = continued});
  record_metric(DialogWaitMetric{.wait = wait});
}

void record_resolve_miss(const std::string &id) { record_event(ResolveMissEvent{.id = id}); }

void record_role_changed(const std::string &role, const std::uint16_t port) {
  record_event(RoleChangedEvent{.role = role, .port = port});
}

void record_subscribers(const bool connected, const std::uint64_t count) {
  record_event(SubscriberEvent{.connected = connected, .count = count});
  record_metric(SubscribersMetric{.count = count});
}

void record_relay(const std::string &id, const bool success, const std::string &detail) {
  record_event(RelayEvent{.id = id, .success = success, .detail = detail});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace hitlgate::observability
