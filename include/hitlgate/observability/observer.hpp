#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace hitlgate::observability {

struct DialogSubmittedEvent {
  std::string id;
  std::string workspace;
  std::uint64_t sequence_number = 0;
};

struct DialogResolvedEvent {
  std::string id;
  std::string workspace;
  bool continued = false;
};

/// A resolve attempt for an id that is not (or no longer) pending.
struct ResolveMissEvent {
  std::string id;
};

struct RoleChangedEvent {
  std::string role;
  std::uint16_t port = 0;
};

struct SubscriberEvent {
  bool connected = false;
  std::uint64_t count = 0;
};

struct RelayEvent {
  std::string id;
  bool success = false;
  std::string detail;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<DialogSubmittedEvent, DialogResolvedEvent, ResolveMissEvent, RoleChangedEvent,
                 SubscriberEvent, RelayEvent, ErrorEvent>;

struct PendingDialogsMetric {
  std::uint64_t count = 0;
};

struct SubscribersMetric {
  std::uint64_t count = 0;
};

/// Time between submit and resolve of one dialog.
struct DialogWaitMetric {
  std::chrono::milliseconds wait{0};
};

using ObserverMetric = std::variant<PendingDialogsMetric, SubscribersMetric, DialogWaitMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace hitlgate::observability
