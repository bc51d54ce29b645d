#pragma once

#include "hitlgate/observability/observer.hpp"

#include <memory>
#include <string>

namespace hitlgate::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_dialog_submitted(const std::string &id, const std::string &workspace,
                             std::uint64_t sequence_number);
void record_dialog_resolved(const std::string &id, const std::string &workspace, bool continued,
                            std::chrono::milliseconds wait);
void record_resolve_miss(const std::string &id);
void record_role_changed(const std::string &role, std::uint16_t port);
void record_subscribers(bool connected, std::uint64_t count);
void record_relay(const std::string &id, bool success, const std::string &detail);
void record_error(const std::string &component, const std::string &message);

} // namespace hitlgate::observability
