#include "hitlgate/bridge/polling_bridge.hpp"

#include "hitlgate/health/health.hpp"
#include "hitlgate/observability/global.hpp"

#include <iostream>
#include <optional>

namespace hitlgate::bridge {

PollingBridge::PollingBridge(std::shared_ptr<LeaderClient> client,
                             std::vector<std::string> local_workspaces,
                             PollingBridgeOptions options)
    : client_(std::move(client)), local_workspaces_(std::move(local_workspaces)),
      options_(options) {}

PollingBridge::~PollingBridge() { stop(); }

void PollingBridge::set_claim_callback(ClaimCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  on_claim_ = std::move(callback);
}

void PollingBridge::start() {
  if (running_) {
    return;
  }
  running_ = true;
  health::mark_component_starting("bridge");
  std::cerr << "[hitlgate][bridge] polling " << client_->base_url() << " every "
            << options_.interval.count() << "ms\n";
  thread_ = std::thread([this]() { poll_loop(); });
}

void PollingBridge::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
    health::mark_component_stopped("bridge");
  }
}

void PollingBridge::poll_loop() {
  constexpr auto kSlice = std::chrono::milliseconds(50);
  while (running_) {
    tick();
    auto waited = std::chrono::milliseconds(0);
    while (running_ && waited < options_.interval) {
      std::this_thread::sleep_for(kSlice);
      waited += kSlice;
    }
  }
}

void PollingBridge::tick() {
  // Serializes the timer thread and direct callers so a claim is never surfaced twice.
  std::lock_guard<std::mutex> tick_lock(tick_mutex_);

  // One query per open workspace, merged by id; no workspace means one unfiltered query.
  std::vector<std::optional<std::string>> filters;
  if (local_workspaces_.empty()) {
    filters.emplace_back(std::nullopt);
  }
  for (const auto &workspace : local_workspaces_) {
    filters.emplace_back(workspace);
  }

  std::vector<dialog::DialogRequest> listed;
  std::unordered_set<std::string> listed_ids;
  for (const auto &filter : filters) {
    auto pending = client_->pending(filter, options_.request_timeout_ms);
    if (!pending.ok()) {
      // A partial listing would prune ids that are still pending.
      health::mark_component_error("bridge", pending.error());
      return;
    }
    for (auto &request : pending.value()) {
      if (listed_ids.insert(request.id).second) {
        listed.push_back(std::move(request));
      }
    }
  }
  health::mark_component_ok("bridge");

  std::vector<dialog::DialogRequest> fresh;
  ClaimCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &request : listed) {
      if (seen_.insert(request.id).second) {
        fresh.push_back(request);
      }
    }
    // Drop ids the Leader no longer lists (resolved elsewhere).
    for (auto it = seen_.begin(); it != seen_.end();) {
      it = listed_ids.contains(*it) ? std::next(it) : seen_.erase(it);
    }
    callback = on_claim_;
  }

  if (!callback) {
    return;
  }
  for (const auto &request : fresh) {
    callback(request);
  }
}

common::Status PollingBridge::relay(const std::string &id,
                                    const dialog::DialogResolution &resolution) {
  const auto status = client_->respond(id, resolution, options_.request_timeout_ms);
  if (status.ok() || status.code() != common::StatusCode::Unavailable) {
    std::lock_guard<std::mutex> lock(mutex_);
    seen_.erase(id);
  }
  observability::record_relay(id, status.ok(), status.ok() ? "" : status.error());
  return status;
}

bool PollingBridge::has_seen(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return seen_.contains(id);
}

std::size_t PollingBridge::seen_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return seen_.size();
}

} // namespace hitlgate::bridge
