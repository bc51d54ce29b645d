#pragma once

#include "hitlgate/bridge/leader_client.hpp"
#include "hitlgate/dialog/types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace hitlgate::bridge {

using ClaimCallback = std::function<void(const dialog::DialogRequest &)>;

struct PollingBridgeOptions {
  std::chrono::milliseconds interval{1000};
  std::uint64_t request_timeout_ms = 2000;
};

/// Follower side of the coordination protocol: polls the Leader for pending dialogs relevant
/// to each local workspace and relays local resolutions back. Every network failure is
/// absorbed; the next tick simply tries again.
class PollingBridge {
public:
  PollingBridge(std::shared_ptr<LeaderClient> client, std::vector<std::string> local_workspaces,
                PollingBridgeOptions options = {});
  ~PollingBridge();

  PollingBridge(const PollingBridge &) = delete;
  PollingBridge &operator=(const PollingBridge &) = delete;

  void set_claim_callback(ClaimCallback callback);

  void start();
  void stop();
  [[nodiscard]] bool is_running() const { return running_; }

  /// One poll of the Leader. Public so tests can drive the bridge without the timer.
  void tick();

  /// Posts the resolution to the Leader. Any HTTP answer (including 404) ends tracking of
  /// the id; a network failure keeps it.
  [[nodiscard]] common::Status relay(const std::string &id,
                                     const dialog::DialogResolution &resolution);

  [[nodiscard]] bool has_seen(const std::string &id) const;
  [[nodiscard]] std::size_t seen_count() const;
  [[nodiscard]] const std::vector<std::string> &local_workspaces() const {
    return local_workspaces_;
  }

private:
  void poll_loop();

  std::shared_ptr<LeaderClient> client_;
  std::vector<std::string> local_workspaces_;
  PollingBridgeOptions options_;

  mutable std::mutex mutex_;
  std::unordered_set<std::string> seen_;
  ClaimCallback on_claim_;

  std::mutex tick_mutex_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

} // namespace hitlgate::bridge
