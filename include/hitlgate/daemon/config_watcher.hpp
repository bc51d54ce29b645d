#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <thread>

namespace hitlgate::daemon {

using PortChangeFn = std::function<void(std::uint16_t new_port)>;

/// Polls the config file's modification time and reports `server.port` changes.
class ConfigWatcher {
public:
  ConfigWatcher(std::filesystem::path config_file, std::uint16_t current_port,
                PortChangeFn on_port_change,
                std::chrono::milliseconds interval = std::chrono::milliseconds(2000));
  ~ConfigWatcher();

  void start();
  void stop();
  [[nodiscard]] bool is_running() const { return running_; }

  /// One check; public for tests. Returns true when a port change was reported.
  bool poll_once();

private:
  void watch_loop();

  std::filesystem::path config_file_;
  std::uint16_t current_port_;
  PortChangeFn on_port_change_;
  std::chrono::milliseconds interval_;
  std::filesystem::file_time_type last_write_{};
  bool seen_file_ = false;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

} // namespace hitlgate::daemon
