#include "hitlgate/daemon/config_watcher.hpp"

#include "hitlgate/common/fs.hpp"
#include "hitlgate/config/config.hpp"
#include "hitlgate/health/health.hpp"

#include <iostream>

namespace hitlgate::daemon {

ConfigWatcher::ConfigWatcher(std::filesystem::path config_file, const std::uint16_t current_port,
                             PortChangeFn on_port_change, const std::chrono::milliseconds interval)
    : config_file_(std::move(config_file)), current_port_(current_port),
      on_port_change_(std::move(on_port_change)), interval_(interval) {
  std::error_code ec;
  const auto mtime = std::filesystem::last_write_time(config_file_, ec);
  if (!ec) {
    last_write_ = mtime;
    seen_file_ = true;
  }
}

ConfigWatcher::~ConfigWatcher() { stop(); }

void ConfigWatcher::start() {
  if (running_) {
    return;
  }
  running_ = true;
  health::mark_component_ok("watcher");
  thread_ = std::thread([this]() { watch_loop(); });
}

void ConfigWatcher::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
    health::mark_component_stopped("watcher");
  }
}

void ConfigWatcher::watch_loop() {
  constexpr auto kSlice = std::chrono::milliseconds(100);
  while (running_) {
    auto waited = std::chrono::milliseconds(0);
    while (running_ && waited < interval_) {
      std::this_thread::sleep_for(kSlice);
      waited += kSlice;
    }
    if (running_) {
      (void)poll_once();
    }
  }
}

bool ConfigWatcher::poll_once() {
  std::error_code ec;
  const auto mtime = std::filesystem::last_write_time(config_file_, ec);
  if (ec || (seen_file_ && mtime == last_write_)) {
    return false;
  }
  last_write_ = mtime;
  seen_file_ = true;

  auto text = common::read_file(config_file_);
  if (!text.ok()) {
    health::mark_component_error("watcher", text.error());
    return false;
  }
  auto parsed = config::parse_config(text.value());
  if (!parsed.ok()) {
    health::mark_component_error("watcher", parsed.error());
    std::cerr << "[hitlgate][watcher] ignoring invalid config: " << parsed.error() << "\n";
    return false;
  }
  health::mark_component_ok("watcher");

  const std::uint16_t port = parsed.value().server.port;
  if (port == current_port_) {
    return false;
  }
  std::cerr << "[hitlgate][watcher] server.port changed " << current_port_ << " -> " << port
            << "\n";
  current_port_ = port;
  if (on_port_change_) {
    on_port_change_(port);
  }
  return true;
}

} // namespace hitlgate::daemon
