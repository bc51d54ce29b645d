#include "hitlgate/daemon/daemon.hpp"

#include "hitlgate/config/config.hpp"
#include "hitlgate/dialog/router.hpp"
#include "hitlgate/health/health.hpp"
#include "hitlgate/observability/global.hpp"

#include <iostream>
#include <thread>

namespace hitlgate::daemon {

Daemon::Daemon(config::Config config) : config_(std::move(config)) {}

Daemon::~Daemon() { stop(); }

common::Status Daemon::start(const DaemonOptions &options) {
  if (running_) {
    return common::Status::error("daemon already running");
  }
  options_ = options;
  node_ = std::make_unique<node::Node>(config_, options_.presenter);

  if (config_.history.archive_enabled) {
    auto path = config::archive_path(config_);
    if (!path.ok()) {
      return path.status();
    }
    archive_ = std::make_shared<dialog::HistoryArchive>(path.value());
    if (archive_->is_open()) {
      node_->registry()->set_history_sink(archive_);
    } else {
      std::cerr << "[hitlgate][archive] unable to open " << path.value().string()
                << "; history stays in memory only\n";
    }
  }

  // Read the previous run's snapshot before this run's writer replaces it.
  std::optional<PendingSnapshot> previous;
  std::optional<std::filesystem::path> snapshot_file;
  if (config_.snapshot.enabled) {
    auto path = config::snapshot_path(config_);
    if (!path.ok()) {
      return path.status();
    }
    snapshot_file = path.value();
    auto loaded = load_snapshot(path.value());
    if (loaded.ok()) {
      previous = std::move(loaded.value());
    } else if (loaded.code() != common::StatusCode::NotFound) {
      std::cerr << "[hitlgate][snapshot] ignoring unreadable snapshot: " << loaded.error()
                << "\n";
    }
  }

  if (config_.workspaces.empty()) {
    std::cerr << "[hitlgate][daemon] no workspaces configured; claiming dialogs from every "
                 "workspace\n";
  }

  const auto started = node_->start();
  if (!started.ok()) {
    node_.reset();
    return started;
  }

  if (previous.has_value() && node_->role() == node::Role::Leader &&
      options_.presenter != nullptr) {
    std::vector<dialog::DialogRequest> mine;
    for (const auto &request : previous->dialogs) {
      if (dialog::should_claim(request.workspace, config_.workspaces)) {
        std::cerr << "[hitlgate][snapshot] outstanding from previous run: " << request.id
                  << "\n";
        mine.push_back(request);
      }
    }
    if (!mine.empty()) {
      options_.presenter->restored(mine);
    }
  }

  if (snapshot_file.has_value()) {
    snapshot_writer_ = std::make_unique<SnapshotWriter>(
        node_->registry(), *snapshot_file, std::chrono::seconds(config_.snapshot.interval_secs));
    const auto *owner = node_.get();
    snapshot_writer_->set_gate([owner]() { return owner->role() == node::Role::Leader; });
    snapshot_writer_->start();
  }

  if (options_.watch_config.has_value()) {
    watcher_ = std::make_unique<ConfigWatcher>(
        *options_.watch_config, node_->port(),
        [this](const std::uint16_t port) { on_port_change(port); }, options_.watch_interval);
    watcher_->start();
  }

  running_ = true;
  return common::Status::success();
}

void Daemon::on_port_change(const std::uint16_t port) {
  std::chrono::milliseconds backoff(500);
  for (int attempt = 0; attempt < 5; ++attempt) {
    const auto status = node_->rebind(port);
    if (status.ok()) {
      return;
    }
    health::mark_component_error("server", status.error());
    health::bump_component_restart("server");
    observability::record_error("daemon", "rebind to " + std::to_string(port) +
                                              " failed: " + status.error());
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

void Daemon::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  if (watcher_ != nullptr) {
    watcher_->stop();
    watcher_.reset();
  }
  // The final snapshot is written while the node still holds its role.
  if (snapshot_writer_ != nullptr) {
    snapshot_writer_->stop();
    snapshot_writer_.reset();
  }
  if (node_ != nullptr) {
    node_->stop();
  }
  node_.reset();
  archive_.reset();
}

} // namespace hitlgate::daemon
