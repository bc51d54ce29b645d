#pragma once

#include "hitlgate/common/result.hpp"
#include "hitlgate/config/schema.hpp"
#include "hitlgate/daemon/config_watcher.hpp"
#include "hitlgate/daemon/snapshot_writer.hpp"
#include "hitlgate/dialog/history_archive.hpp"
#include "hitlgate/node/node.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>

namespace hitlgate::daemon {

struct DaemonOptions {
  std::shared_ptr<node::IDialogPresenter> presenter;
  /// Config file to watch for port changes; nothing is watched when unset.
  std::optional<std::filesystem::path> watch_config;
  std::chrono::milliseconds watch_interval{2000};
};

/// A long-running front-end: the node plus its snapshot writer, history archive and config
/// watcher.
class Daemon {
public:
  explicit Daemon(config::Config config);
  ~Daemon();

  Daemon(const Daemon &) = delete;
  Daemon &operator=(const Daemon &) = delete;

  [[nodiscard]] common::Status start(const DaemonOptions &options);
  void stop();
  [[nodiscard]] bool is_running() const { return running_; }

  [[nodiscard]] node::Node *node() { return node_.get(); }

private:
  void on_port_change(std::uint16_t port);

  config::Config config_;
  DaemonOptions options_;
  std::unique_ptr<node::Node> node_;
  std::shared_ptr<dialog::HistoryArchive> archive_;
  std::unique_ptr<SnapshotWriter> snapshot_writer_;
  std::unique_ptr<ConfigWatcher> watcher_;
  bool running_ = false;
};

} // namespace hitlgate::daemon
