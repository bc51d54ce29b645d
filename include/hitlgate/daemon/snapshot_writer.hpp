#pragma once

#include "hitlgate/common/result.hpp"
#include "hitlgate/dialog/registry.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace hitlgate::daemon {

struct PendingSnapshot {
  std::string written_at;
  std::vector<dialog::DialogRequest> dialogs;
};

[[nodiscard]] std::string snapshot_json(const std::vector<dialog::DialogRequest> &dialogs,
                                        const std::string &written_at);
[[nodiscard]] common::Result<PendingSnapshot> parse_snapshot(const std::string &json);
/// NotFound when no snapshot exists yet.
[[nodiscard]] common::Result<PendingSnapshot> load_snapshot(const std::filesystem::path &path);

/// Keeps a best-effort copy of the pending dialogs on disk: periodically, on every registry
/// change, and once more on stop. The file is informational; nothing is ever resolved from it.
class SnapshotWriter {
public:
  SnapshotWriter(std::shared_ptr<dialog::PendingRegistry> registry,
                 std::filesystem::path snapshot_file,
                 std::chrono::seconds interval = std::chrono::seconds(30));
  ~SnapshotWriter();

  void start();
  void stop();
  [[nodiscard]] bool is_running() const { return running_; }

  /// Writes are skipped while `gate` returns false (a Follower must not clobber the Leader's
  /// file, which lives at the same path).
  void set_gate(std::function<bool()> gate);

  common::Status write_now();
  [[nodiscard]] const std::filesystem::path &path() const { return snapshot_file_; }

private:
  void write_loop();

  std::shared_ptr<dialog::PendingRegistry> registry_;
  std::filesystem::path snapshot_file_;
  std::chrono::seconds interval_;
  std::mutex write_mutex_;
  std::function<bool()> gate_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

} // namespace hitlgate::daemon
