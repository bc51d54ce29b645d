#include "test_framework.hpp"

#include "hitlgate/common/fs.hpp"
#include "hitlgate/common/json_util.hpp"
#include "hitlgate/daemon/config_watcher.hpp"
#include "hitlgate/daemon/daemon.hpp"
#include "hitlgate/daemon/snapshot_writer.hpp"
#include "hitlgate/dialog/history_archive.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <atomic>
#include <filesystem>
#include <vector>

namespace {

namespace dm = hitlgate::daemon;
namespace dl = hitlgate::dialog;
namespace common = hitlgate::common;
using hitlgate::testing::TempDir;

/// Pushes the mtime forward so a rewrite within the same clock tick is still noticed.
void touch_forward(const std::filesystem::path &path, const int seconds) {
  std::filesystem::last_write_time(
      path, std::filesystem::last_write_time(path) + std::chrono::seconds(seconds));
}

} // namespace

void register_daemon_tests(std::vector<hitlgate::tests::TestCase> &tests) {
  using hitlgate::tests::require;

  tests.push_back({"snapshot_json_lists_pending_dialogs", [] {
                     dl::DialogRequest request;
                     request.id = "dialog_1_a";
                     request.reason = "say \"hi\"";
                     request.workspace = "/w";
                     request.sequence_number = 4;
                     request.submitted_at_ms = 1700000000000;
                     const auto json = dm::snapshot_json({request}, "2024-01-01T00:00:00Z");
                     require(common::json_is_valid(json), "valid json");

                     const auto parsed = dm::parse_snapshot(json);
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().written_at == "2024-01-01T00:00:00Z", "writtenAt");
                     require(parsed.value().dialogs.size() == 1, "one dialog");
                     const auto &back = parsed.value().dialogs[0];
                     require(back.reason == "say \"hi\"" && back.sequence_number == 4, "fields");
                     require(back.submitted_at_ms == 1700000000000, "timestamp");

                     require(!dm::parse_snapshot("{\"dialogs\":").ok(), "truncated file");
                     require(!dm::parse_snapshot("{}").ok(), "no dialogs array");
                   }});

  tests.push_back({"load_snapshot_missing_is_not_found", [] {
                     TempDir dir;
                     require(dm::load_snapshot(dir.path() / "none.json").code() ==
                                 common::StatusCode::NotFound,
                             "NotFound");
                   }});

  tests.push_back({"snapshot_writer_follows_registry_and_gate", [] {
                     TempDir dir;
                     auto registry = std::make_shared<dl::PendingRegistry>();
                     const auto path = dir.path() / "pending.json";
                     dm::SnapshotWriter writer(registry, path, std::chrono::seconds(60));
                     writer.start();
                     require(hitlgate::testing::wait_until(
                                 [&path]() { return std::filesystem::exists(path); }),
                             "initial snapshot");

                     const auto ticket = registry->submit("r", "/w");
                     auto loaded = dm::load_snapshot(path);
                     require(loaded.ok() && loaded.value().dialogs.size() == 1,
                             "submit rewrites the snapshot");

                     std::atomic<bool> leading{false};
                     writer.set_gate([&leading]() { return leading.load(); });
                     require(registry->resolve(ticket.request.id, dl::DialogResolution{}).ok(),
                             "resolve");
                     loaded = dm::load_snapshot(path);
                     require(loaded.value().dialogs.size() == 1,
                             "gated writer must leave the file alone");

                     leading = true;
                     require(writer.write_now().ok(), "write_now");
                     loaded = dm::load_snapshot(path);
                     require(loaded.value().dialogs.empty(), "resolved dialog dropped");
                     writer.stop();
                     require(!writer.is_running(), "stopped");
                   }});

  tests.push_back({"config_watcher_reports_port_changes_only", [] {
                     TempDir dir;
                     const auto path = dir.create_file("config.toml", "[server]\nport = 24001\n");
                     std::vector<std::uint16_t> changes;
                     dm::ConfigWatcher watcher(path, 24001, [&changes](const std::uint16_t port) {
                       changes.push_back(port);
                     });
                     require(!watcher.poll_once(), "unchanged file");

                     (void)common::write_file_atomic(path, "[server]\nport = 24001\n# note\n");
                     touch_forward(path, 2);
                     require(!watcher.poll_once(), "same port is not a change");

                     (void)common::write_file_atomic(path, "[server]\nport = 0\n");
                     touch_forward(path, 4);
                     require(!watcher.poll_once(), "invalid config ignored");

                     (void)common::write_file_atomic(path, "[server]\nport = 24002\n");
                     touch_forward(path, 6);
                     require(watcher.poll_once(), "port change reported");
                     require(changes == std::vector<std::uint16_t>{24002}, "callback port");
                     require(!watcher.poll_once(), "reported once");
                   }});

  tests.push_back({"daemon_presents_restored_dialogs_to_leader", [] {
                     TempDir dir;
                     auto config =
                         hitlgate::testing::node_config(dir, hitlgate::testing::free_port());
                     config.workspaces = {"/proj/a"};
                     dl::DialogRequest mine;
                     mine.id = "dialog_1_mine";
                     mine.reason = "left over";
                     mine.workspace = "/proj/a";
                     dl::DialogRequest theirs = mine;
                     theirs.id = "dialog_2_theirs";
                     theirs.workspace = "/proj/b";
                     (void)common::write_file_atomic(
                         config.snapshot.path, dm::snapshot_json({mine, theirs}, "earlier"));

                     auto presenter = std::make_shared<hitlgate::testing::RecordingPresenter>();
                     dm::Daemon daemon(config);
                     dm::DaemonOptions options;
                     options.presenter = presenter;
                     require(daemon.start(options).ok(), "start");
                     require(daemon.node()->role() == hitlgate::node::Role::Leader, "leader");

                     const auto restored = presenter->restored_requests();
                     require(restored.size() == 1 && restored[0].id == "dialog_1_mine",
                             "only this workspace's dialogs are restored");
                     require(daemon.node()->registry()->pending_count() == 0,
                             "restored dialogs are never re-registered");
                     require(hitlgate::testing::wait_until([&config]() {
                               const auto loaded = dm::load_snapshot(config.snapshot.path);
                               return loaded.ok() && loaded.value().dialogs.empty();
                             }),
                             "the new run replaces the old snapshot");
                     daemon.stop();
                     require(!daemon.is_running(), "stopped");
                   }});

  tests.push_back({"daemon_archives_history_when_enabled", [] {
                     TempDir dir;
                     auto config =
                         hitlgate::testing::node_config(dir, hitlgate::testing::free_port());
                     config.history.archive_enabled = true;
                     {
                       dm::Daemon daemon(config);
                       require(daemon.start(dm::DaemonOptions{}).ok(), "start");
                       auto registry = daemon.node()->registry();
                       const auto ticket = registry->submit("archived?", "/proj");
                       dl::DialogResolution answer;
                       answer.should_continue = true;
                       answer.user_input = "yes";
                       require(registry->resolve(ticket.request.id, answer).ok(), "resolve");
                       daemon.stop();
                     }
                     dl::HistoryArchive archive(config.history.archive_path);
                     require(archive.is_open(), "archive should open");
                     const auto rows = archive.entries(std::nullopt, 10);
                     require(rows.ok(), rows.error());
                     require(rows.value().size() == 1 && rows.value()[0].entry.user_input == "yes",
                             "history persisted");
                   }});

  tests.push_back({"daemon_rebinds_when_config_port_changes", [] {
                     TempDir dir;
                     const auto first = hitlgate::testing::free_port();
                     const auto config = hitlgate::testing::node_config(dir, first);
                     const auto path = dir.create_file(
                         "config.toml", "[server]\nport = " + std::to_string(first) + "\n");

                     dm::Daemon daemon(config);
                     dm::DaemonOptions options;
                     options.watch_config = path;
                     options.watch_interval = std::chrono::milliseconds(100);
                     require(daemon.start(options).ok(), "start");

                     const auto second = hitlgate::testing::free_port();
                     (void)common::write_file_atomic(
                         path, "[server]\nport = " + std::to_string(second) + "\n");
                     touch_forward(path, 2);
                     require(hitlgate::testing::wait_until(
                                 [&daemon, second]() { return daemon.node()->port() == second; }),
                             "node should move to the new port");
                     require(hitlgate::testing::http_request(second, "GET", "/health").status == 200,
                             "serving on the new port");
                     daemon.stop();
                   }});
}
