#include "test_framework.hpp"

#include "hitlgate/common/fs.hpp"
#include "hitlgate/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <fstream>

namespace {

using hitlgate::testing::ConfigOverrideGuard;
using hitlgate::testing::EnvGuard;
using hitlgate::testing::TempDir;

void write_file(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  out << content;
}

} // namespace

void register_config_tests(std::vector<hitlgate::tests::TestCase> &tests) {
  using hitlgate::tests::require;
  namespace cfg = hitlgate::config;

  tests.push_back({"config_dir_creates_directory", [] {
                     TempDir home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const ConfigOverrideGuard no_override;
                     const EnvGuard env_path("HITLGATE_CONFIG_PATH", std::nullopt);
                     const auto dir = cfg::config_dir();
                     require(dir.ok(), dir.error());
                     require(dir.value() == home.path() / ".hitlgate", "unexpected config dir");
                     require(std::filesystem::exists(dir.value()), "config directory should exist");
                   }});

  tests.push_back({"load_config_missing_file_returns_defaults", [] {
                     TempDir home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const ConfigOverrideGuard no_override;
                     const EnvGuard env_path("HITLGATE_CONFIG_PATH", std::nullopt);
                     const EnvGuard env_port("HITLGATE_PORT", std::nullopt);
                     const EnvGuard env_legacy("AI_CHAT_HITL_PORT", std::nullopt);
                     const EnvGuard env_ws("HITLGATE_WORKSPACES", std::nullopt);

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().server.port == cfg::kDefaultPort, "default port");
                     require(loaded.value().server.host == "127.0.0.1", "default host");
                     require(loaded.value().snapshot.enabled, "snapshots default on");
                     require(!loaded.value().history.archive_enabled, "archive default off");
                     require(loaded.value().workspaces.empty(), "no default workspaces");
                   }});

  tests.push_back({"load_config_valid_toml", [] {
                     TempDir home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const EnvGuard env_port("HITLGATE_PORT", std::nullopt);
                     const EnvGuard env_legacy("AI_CHAT_HITL_PORT", std::nullopt);
                     const EnvGuard env_ws("HITLGATE_WORKSPACES", std::nullopt);
                     const ConfigOverrideGuard cfg_override(home.path() / "config.toml");

                     write_file(home.path() / "config.toml", R"(
workspaces = ["/work/a", "/work/b"]

[server]
port = 24001
max_body_bytes = 65536

[follower]
poll_interval_ms = 250

[snapshot]
enabled = false

[history]
archive_enabled = true
archive_path = "/tmp/hitlgate-history.db"
)");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.server.port == 24001, "port");
                     require(config.server.max_body_bytes == 65536, "max body");
                     require(config.follower.poll_interval_ms == 250, "poll interval");
                     require(config.follower.request_timeout_ms == 2000, "timeout keeps default");
                     require(!config.snapshot.enabled, "snapshot disabled");
                     require(config.history.archive_enabled, "archive enabled");
                     require(config.workspaces.size() == 2 && config.workspaces[0] == "/work/a",
                             "workspaces");
                   }});

  tests.push_back({"parse_config_rejects_out_of_range_port", [] {
                     const auto zero = cfg::parse_config("[server]\nport = 0\n");
                     require(!zero.ok(), "port 0 should fail");
                     require(zero.code() == hitlgate::common::StatusCode::InvalidArgument,
                             "invalid argument expected");
                     require(!cfg::parse_config("[server]\nport = 70000\n").ok(),
                             "port above 65535 should fail");
                   }});

  tests.push_back({"env_overrides_port_and_workspaces", [] {
                     const EnvGuard legacy("AI_CHAT_HITL_PORT", "24100");
                     const EnvGuard env_ws("HITLGATE_WORKSPACES", "/w/one:/w/two");
                     const EnvGuard env_port("HITLGATE_PORT", std::nullopt);
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.server.port == 24100, "legacy port variable");
                     require(config.workspaces.size() == 2 && config.workspaces[1] == "/w/two",
                             "workspace list");

                     const EnvGuard env_port_set("HITLGATE_PORT", "24200");
                     cfg::apply_env_overrides(config);
                     require(config.server.port == 24200, "HITLGATE_PORT wins over the legacy name");
                   }});

  tests.push_back({"env_override_ignores_bad_port", [] {
                     const EnvGuard env_port("HITLGATE_PORT", "not-a-port");
                     const EnvGuard legacy("AI_CHAT_HITL_PORT", std::nullopt);
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.server.port == cfg::kDefaultPort, "bad value must be ignored");
                   }});

  tests.push_back({"save_config_round_trips", [] {
                     TempDir home;
                     const ConfigOverrideGuard cfg_override(home.path() / "config.toml");
                     cfg::Config config;
                     config.server.port = 24555;
                     config.workspaces = {"/srv/project"};
                     config.history.archive_enabled = true;
                     config.observability.backend = "noop";
                     require(cfg::save_config(config).ok(), "save failed");

                     const auto text =
                         hitlgate::common::read_file(home.path() / "config.toml");
                     require(text.ok(), text.error());
                     const auto parsed = cfg::parse_config(text.value());
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().server.port == 24555, "port lost");
                     require(parsed.value().workspaces == config.workspaces, "workspaces lost");
                     require(parsed.value().history.archive_enabled, "archive flag lost");
                     require(parsed.value().observability.backend == "noop", "backend lost");
                   }});

  tests.push_back({"validate_config_hard_errors_and_warnings", [] {
                     cfg::Config config;
                     const auto ok = cfg::validate_config(config);
                     require(ok.ok() && ok.value().empty(), "defaults should validate cleanly");

                     config.server.host = "0.0.0.0";
                     require(!cfg::validate_config(config).ok(), "non-loopback host must fail");
                     config.server.host = "localhost";

                     config.server.port = 80;
                     require(!cfg::validate_config(config).ok(), "privileged port must fail");
                     config.server.port = cfg::kDefaultPort;

                     config.workspaces = {"relative/dir"};
                     config.server.max_body_bytes = 100;
                     const auto warned = cfg::validate_config(config);
                     require(warned.ok(), warned.error());
                     require(warned.value().size() == 2, "expected two warnings");
                   }});

  tests.push_back({"snapshot_and_archive_paths_default_to_config_dir", [] {
                     TempDir home;
                     const ConfigOverrideGuard cfg_override(home.path() / "config.toml");
                     cfg::Config config;
                     const auto snapshot = cfg::snapshot_path(config);
                     const auto archive = cfg::archive_path(config);
                     require(snapshot.ok() && archive.ok(), "paths should resolve");
                     require(snapshot.value() == home.path() / "pending_dialogs.json",
                             "snapshot path");
                     require(archive.value() == home.path() / "history.db", "archive path");

                     config.snapshot.path = "/tmp/explicit.json";
                     require(cfg::snapshot_path(config).value() == "/tmp/explicit.json",
                             "explicit snapshot path");
                   }});
}
