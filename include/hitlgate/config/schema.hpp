#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace hitlgate::config {

inline constexpr std::uint16_t kDefaultPort = 23987;

struct ServerConfig {
  std::string host = "127.0.0.1";
  std::uint16_t port = kDefaultPort;
  std::string version = "1.5.0";
  std::size_t max_body_bytes = 4 * 1024 * 1024;
};

struct FollowerConfig {
  std::uint32_t poll_interval_ms = 1000;
  std::uint32_t request_timeout_ms = 2000;
};

struct StreamConfig {
  std::uint32_t keepalive_secs = 30;
};

struct SnapshotConfig {
  bool enabled = true;
  std::uint32_t interval_secs = 30;
  std::string path; // empty: <config dir>/pending_dialogs.json
};

struct HistoryConfig {
  bool archive_enabled = false;
  std::string archive_path; // empty: <config dir>/history.db
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  ServerConfig server;
  FollowerConfig follower;
  StreamConfig stream;
  SnapshotConfig snapshot;
  HistoryConfig history;
  ObservabilityConfig observability;
  std::vector<std::string> workspaces;
};

} // namespace hitlgate::config
