#include "hitlgate/config/config.hpp"

#include "hitlgate/common/fs.hpp"
#include "hitlgate/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <vector>

namespace hitlgate::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".hitlgate";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *SNAPSHOT_FILENAME = "pending_dialogs.json";
constexpr const char *ARCHIVE_FILENAME = "history.db";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("HITLGATE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      out.push_back(ch == 'n' ? '\n' : ch == 't' ? '\t' : ch);
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }
  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }
    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (!key.empty()) {
      set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
    }
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("HITLGATE_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  // Config dir .env wins over cwd .env because set_env_if_missing keeps the first value.
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }
  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

std::optional<std::uint16_t> parse_port(const std::string &raw) {
  const std::string trimmed = common::trim(raw);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  std::uint64_t value = 0;
  for (const char ch : trimmed) {
    if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
      return std::nullopt;
    }
    value = value * 10 + static_cast<std::uint64_t>(ch - '0');
    if (value > std::numeric_limits<std::uint16_t>::max()) {
      return std::nullopt;
    }
  }
  return static_cast<std::uint16_t>(value);
}

template <typename T>
T clamp_u64(const common::TomlDocument &doc, const std::string &key, T fallback) {
  const std::uint64_t raw = doc.get_u64(key, fallback);
  if (raw > std::numeric_limits<T>::max()) {
    return fallback;
  }
  return static_cast<T>(raw);
}

bool is_loopback_host(const std::string &host) {
  const std::string lowered = common::to_lower(common::trim(host));
  return lowered == "127.0.0.1" || lowered == "localhost" || lowered == "::1";
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.status());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.status());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

common::Result<std::filesystem::path> snapshot_path(const Config &config) {
  if (!config.snapshot.path.empty()) {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(common::expand_path(config.snapshot.path)));
  }
  auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / SNAPSHOT_FILENAME);
}

common::Result<std::filesystem::path> archive_path(const Config &config) {
  if (!config.history.archive_path.empty()) {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(common::expand_path(config.history.archive_path)));
  }
  auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / ARCHIVE_FILENAME);
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  // The legacy variable is read first so the project-specific one wins when both are set.
  for (const char *name : {"AI_CHAT_HITL_PORT", "HITLGATE_PORT"}) {
    if (const char *raw = std::getenv(name); raw != nullptr && *raw != '\0') {
      if (const auto port = parse_port(raw); port.has_value()) {
        config.server.port = *port;
      }
    }
  }

  if (const char *host = std::getenv("HITLGATE_HOST"); host != nullptr && *host != '\0') {
    config.server.host = host;
  }

  if (const char *workspaces = std::getenv("HITLGATE_WORKSPACES");
      workspaces != nullptr && *workspaces != '\0') {
    config.workspaces.clear();
    for (const auto &part : common::split(workspaces, ':')) {
      const std::string trimmed = common::trim(part);
      if (!trimmed.empty()) {
        config.workspaces.push_back(common::expand_path(trimmed));
      }
    }
  }

  if (const char *backend = std::getenv("HITLGATE_OBSERVABILITY");
      backend != nullptr && *backend != '\0') {
    config.observability.backend = backend;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.status());
  }
  const auto &doc = parsed.value();

  Config config;
  config.server.host = doc.get_string("server.host", config.server.host);
  if (doc.has("server.port")) {
    const auto port = doc.get_u64("server.port", 0);
    if (port == 0 || port > std::numeric_limits<std::uint16_t>::max()) {
      return common::Result<Config>::failure("server.port must be between 1 and 65535",
                                             common::StatusCode::InvalidArgument);
    }
    config.server.port = static_cast<std::uint16_t>(port);
  }
  config.server.version = doc.get_string("server.version", config.server.version);
  config.server.max_body_bytes =
      clamp_u64<std::size_t>(doc, "server.max_body_bytes", config.server.max_body_bytes);

  config.follower.poll_interval_ms =
      clamp_u64<std::uint32_t>(doc, "follower.poll_interval_ms", config.follower.poll_interval_ms);
  config.follower.request_timeout_ms = clamp_u64<std::uint32_t>(
      doc, "follower.request_timeout_ms", config.follower.request_timeout_ms);

  config.stream.keepalive_secs =
      clamp_u64<std::uint32_t>(doc, "stream.keepalive_secs", config.stream.keepalive_secs);

  config.snapshot.enabled = doc.get_bool("snapshot.enabled", config.snapshot.enabled);
  config.snapshot.interval_secs =
      clamp_u64<std::uint32_t>(doc, "snapshot.interval_secs", config.snapshot.interval_secs);
  config.snapshot.path = expand_config_value(doc.get_string("snapshot.path"));

  config.history.archive_enabled =
      doc.get_bool("history.archive_enabled", config.history.archive_enabled);
  config.history.archive_path = expand_config_value(doc.get_string("history.archive_path"));

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  for (const auto &workspace : doc.get_string_array("workspaces")) {
    config.workspaces.push_back(expand_config_value(workspace));
  }

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.status());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  auto text = common::read_file(path);
  if (!text.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto config = parse_config(text.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error(),
                                           config.code());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return cfg_path_result.status();
  }

  std::ostringstream file;
  if (!config.workspaces.empty()) {
    file << "workspaces = " << common::toml_string_array(config.workspaces) << "\n\n";
  }
  file << "[server]\n";
  file << "host = " << common::quote_toml_string(config.server.host) << "\n";
  file << "port = " << config.server.port << "\n";
  file << "version = " << common::quote_toml_string(config.server.version) << "\n";
  file << "max_body_bytes = " << config.server.max_body_bytes << "\n\n";

  file << "[follower]\n";
  file << "poll_interval_ms = " << config.follower.poll_interval_ms << "\n";
  file << "request_timeout_ms = " << config.follower.request_timeout_ms << "\n\n";

  file << "[stream]\n";
  file << "keepalive_secs = " << config.stream.keepalive_secs << "\n\n";

  file << "[snapshot]\n";
  file << "enabled = " << (config.snapshot.enabled ? "true" : "false") << "\n";
  file << "interval_secs = " << config.snapshot.interval_secs << "\n";
  if (!config.snapshot.path.empty()) {
    file << "path = " << common::quote_toml_string(config.snapshot.path) << "\n";
  }
  file << "\n[history]\n";
  file << "archive_enabled = " << (config.history.archive_enabled ? "true" : "false") << "\n";
  if (!config.history.archive_path.empty()) {
    file << "archive_path = " << common::quote_toml_string(config.history.archive_path) << "\n";
  }
  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  return common::write_file_atomic(cfg_path_result.value(), file.str());
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.server.port < 1024) {
    return Warnings::failure("server.port must be between 1024 and 65535",
                             common::StatusCode::InvalidArgument);
  }
  if (!is_loopback_host(config.server.host)) {
    return Warnings::failure("server.host must be a loopback address: " + config.server.host,
                             common::StatusCode::InvalidArgument);
  }
  if (config.follower.poll_interval_ms == 0) {
    return Warnings::failure("follower.poll_interval_ms must be positive",
                             common::StatusCode::InvalidArgument);
  }
  if (config.stream.keepalive_secs == 0) {
    return Warnings::failure("stream.keepalive_secs must be positive",
                             common::StatusCode::InvalidArgument);
  }
  if (config.snapshot.enabled && config.snapshot.interval_secs == 0) {
    return Warnings::failure("snapshot.interval_secs must be positive",
                             common::StatusCode::InvalidArgument);
  }
  if (config.server.max_body_bytes < 1024) {
    warnings.push_back("server.max_body_bytes is very small; attachments will be rejected");
  }
  if (config.follower.request_timeout_ms >= config.follower.poll_interval_ms * 10) {
    warnings.push_back("follower.request_timeout_ms is much larger than the poll interval");
  }
  for (const auto &workspace : config.workspaces) {
    if (!std::filesystem::path(workspace).is_absolute()) {
      warnings.push_back("workspace is not an absolute path: " + workspace);
    }
  }

  return Warnings::success(std::move(warnings));
}

} // namespace hitlgate::config
