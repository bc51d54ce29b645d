#include "hitlgate/cli/commands.hpp"

#include "hitlgate/bridge/http_client.hpp"
#include "hitlgate/bridge/leader_client.hpp"
#include "hitlgate/common/fs.hpp"
#include "hitlgate/config/config.hpp"
#include "hitlgate/daemon/daemon.hpp"
#include "hitlgate/daemon/snapshot_writer.hpp"
#include "hitlgate/dialog/attachment_loader.hpp"
#include "hitlgate/dialog/history_archive.hpp"
#include "hitlgate/node/presenter.hpp"
#include "hitlgate/observability/factory.hpp"
#include "hitlgate/observability/global.hpp"
#include "hitlgate/rpc/backends.hpp"
#include "hitlgate/transport/stdio.hpp"

#include <charconv>
#include <chrono>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace hitlgate::cli {

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_stop_signal(int) { g_stop_requested = 1; }

std::string version_string() {
#ifdef HITLGATE_VERSION
  std::string version = HITLGATE_VERSION;
#else
  std::string version = "1.5.0";
#endif
  return "hitlgate " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

/// Repeatable option (`--workspace A --workspace B`).
std::vector<std::string> take_all_options(std::vector<std::string> &args,
                                          const std::string &long_name) {
  std::vector<std::string> values;
  std::string value;
  while (take_option(args, long_name, "", value)) {
    values.push_back(value);
  }
  return values;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

bool parse_number(const std::string &raw, std::uint64_t &out) {
  const auto *first = raw.data();
  const auto *last = first + raw.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last && !raw.empty();
}

bool parse_port_arg(const std::string &raw, std::uint16_t &out) {
  std::uint64_t value = 0;
  if (!parse_number(raw, value) || value == 0 || value > 65535) {
    std::cerr << "invalid port: " << raw << "\n";
    return false;
  }
  out = static_cast<std::uint16_t>(value);
  return true;
}

bool load_config_or_report(config::Config &out) {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    std::cerr << loaded.error() << "\n";
    return false;
  }
  out = std::move(loaded.value());
  return true;
}

/// Applies `--port` when present; false (after reporting) on a malformed value.
bool apply_port_option(std::vector<std::string> &args, config::Config &config) {
  std::string port_raw;
  if (!take_option(args, "--port", "-p", port_raw)) {
    return true;
  }
  return parse_port_arg(port_raw, config.server.port);
}

bool reject_leftovers(const std::vector<std::string> &args, const std::string &command) {
  if (args.empty()) {
    return false;
  }
  std::cerr << command << ": unexpected argument: " << args.front() << "\n";
  return true;
}

void install_observer(const config::Config &config) {
  observability::set_global_observer(observability::create_observer(config));
}

bridge::LeaderClient make_leader_client(const config::Config &config) {
  return bridge::LeaderClient(std::make_shared<bridge::CurlHttpClient>(), config.server.host,
                              config.server.port);
}

std::string format_local_time(const std::int64_t unix_ms) {
  const std::time_t seconds = static_cast<std::time_t>(unix_ms / 1000);
  std::tm local{};
  localtime_r(&seconds, &local);
  std::ostringstream out;
  out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
  return out.str();
}

int run_serve(std::vector<std::string> args) {
  config::Config cfg;
  if (!load_config_or_report(cfg)) {
    return 1;
  }
  if (!apply_port_option(args, cfg)) {
    return 1;
  }
  const auto workspaces = take_all_options(args, "--workspace");
  if (!workspaces.empty()) {
    cfg.workspaces = workspaces;
  }
  std::string duration_raw;
  (void)take_option(args, "--duration-secs", "", duration_raw);
  if (reject_leftovers(args, "serve")) {
    return 1;
  }

  auto validation = config::validate_config(cfg);
  if (!validation.ok()) {
    std::cerr << "invalid configuration: " << validation.error() << "\n";
    return 1;
  }
  for (const auto &warning : validation.value()) {
    std::cerr << "[hitlgate][config] warning: " << warning << "\n";
  }
  install_observer(cfg);

  auto presenter = std::make_shared<node::TerminalPresenter>(STDIN_FILENO, std::cout);
  daemon::DaemonOptions options;
  options.presenter = presenter;
  if (auto path = config::config_path(); path.ok() && config::config_exists()) {
    options.watch_config = path.value();
  }

  presenter->start();
  daemon::Daemon front_end(cfg);
  auto started = front_end.start(options);
  if (!started.ok()) {
    presenter->stop();
    std::cerr << started.error() << "\n";
    return 1;
  }

  const auto *serving = front_end.node();
  std::cout << "hitlgate " << node::role_name(serving->role()) << " on " << cfg.server.host
            << ":" << serving->port() << "\n";
  if (!cfg.workspaces.empty()) {
    std::cout << "Workspaces:";
    for (const auto &workspace : cfg.workspaces) {
      std::cout << " " << workspace;
    }
    std::cout << "\n";
  }

  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);

  std::uint64_t duration = 0;
  if (!duration_raw.empty() && !parse_number(duration_raw, duration)) {
    std::cerr << "invalid --duration-secs: " << duration_raw << "\n";
  }
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(duration);
  while (g_stop_requested == 0) {
    if (duration > 0 && std::chrono::steady_clock::now() >= deadline) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  presenter->stop();
  front_end.stop();
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return 0;
}

int run_stdio(std::vector<std::string> args) {
  config::Config cfg;
  if (!load_config_or_report(cfg)) {
    return 1;
  }
  if (!apply_port_option(args, cfg)) {
    return 1;
  }
  if (reject_leftovers(args, "stdio")) {
    return 1;
  }
  install_observer(cfg);

  auto client = std::make_shared<bridge::LeaderClient>(make_leader_client(cfg));
  auto backend = std::make_shared<rpc::RemoteDialogBackend>(client);
  auto handler = std::make_shared<rpc::RpcHandler>(backend, cfg.server.version);

  std::cerr << "[hitlgate][stdio] forwarding dialogs to " << client->base_url() << "\n";
  transport::StdioServer server(handler, std::cin, std::cout);
  server.run();
  return 0;
}

int run_pending(std::vector<std::string> args) {
  config::Config cfg;
  if (!load_config_or_report(cfg)) {
    return 1;
  }
  std::string workspace;
  (void)take_option(args, "--workspace", "-w", workspace);
  if (!apply_port_option(args, cfg) || reject_leftovers(args, "pending")) {
    return 1;
  }

  auto client = make_leader_client(cfg);
  std::optional<std::string> filter;
  if (!workspace.empty()) {
    filter = workspace;
  }
  auto pending = client.pending(filter, cfg.follower.request_timeout_ms);
  if (!pending.ok()) {
    std::cerr << pending.error() << "\n";
    return 1;
  }
  if (pending.value().empty()) {
    std::cout << "No pending dialogs.\n";
    return 0;
  }
  for (const auto &request : pending.value()) {
    std::cout << request.id << "  #" << request.sequence_number << "  "
              << (request.workspace.empty() ? "-" : request.workspace) << "\n";
    std::cout << "    " << request.reason << "\n";
  }
  return 0;
}

int run_respond(std::vector<std::string> args) {
  config::Config cfg;
  if (!load_config_or_report(cfg)) {
    return 1;
  }
  if (!apply_port_option(args, cfg)) {
    return 1;
  }

  dialog::DialogResolution resolution;
  std::string continue_text;
  const bool has_continue = take_option(args, "--continue", "-c", continue_text);
  const bool stop = take_flag(args, "--stop");
  if (has_continue == stop) {
    std::cerr << "respond: pass exactly one of --continue TEXT or --stop\n";
    return 1;
  }
  resolution.should_continue = has_continue;
  resolution.user_input = continue_text;

  const std::vector<std::pair<std::string, dialog::AttachmentKind>> attach_options = {
      {"--attach-code", dialog::AttachmentKind::Code},
      {"--attach-file", dialog::AttachmentKind::File},
      {"--attach-image", dialog::AttachmentKind::Image},
  };
  for (const auto &[option, kind] : attach_options) {
    for (const auto &path : take_all_options(args, option)) {
      auto attachment = dialog::load_attachment(kind, common::expand_path(path));
      if (!attachment.ok()) {
        std::cerr << attachment.error() << "\n";
        return 1;
      }
      resolution.attachments.push_back(std::move(attachment.value()));
    }
  }

  if (args.size() != 1) {
    std::cerr << "usage: hitlgate respond <id> (--continue TEXT | --stop) [--attach-code FILE] "
                 "[--attach-file FILE] [--attach-image FILE]\n";
    return 1;
  }

  auto client = make_leader_client(cfg);
  const auto status = client.respond(args.front(), resolution, cfg.follower.request_timeout_ms);
  if (!status.ok()) {
    if (status.code() == common::StatusCode::NotFound) {
      std::cerr << "Dialog not found: " << args.front() << "\n";
    } else {
      std::cerr << status.error() << "\n";
    }
    return 1;
  }
  std::cout << "Responded to " << args.front() << "\n";
  return 0;
}

int run_health(std::vector<std::string> args) {
  config::Config cfg;
  if (!load_config_or_report(cfg)) {
    return 1;
  }
  if (!apply_port_option(args, cfg) || reject_leftovers(args, "health")) {
    return 1;
  }
  auto client = make_leader_client(cfg);
  auto body = client.health(cfg.follower.request_timeout_ms);
  if (!body.ok()) {
    std::cerr << body.error() << "\n";
    return 1;
  }
  std::cout << body.value() << "\n";
  return 0;
}

int run_history(std::vector<std::string> args) {
  config::Config cfg;
  if (!load_config_or_report(cfg)) {
    return 1;
  }
  std::string workspace;
  std::string limit_raw;
  (void)take_option(args, "--workspace", "-w", workspace);
  (void)take_option(args, "--limit", "-n", limit_raw);
  if (reject_leftovers(args, "history")) {
    return 1;
  }
  std::uint64_t limit = 20;
  if (!limit_raw.empty() && (!parse_number(limit_raw, limit) || limit == 0)) {
    std::cerr << "invalid --limit: " << limit_raw << "\n";
    return 1;
  }

  auto path = config::archive_path(cfg);
  if (!path.ok()) {
    std::cerr << path.error() << "\n";
    return 1;
  }
  std::error_code ec;
  if (!std::filesystem::exists(path.value(), ec)) {
    std::cout << "No history archive at " << path.value().string()
              << " (enable [history] archive_enabled).\n";
    return 0;
  }

  dialog::HistoryArchive archive(path.value());
  if (!archive.is_open()) {
    std::cerr << "unable to open " << path.value().string() << "\n";
    return 1;
  }
  std::optional<std::string> filter;
  if (!workspace.empty()) {
    filter = workspace;
  }
  auto entries = archive.entries(filter, static_cast<std::size_t>(limit));
  if (!entries.ok()) {
    std::cerr << entries.error() << "\n";
    return 1;
  }
  for (const auto &archived : entries.value()) {
    const auto &entry = archived.entry;
    std::cout << format_local_time(entry.timestamp_ms) << "  "
              << (archived.workspace.empty() ? "-" : archived.workspace) << "  "
              << (entry.continued ? "continue" : "stop") << "\n";
    std::cout << "    reason: " << entry.reason << "\n";
    if (!entry.user_input.empty()) {
      std::cout << "    input:  " << entry.user_input << "\n";
    }
  }
  return 0;
}

int run_snapshot(std::vector<std::string> args) {
  config::Config cfg;
  if (!load_config_or_report(cfg) || reject_leftovers(args, "snapshot")) {
    return 1;
  }
  auto path = config::snapshot_path(cfg);
  if (!path.ok()) {
    std::cerr << path.error() << "\n";
    return 1;
  }
  auto snapshot = daemon::load_snapshot(path.value());
  if (!snapshot.ok()) {
    if (snapshot.code() == common::StatusCode::NotFound) {
      std::cout << "No snapshot at " << path.value().string() << "\n";
      return 0;
    }
    std::cerr << snapshot.error() << "\n";
    return 1;
  }
  std::cout << "Snapshot written " << snapshot.value().written_at << " ("
            << snapshot.value().dialogs.size() << " pending)\n";
  for (const auto &request : snapshot.value().dialogs) {
    std::cout << "  " << request.id << "  #" << request.sequence_number << "  "
              << (request.workspace.empty() ? "-" : request.workspace) << "  " << request.reason
              << "\n";
  }
  return 0;
}

int run_port(std::vector<std::string> args) {
  if (args.size() != 1) {
    std::cerr << "usage: hitlgate port <N>\n";
    return 1;
  }
  std::uint16_t port = 0;
  if (!parse_port_arg(args.front(), port)) {
    return 1;
  }

  // Edit the file as written, without environment overrides baked in.
  config::Config cfg;
  if (config::config_exists()) {
    auto path = config::config_path();
    if (!path.ok()) {
      std::cerr << path.error() << "\n";
      return 1;
    }
    auto text = common::read_file(path.value());
    if (!text.ok()) {
      std::cerr << text.error() << "\n";
      return 1;
    }
    auto parsed = config::parse_config(text.value());
    if (!parsed.ok()) {
      std::cerr << parsed.error() << "\n";
      return 1;
    }
    cfg = std::move(parsed.value());
  }
  cfg.server.port = port;

  auto validation = config::validate_config(cfg);
  if (!validation.ok()) {
    std::cerr << "invalid configuration: " << validation.error() << "\n";
    return 1;
  }
  const auto saved = config::save_config(cfg);
  if (!saved.ok()) {
    std::cerr << saved.error() << "\n";
    return 1;
  }
  std::cout << "Coordination port set to " << port
            << ". Running nodes that watch the config will rebind.\n";
  return 0;
}

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *CYAN = "\033[36m";
  constexpr const char *GREEN = "\033[32m";
  constexpr const char *YELLOW = "\033[33m";

  std::cout << "\n";
  std::cout << BOLD << CYAN << "  hitlgate" << RESET << DIM
            << "  human-in-the-loop dialogs for coding agents" << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "hitlgate [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  NODE" << RESET << "\n";
  std::cout << "  " << GREEN << "serve" << RESET << DIM
            << "          Run a front-end (Leader or Follower) with a terminal prompt" << RESET
            << "\n";
  std::cout << "  " << GREEN << "stdio" << RESET << DIM
            << "          Serve the agent over stdin/stdout, forwarding to the Leader" << RESET
            << "\n\n";

  std::cout << BOLD << "  LEADER CLIENT" << RESET << "\n";
  std::cout << "  " << GREEN << "pending" << RESET << DIM << "        List outstanding dialogs"
            << RESET << "\n";
  std::cout << "  " << GREEN << "respond" << RESET << " ID" << DIM
            << "     Answer with --continue TEXT or --stop" << RESET << "\n";
  std::cout << "  " << GREEN << "health" << RESET << DIM << "         Show the Leader's status"
            << RESET << "\n\n";

  std::cout << BOLD << "  LOCAL STATE" << RESET << "\n";
  std::cout << "  " << GREEN << "history" << RESET << DIM
            << "        Show archived decisions (--workspace, --limit)" << RESET << "\n";
  std::cout << "  " << GREEN << "snapshot" << RESET << DIM
            << "       Show the last pending-dialog snapshot" << RESET << "\n";
  std::cout << "  " << GREEN << "port" << RESET << " N" << DIM
            << "         Change the coordination port" << RESET << "\n";
  std::cout << "  " << GREEN << "config-path" << RESET << DIM << "    Print the config file path"
            << RESET << "\n\n";

  std::cout << BOLD << "  OPTIONS" << RESET << "\n";
  std::cout << "  " << YELLOW << "--port N" << RESET << DIM
            << "       Override the coordination port" << RESET << "\n";
  std::cout << "  " << YELLOW << "--workspace P" << RESET << DIM
            << "  Workspace served by this node (repeatable)" << RESET << "\n\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "serve") {
    return run_serve(std::move(args));
  }
  if (subcommand == "stdio") {
    return run_stdio(std::move(args));
  }
  if (subcommand == "pending") {
    return run_pending(std::move(args));
  }
  if (subcommand == "respond") {
    return run_respond(std::move(args));
  }
  if (subcommand == "health") {
    return run_health(std::move(args));
  }
  if (subcommand == "history") {
    return run_history(std::move(args));
  }
  if (subcommand == "snapshot") {
    return run_snapshot(std::move(args));
  }
  if (subcommand == "port") {
    return run_port(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace hitlgate::cli
