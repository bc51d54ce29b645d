#pragma once

#include <map>
#include <optional>
#include <string>

namespace hitlgate::health {

/// Lifecycle of one long-running component (`server`, `bridge`, `stream`, `snapshot`,
/// `archive`, `watcher`).
struct ComponentStatus {
  std::string state = "unknown";
  std::size_t restart_count = 0;
  std::optional<std::string> last_error;
  std::string updated_at;
  std::optional<std::string> last_ok;
};

using ComponentTable = std::map<std::string, ComponentStatus>;

void mark_component_starting(const std::string &name);
void mark_component_ok(const std::string &name);
void mark_component_stopped(const std::string &name);
void mark_component_error(const std::string &name, const std::string &error);
void bump_component_restart(const std::string &name);

[[nodiscard]] std::optional<ComponentStatus> get_component(const std::string &name);
[[nodiscard]] ComponentTable components();

/// "ok" unless some component is in the error state, then "degraded".
[[nodiscard]] std::string overall_state();

/// `{"components":{"<name>":{"state":...,"restartCount":...}}}` in name order.
[[nodiscard]] std::string components_json();
void clear();

} // namespace hitlgate::health
