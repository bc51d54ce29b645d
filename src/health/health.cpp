#include "hitlgate/health/health.hpp"

#include "hitlgate/common/clock.hpp"
#include "hitlgate/common/json_util.hpp"

#include <mutex>
#include <sstream>

namespace hitlgate::health {

namespace {

std::mutex g_mutex;
ComponentTable g_components;

ComponentStatus &touch(const std::string &name, const std::string &state) {
  auto &component = g_components[name];
  component.state = state;
  component.updated_at = common::now_rfc3339();
  return component;
}

} // namespace

void mark_component_starting(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  touch(name, "starting").last_error.reset();
}

void mark_component_ok(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto &component = touch(name, "ok");
  component.last_ok = component.updated_at;
  component.last_error.reset();
}

void mark_component_stopped(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  touch(name, "stopped");
}

void mark_component_error(const std::string &name, const std::string &error) {
  std::lock_guard<std::mutex> lock(g_mutex);
  touch(name, "error").last_error = error;
}

void bump_component_restart(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto &component = g_components[name];
  ++component.restart_count;
  component.updated_at = common::now_rfc3339();
}

std::optional<ComponentStatus> get_component(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  const auto it = g_components.find(name);
  if (it == g_components.end()) {
    return std::nullopt;
  }
  return it->second;
}

ComponentTable components() {
  std::lock_guard<std::mutex> lock(g_mutex);
  return g_components;
}

std::string overall_state() {
  std::lock_guard<std::mutex> lock(g_mutex);
  for (const auto &[name, component] : g_components) {
    if (component.state == "error") {
      return "degraded";
    }
  }
  return "ok";
}

std::string components_json() {
  const auto table = components();
  std::ostringstream json;
  json << "{\"components\":{";
  bool first = true;
  for (const auto &[name, component] : table) {
    if (!first) {
      json << ",";
    }
    first = false;
    json << common::json_quote(name) << ":{";
    json << "\"state\":" << common::json_quote(component.state);
    json << ",\"restartCount\":" << component.restart_count;
    if (!component.updated_at.empty()) {
      json << ",\"updatedAt\":" << common::json_quote(component.updated_at);
    }
    if (component.last_ok.has_value()) {
      json << ",\"lastOk\":" << common::json_quote(*component.last_ok);
    }
    if (component.last_error.has_value()) {
      json << ",\"lastError\":" << common::json_quote(*component.last_error);
    }
    json << "}";
  }
  json << "}}";
  return json.str();
}

void clear() {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_components.clear();
}

} // namespace hitlgate::health
