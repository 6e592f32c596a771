#include "teamlens/health/health.hpp"

#include "teamlens/common/fs.hpp"
#include "teamlens/common/json_util.hpp"

#include <mutex>
#include <sstream>

namespace teamlens::health {

namespace {

std::mutex g_mutex;
std::map<std::string, ComponentStatus> g_components;

void transition(const std::string &name, const ComponentState state) {
  auto &component = g_components[name];
  component.state = state;
  component.updated_at = common::now_rfc3339();
}

} // namespace

std::string component_state_to_string(const ComponentState state) {
  switch (state) {
  case ComponentState::Unknown:
    return "unknown";
  case ComponentState::Starting:
    return "starting";
  case ComponentState::Ok:
    return "ok";
  case ComponentState::Error:
    return "error";
  case ComponentState::Stopped:
    return "stopped";
  }
  return "unknown";
}

bool HealthSnapshot::all_ok() const {
  for (const auto &[name, component] : components) {
    if (component.state == ComponentState::Error) {
      return false;
    }
  }
  return true;
}

void mark_component_starting(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  transition(name, ComponentState::Starting);
}

void mark_component_ok(const std::string &name, const std::string &detail) {
  std::lock_guard<std::mutex> lock(g_mutex);
  transition(name, ComponentState::Ok);
  if (!detail.empty()) {
    g_components[name].detail = detail;
  }
}

void mark_component_error(const std::string &name, const std::string &error) {
  std::lock_guard<std::mutex> lock(g_mutex);
  transition(name, ComponentState::Error);
  auto &component = g_components[name];
  component.last_error = error;
  ++component.error_count;
}

void mark_component_stopped(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  transition(name, ComponentState::Stopped);
}

std::optional<ComponentStatus> get_component(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  const auto it = g_components.find(name);
  if (it == g_components.end()) {
    return std::nullopt;
  }
  return it->second;
}

HealthSnapshot snapshot() {
  std::lock_guard<std::mutex> lock(g_mutex);
  return HealthSnapshot{.components = g_components};
}

std::string snapshot_json() {
  const auto snap = snapshot();
  std::ostringstream json;
  json << "{\"healthy\":" << (snap.all_ok() ? "true" : "false") << ",\"components\":{";
  bool first = true;
  for (const auto &[name, component] : snap.components) {
    if (!first) {
      json << ",";
    }
    first = false;
    json << "\"" << common::json_escape(name) << "\":{\"status\":\""
         << component_state_to_string(component.state)
         << "\",\"error_count\":" << component.error_count;
    if (!component.detail.empty()) {
      json << ",\"detail\":\"" << common::json_escape(component.detail) << "\"";
    }
    if (!component.updated_at.empty()) {
      json << ",\"updated_at\":\"" << component.updated_at << "\"";
    }
    if (component.last_error.has_value()) {
      json << ",\"last_error\":\"" << common::json_escape(*component.last_error) << "\"";
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

} // namespace teamlens::health
