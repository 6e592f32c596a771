#pragma once

#include <map>
#include <optional>
#include <string>

namespace teamlens::health {

enum class ComponentState {
  Unknown,
  Starting,
  Ok,
  Error,
  Stopped,
};

[[nodiscard]] std::string component_state_to_string(ComponentState state);

struct ComponentStatus {
  ComponentState state = ComponentState::Unknown;
  // Short operational summary, e.g. "watches=12".
  std::string detail;
  std::size_t error_count = 0;
  std::optional<std::string> last_error;
  std::string updated_at;
};

struct HealthSnapshot {
  std::map<std::string, ComponentStatus> components;
  [[nodiscard]] bool all_ok() const;
};

void mark_component_starting(const std::string &name);
void mark_component_ok(const std::string &name, const std::string &detail = "");
void mark_component_error(const std::string &name, const std::string &error);
void mark_component_stopped(const std::string &name);

[[nodiscard]] std::optional<ComponentStatus> get_component(const std::string &name);
[[nodiscard]] HealthSnapshot snapshot();
[[nodiscard]] std::string snapshot_json();
void clear();

} // namespace teamlens::health
