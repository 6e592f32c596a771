#include "teamlens/state/change.hpp"

#include "teamlens/common/json_util.hpp"
#include "teamlens/model/json.hpp"

#include <sstream>

namespace teamlens::state {

std::string team_change_kind_to_string(const TeamChangeKind kind) {
  switch (kind) {
  case TeamChangeKind::Config:
    return "config";
  case TeamChangeKind::ConfigRemoved:
    return "config";
  case TeamChangeKind::Inbox:
    return "inbox";
  case TeamChangeKind::Task:
    return "task";
  }
  return "config";
}

std::string change_payload_json(const TeamChange &change) {
  if (change.team == nullptr) {
    return "{}";
  }
  const auto &team = *change.team;
  switch (change.kind) {
  case TeamChangeKind::Config:
    return team.config.has_value() ? model::team_config_to_json(*team.config) : "null";
  case TeamChangeKind::ConfigRemoved:
    return "null";
  case TeamChangeKind::Inbox: {
    const auto it = team.inboxes.find(change.agent);
    std::ostringstream out;
    out << "{\"agent\":\"" << common::json_escape(change.agent) << "\",\"messages\":"
        << (it == team.inboxes.end() ? std::string("[]") : model::inbox_to_json(it->second))
        << "}";
    return out.str();
  }
  case TeamChangeKind::Task:
    return model::tasks_to_json(team.tasks);
  }
  return "null";
}

std::string world_state_to_json(const WorldState &state, const std::string &active_team) {
  std::string active = active_team.empty() ? state.active_team : active_team;
  std::ostringstream out;
  out << "{\"teams\":{";
  bool first = true;
  for (const auto &[name, team] : state.teams) {
    if (team == nullptr) {
      continue;
    }
    if (!first) {
      out << ",";
    }
    first = false;
    out << "\"" << common::json_escape(name) << "\":" << model::team_to_json(*team);
  }
  out << "},\"activeTeam\":";
  if (active.empty()) {
    out << "null";
  } else {
    out << "\"" << common::json_escape(active) << "\"";
  }
  out << "}";
  return out.str();
}

} // namespace teamlens::state
