#pragma once

#include "teamlens/model/team.hpp"

#include <map>
#include <memory>
#include <string>

namespace teamlens::state {

enum class TeamChangeKind {
  Config,
  ConfigRemoved,
  Inbox,
  Task,
};

[[nodiscard]] std::string team_change_kind_to_string(TeamChangeKind kind);

struct TeamChange {
  std::string team_name;
  TeamChangeKind kind = TeamChangeKind::Config;
  std::shared_ptr<const model::Team> team;
  std::string agent;
  std::string task_id;
};

struct WorldState {
  std::map<std::string, std::shared_ptr<const model::Team>> teams;
  std::string active_team;
};

[[nodiscard]] std::string change_payload_json(const TeamChange &change);

[[nodiscard]] std::string world_state_to_json(const WorldState &state,
                                              const std::string &active_team = "");

class ChangeSink {
public:
  virtual ~ChangeSink() = default;
  /// Called on the aggregator worker; implementations must not block.
  virtual void on_change(const TeamChange &change) = 0;
};

} // namespace teamlens::state
