#pragma once

#include "teamlens/model/team.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace teamlens::sessions {

struct SessionSummary {
  std::int64_t id = 0;
  std::string team_name;
  std::string description;
  std::int64_t created_at = 0;
  std::string started_at;
  std::optional<std::string> ended_at;
};

struct SessionMessage {
  std::string recipient;
  model::InboxMessage message;
};

struct SessionDetail {
  SessionSummary summary;
  std::string lead_agent_id;
  // Config exactly as it was serialized when the session started.
  std::string config_json;
  std::vector<model::Member> members;
  std::vector<SessionMessage> messages;
  std::vector<model::Task> tasks;
};

[[nodiscard]] std::string encode_session_summary_json(const SessionSummary &summary);
[[nodiscard]] std::string encode_history_json(const std::vector<SessionSummary> &sessions);
[[nodiscard]] std::string encode_session_detail_json(const SessionDetail &detail);

} // namespace teamlens::sessions
