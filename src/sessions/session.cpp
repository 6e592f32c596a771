#include "teamlens/sessions/session.hpp"

#include "teamlens/common/json_util.hpp"
#include "teamlens/model/json.hpp"

#include <sstream>

namespace teamlens::sessions {

std::string encode_session_summary_json(const SessionSummary &summary) {
  std::ostringstream out;
  out << "{\"id\":" << summary.id << ",\"teamName\":\"" << common::json_escape(summary.team_name)
      << "\",\"description\":\"" << common::json_escape(summary.description)
      << "\",\"createdAt\":" << summary.created_at << ",\"startedAt\":\""
      << common::json_escape(summary.started_at) << "\",\"endedAt\":";
  if (summary.ended_at.has_value()) {
    out << "\"" << common::json_escape(*summary.ended_at) << "\"";
  } else {
    out << "null";
  }
  out << "}";
  return out.str();
}

std::string encode_history_json(const std::vector<SessionSummary> &sessions) {
  std::string out = "{\"sessions\":[";
  for (std::size_t i = 0; i < sessions.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += encode_session_summary_json(sessions[i]);
  }
  out += "]}";
  return out;
}

std::string encode_session_detail_json(const SessionDetail &detail) {
  std::ostringstream out;
  out << "{\"session\":" << encode_session_summary_json(detail.summary)
      << ",\"leadAgentId\":\"" << common::json_escape(detail.lead_agent_id) << "\",\"config\":";
  if (common::json_is_object(detail.config_json)) {
    out << detail.config_json;
  } else {
    out << "null";
  }

  out << ",\"members\":[";
  for (std::size_t i = 0; i < detail.members.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << model::member_to_json(detail.members[i]);
  }
  out << "],\"messages\":[";
  for (std::size_t i = 0; i < detail.messages.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    const auto &entry = detail.messages[i];
    const std::string message = model::inbox_message_to_json(entry.message);
    // Splice the recipient in front of the message fields.
    out << "{\"recipient\":\"" << common::json_escape(entry.recipient) << "\","
        << message.substr(1);
  }
  out << "],\"tasks\":[";
  for (std::size_t i = 0; i < detail.tasks.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << model::task_to_json(detail.tasks[i]);
  }
  out << "]}";
  return out.str();
}

} // namespace teamlens::sessions
