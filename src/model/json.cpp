#include "teamlens/model/json.hpp"

#include "teamlens/common/json_util.hpp"

#include <sstream>

namespace teamlens::model {

namespace {

std::string quoted(const std::string &value) { return "\"" + common::json_escape(value) + "\""; }

} // namespace

std::string member_to_json(const Member &member) {
  std::ostringstream out;
  out << "{\"agentId\":" << quoted(member.agent_id) << ",\"name\":" << quoted(member.name)
      << ",\"agentType\":" << quoted(member.agent_type) << ",\"model\":" << quoted(member.model)
      << ",\"color\":" << quoted(member.color) << ",\"joinedAt\":" << member.joined_at << "}";
  return out.str();
}

std::string team_config_to_json(const TeamConfig &config) {
  std::ostringstream out;
  out << "{\"name\":" << quoted(config.name) << ",\"description\":" << quoted(config.description)
      << ",\"createdAt\":" << config.created_at
      << ",\"leadAgentId\":" << quoted(config.lead_agent_id) << ",\"members\":[";
  for (std::size_t i = 0; i < config.members.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << member_to_json(config.members[i]);
  }
  out << "]}";
  return out.str();
}

std::string inbox_message_to_json(const InboxMessage &message) {
  std::ostringstream out;
  out << "{\"from\":" << quoted(message.from) << ",\"text\":" << quoted(message.text)
      << ",\"timestamp\":" << quoted(message.timestamp) << ",\"color\":" << quoted(message.color)
      << ",\"read\":" << (message.read ? "true" : "false")
      << ",\"kind\":" << quoted(message_kind_to_string(message.kind));
  if (!message.payload_json.empty()) {
    out << ",\"payload\":" << message.payload_json;
  }
  out << "}";
  return out.str();
}

std::string inbox_to_json(const std::vector<InboxMessage> &messages) {
  std::string out = "[";
  for (std::size_t i = 0; i < messages.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += inbox_message_to_json(messages[i]);
  }
  out += "]";
  return out;
}

std::string task_to_json(const Task &task) {
  std::ostringstream out;
  out << "{\"id\":" << quoted(task.id) << ",\"subject\":" << quoted(task.subject)
      << ",\"description\":" << quoted(task.description)
      << ",\"activeForm\":" << quoted(task.active_form)
      << ",\"status\":" << quoted(task_status_to_string(task.status))
      << ",\"owner\":" << quoted(task.owner)
      << ",\"blocks\":" << common::json_string_array(task.blocks)
      << ",\"blockedBy\":" << common::json_string_array(task.blocked_by) << "}";
  return out.str();
}

std::string tasks_to_json(const TaskMap &tasks) {
  std::string out = "[";
  bool first = true;
  for (const auto &task : visible_tasks(tasks)) {
    if (!first) {
      out += ",";
    }
    first = false;
    out += task_to_json(task);
  }
  out += "]";
  return out;
}

std::string team_to_json(const Team &team) {
  std::ostringstream out;
  out << "{\"name\":" << quoted(team.name) << ",\"config\":";
  if (team.config.has_value()) {
    out << team_config_to_json(*team.config);
  } else {
    out << "null";
  }
  out << ",\"inboxes\":{";
  bool first = true;
  for (const auto &[agent, messages] : team.inboxes) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << quoted(agent) << ":" << inbox_to_json(messages);
  }
  out << "},\"tasks\":" << tasks_to_json(team.tasks) << "}";
  return out.str();
}

} // namespace teamlens::model
