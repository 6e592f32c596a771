#include "teamlens/model/parse.hpp"

#include "teamlens/common/fs.hpp"
#include "teamlens/common/json_util.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>

namespace teamlens::model {

namespace {

std::string field_text(const common::JsonFlatMap &fields, const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end() || it->second == "null") {
    return "";
  }
  return it->second;
}

std::int64_t parse_epoch_ms(const std::string &raw) {
  const std::string text = common::trim(raw);
  if (text.empty()) {
    return 0;
  }
  std::int64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec == std::errc() && ptr == text.data() + text.size()) {
    return value;
  }
  char *end = nullptr;
  const double fractional = std::strtod(text.c_str(), &end);
  if (end != nullptr && *end == '\0' && std::isfinite(fractional)) {
    return static_cast<std::int64_t>(fractional);
  }
  return 0;
}

bool parse_bool(const std::string &raw) { return common::trim(raw) == "true"; }

std::vector<std::string> parse_id_list(const std::string &raw) {
  std::vector<std::string> ids;
  if (!common::json_is_array(raw)) {
    return ids;
  }
  for (const auto &element : common::json_split_top_level_values(raw)) {
    if (common::json_is_null(element)) {
      continue;
    }
    ids.push_back(common::json_scalar_text(element));
  }
  return ids;
}

Member parse_member(const std::string &json) {
  const auto fields = common::json_parse_flat(json);
  return Member{.agent_id = field_text(fields, "agentId"),
                .name = field_text(fields, "name"),
                .agent_type = field_text(fields, "agentType"),
                .model = field_text(fields, "model"),
                .color = field_text(fields, "color"),
                .joined_at = parse_epoch_ms(field_text(fields, "joinedAt"))};
}

} // namespace

void classify_message_text(InboxMessage &message) {
  message.kind = MessageKind::PlainText;
  message.payload_json.clear();

  const std::string body = common::trim(message.text);
  if (!common::json_is_object(body) || !common::json_is_valid(body)) {
    return;
  }
  const auto fields = common::json_parse_flat(body);
  const auto type = message_kind_from_string(field_text(fields, "type"));
  if (!type.has_value() || *type == MessageKind::PlainText) {
    return;
  }
  message.kind = *type;
  message.payload_json = body;
}

common::Result<TeamConfig> parse_team_config(const std::string &json) {
  if (!common::json_is_object(json) || !common::json_is_valid(json)) {
    return common::Result<TeamConfig>::failure("team config is not a complete JSON object");
  }
  const auto fields = common::json_parse_flat(json);

  TeamConfig config;
  config.name = field_text(fields, "name");
  config.description = field_text(fields, "description");
  config.created_at = parse_epoch_ms(field_text(fields, "createdAt"));
  config.lead_agent_id = field_text(fields, "leadAgentId");

  const std::string members = field_text(fields, "members");
  if (common::json_is_array(members)) {
    for (const auto &member_json : common::json_split_top_level_objects(members)) {
      config.members.push_back(parse_member(member_json));
    }
  }
  return common::Result<TeamConfig>::success(std::move(config));
}

common::Result<std::vector<InboxMessage>> parse_inbox(const std::string &json) {
  if (!common::json_is_array(json) || !common::json_is_valid(json)) {
    return common::Result<std::vector<InboxMessage>>::failure(
        "inbox is not a complete JSON array");
  }

  std::vector<InboxMessage> messages;
  for (const auto &entry : common::json_split_top_level_objects(json)) {
    const auto fields = common::json_parse_flat(entry);
    InboxMessage message{.from = field_text(fields, "from"),
                         .text = field_text(fields, "text"),
                         .timestamp = field_text(fields, "timestamp"),
                         .color = field_text(fields, "color"),
                         .read = parse_bool(field_text(fields, "read"))};
    classify_message_text(message);
    messages.push_back(std::move(message));
  }
  return common::Result<std::vector<InboxMessage>>::success(std::move(messages));
}

common::Result<Task> parse_task(const std::string &json) {
  if (!common::json_is_object(json) || !common::json_is_valid(json)) {
    return common::Result<Task>::failure("task is not a complete JSON object");
  }
  const auto fields = common::json_parse_flat(json);

  Task task;
  task.id = common::json_scalar_text(field_text(fields, "id"));
  task.subject = field_text(fields, "subject");
  task.description = field_text(fields, "description");
  task.active_form = field_text(fields, "activeForm");
  task.owner = field_text(fields, "owner");
  task.blocks = parse_id_list(field_text(fields, "blocks"));
  task.blocked_by = parse_id_list(field_text(fields, "blockedBy"));

  const std::string status = field_text(fields, "status");
  if (!status.empty()) {
    const auto parsed = task_status_from_string(status);
    if (!parsed.has_value()) {
      return common::Result<Task>::failure("unknown task status: " + status);
    }
    task.status = *parsed;
  }

  const std::string metadata = field_text(fields, "metadata");
  if (common::json_is_object(metadata)) {
    const auto meta = common::json_parse_flat(metadata);
    task.internal = parse_bool(field_text(meta, "_internal"));
  }
  return common::Result<Task>::success(std::move(task));
}

} // namespace teamlens::model
