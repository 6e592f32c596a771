#include "teamlens/gateway/protocol.hpp"

#include "teamlens/common/fs.hpp"
#include "teamlens/common/json_util.hpp"

#include <charconv>
#include <sstream>

namespace teamlens::gateway {

namespace {

std::string find_field(const common::JsonFlatMap &top, const common::JsonFlatMap &payload,
                       const std::string &key) {
  for (const auto *fields : {&top, &payload}) {
    const auto it = fields->find(key);
    if (it != fields->end() && !common::json_is_null(it->second)) {
      return common::json_scalar_text(it->second);
    }
  }
  return "";
}

} // namespace

common::Result<ClientRequest> parse_client_message(const std::string &json) {
  if (!common::json_is_object(json) || !common::json_is_valid(json)) {
    return common::Result<ClientRequest>::failure("message is not a JSON object");
  }
  const auto top = common::json_parse_flat(json);
  common::JsonFlatMap payload;
  if (const auto it = top.find("payload"); it != top.end() && common::json_is_object(it->second)) {
    payload = common::json_parse_flat(it->second);
  }

  const auto type_it = top.find("type");
  if (type_it == top.end() || common::trim(type_it->second).empty()) {
    return common::Result<ClientRequest>::failure("missing type field");
  }
  const std::string type = common::trim(type_it->second);

  ClientRequest request;
  if (type == "switch_team") {
    request.kind = ClientRequestKind::SwitchTeam;
    request.team = find_field(top, payload, "team");
    if (request.team.empty()) {
      return common::Result<ClientRequest>::failure("switch_team requires team");
    }
    return common::Result<ClientRequest>::success(std::move(request));
  }
  if (type == "get_history") {
    request.kind = ClientRequestKind::GetHistory;
    return common::Result<ClientRequest>::success(std::move(request));
  }
  if (type == "get_session") {
    request.kind = ClientRequestKind::GetSession;
    const std::string raw = common::trim(find_field(top, payload, "sessionId"));
    std::int64_t id = 0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), id);
    if (raw.empty() || ec != std::errc() || ptr != raw.data() + raw.size()) {
      return common::Result<ClientRequest>::failure("get_session requires numeric sessionId");
    }
    request.session_id = id;
    return common::Result<ClientRequest>::success(std::move(request));
  }
  return common::Result<ClientRequest>::failure("unsupported message type: " + type);
}

std::string encode_envelope(const std::string &type, const std::string &payload_json,
                            const std::int64_t timestamp_ms) {
  std::ostringstream out;
  out << "{\"type\":\"" << common::json_escape(type) << "\",\"payload\":"
      << (payload_json.empty() ? std::string("{}") : payload_json)
      << ",\"timestamp\":" << timestamp_ms << "}";
  return out.str();
}

std::string encode_snapshot(const state::WorldState &state, const std::string &active_team,
                            const std::int64_t timestamp_ms) {
  // An observer scoped to a team that has not shown up yet still sees the
  // most recently active one.
  const bool known = !active_team.empty() && state.teams.contains(active_team);
  return encode_envelope("snapshot",
                         state::world_state_to_json(state, known ? active_team : std::string()),
                         timestamp_ms);
}

std::string encode_team_update(const state::TeamChange &change, const std::int64_t timestamp_ms) {
  std::ostringstream payload;
  payload << "{\"team\":\"" << common::json_escape(change.team_name) << "\",\"change\":\""
          << state::team_change_kind_to_string(change.kind) << "\"";
  if (!change.agent.empty()) {
    payload << ",\"agent\":\"" << common::json_escape(change.agent) << "\"";
  }
  if (!change.task_id.empty()) {
    payload << ",\"taskId\":\"" << common::json_escape(change.task_id) << "\"";
  }
  payload << ",\"data\":" << state::change_payload_json(change) << "}";
  return encode_envelope("team_update", payload.str(), timestamp_ms);
}

std::string encode_heartbeat(const std::size_t observers, const std::int64_t timestamp_ms) {
  return encode_envelope("heartbeat", "{\"observers\":" + std::to_string(observers) + "}",
                         timestamp_ms);
}

std::string encode_history(const std::vector<sessions::SessionSummary> &sessions,
                           const std::int64_t timestamp_ms) {
  return encode_envelope("history", sessions::encode_history_json(sessions), timestamp_ms);
}

std::string encode_session(const sessions::SessionDetail &detail,
                           const std::int64_t timestamp_ms) {
  return encode_envelope("session", sessions::encode_session_detail_json(detail), timestamp_ms);
}

std::string encode_error(const std::string &message, const std::int64_t timestamp_ms) {
  return encode_envelope("error", "{\"message\":\"" + common::json_escape(message) + "\"}",
                         timestamp_ms);
}

} // namespace teamlens::gateway
