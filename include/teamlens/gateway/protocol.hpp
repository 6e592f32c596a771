#pragma once

#include "teamlens/common/result.hpp"
#include "teamlens/sessions/session.hpp"
#include "teamlens/state/change.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace teamlens::gateway {

enum class ClientRequestKind {
  SwitchTeam,
  GetHistory,
  GetSession,
};

struct ClientRequest {
  ClientRequestKind kind = ClientRequestKind::GetHistory;
  std::string team;
  std::int64_t session_id = 0;
};

[[nodiscard]] common::Result<ClientRequest> parse_client_message(const std::string &json);

[[nodiscard]] std::string encode_envelope(const std::string &type, const std::string &payload_json,
                                          std::int64_t timestamp_ms);

[[nodiscard]] std::string encode_snapshot(const state::WorldState &state,
                                          const std::string &active_team,
                                          std::int64_t timestamp_ms);
[[nodiscard]] std::string encode_team_update(const state::TeamChange &change,
                                             std::int64_t timestamp_ms);
[[nodiscard]] std::string encode_heartbeat(std::size_t observers, std::int64_t timestamp_ms);
[[nodiscard]] std::string encode_history(const std::vector<sessions::SessionSummary> &sessions,
                                         std::int64_t timestamp_ms);
[[nodiscard]] std::string encode_session(const sessions::SessionDetail &detail,
                                         std::int64_t timestamp_ms);
[[nodiscard]] std::string encode_error(const std::string &message, std::int64_t timestamp_ms);

} // namespace teamlens::gateway
