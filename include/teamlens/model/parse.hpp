#pragma once

#include "teamlens/common/result.hpp"
#include "teamlens/model/team.hpp"

#include <string>
#include <vector>

namespace teamlens::model {

[[nodiscard]] common::Result<TeamConfig> parse_team_config(const std::string &json);
[[nodiscard]] common::Result<std::vector<InboxMessage>> parse_inbox(const std::string &json);
[[nodiscard]] common::Result<Task> parse_task(const std::string &json);

void classify_message_text(InboxMessage &message);

} // namespace teamlens::model
