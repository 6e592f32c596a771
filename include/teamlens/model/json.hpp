#pragma once

#include "teamlens/model/team.hpp"

#include <string>
#include <vector>

namespace teamlens::model {

[[nodiscard]] std::string member_to_json(const Member &member);
[[nodiscard]] std::string team_config_to_json(const TeamConfig &config);
[[nodiscard]] std::string inbox_message_to_json(const InboxMessage &message);
[[nodiscard]] std::string inbox_to_json(const std::vector<InboxMessage> &messages);
[[nodiscard]] std::string task_to_json(const Task &task);

// Only visible tasks are rendered.
[[nodiscard]] std::string tasks_to_json(const TaskMap &tasks);

[[nodiscard]] std::string team_to_json(const Team &team);

} // namespace teamlens::model
