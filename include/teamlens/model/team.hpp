#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace teamlens::model {

struct Member {
  std::string agent_id;
  std::string name;
  std::string agent_type;
  std::string model;
  std::string color;
  std::int64_t joined_at = 0;
};

struct TeamConfig {
  std::string name;
  std::string description;
  std::int64_t created_at = 0;
  std::string lead_agent_id;
  std::vector<Member> members;
};

enum class MessageKind {
  PlainText,
  TaskAssignment,
  ShutdownRequest,
  IdleNotification,
  ShutdownApproved,
};

[[nodiscard]] std::string message_kind_to_string(MessageKind kind);
[[nodiscard]] std::optional<MessageKind> message_kind_from_string(std::string_view value);

struct InboxMessage {
  std::string from;
  std::string text;
  std::string timestamp;
  std::string color;
  bool read = false;
  MessageKind kind = MessageKind::PlainText;
  // Raw JSON object of a structured message; empty for plain text.
  std::string payload_json;
};

enum class TaskStatus {
  Pending,
  InProgress,
  Completed,
  Deleted,
};

[[nodiscard]] std::string task_status_to_string(TaskStatus status);
[[nodiscard]] std::optional<TaskStatus> task_status_from_string(std::string_view value);

struct Task {
  std::string id;
  std::string subject;
  std::string description;
  std::string active_form;
  TaskStatus status = TaskStatus::Pending;
  std::string owner;
  std::vector<std::string> blocks;
  std::vector<std::string> blocked_by;
  bool internal = false;
};

// Numeric ids first, in numeric order.
struct TaskIdLess {
  bool operator()(const std::string &lhs, const std::string &rhs) const;
};

using TaskMap = std::map<std::string, Task, TaskIdLess>;
using InboxMap = std::map<std::string, std::vector<InboxMessage>>;

struct Team {
  std::string name;
  std::optional<TeamConfig> config;
  InboxMap inboxes;
  TaskMap tasks;
};

[[nodiscard]] bool is_visible(const Task &task);
[[nodiscard]] std::vector<Task> visible_tasks(const TaskMap &tasks);

} // namespace teamlens::model
