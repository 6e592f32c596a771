#include "teamlens/model/team.hpp"

#include "teamlens/common/fs.hpp"

#include <algorithm>
#include <cctype>

namespace teamlens::model {

namespace {

bool is_numeric_id(const std::string &value) {
  return !value.empty() && std::all_of(value.begin(), value.end(), [](const unsigned char ch) {
    return std::isdigit(ch) != 0;
  });
}

std::string strip_leading_zeros(const std::string &value) {
  const auto first = value.find_first_not_of('0');
  if (first == std::string::npos) {
    return "0";
  }
  return value.substr(first);
}

} // namespace

std::string message_kind_to_string(const MessageKind kind) {
  switch (kind) {
  case MessageKind::PlainText:
    return "plain_text";
  case MessageKind::TaskAssignment:
    return "task_assignment";
  case MessageKind::ShutdownRequest:
    return "shutdown_request";
  case MessageKind::IdleNotification:
    return "idle_notification";
  case MessageKind::ShutdownApproved:
    return "shutdown_approved";
  }
  return "plain_text";
}

std::optional<MessageKind> message_kind_from_string(std::string_view value) {
  const std::string normalized = common::trim(std::string(value));
  if (normalized == "plain_text") {
    return MessageKind::PlainText;
  }
  if (normalized == "task_assignment") {
    return MessageKind::TaskAssignment;
  }
  if (normalized == "shutdown_request") {
    return MessageKind::ShutdownRequest;
  }
  if (normalized == "idle_notification") {
    return MessageKind::IdleNotification;
  }
  if (normalized == "shutdown_approved") {
    return MessageKind::ShutdownApproved;
  }
  return std::nullopt;
}

std::string task_status_to_string(const TaskStatus status) {
  switch (status) {
  case TaskStatus::Pending:
    return "pending";
  case TaskStatus::InProgress:
    return "in_progress";
  case TaskStatus::Completed:
    return "completed";
  case TaskStatus::Deleted:
    return "deleted";
  }
  return "pending";
}

std::optional<TaskStatus> task_status_from_string(std::string_view value) {
  const std::string normalized = common::to_lower(common::trim(std::string(value)));
  if (normalized == "pending") {
    return TaskStatus::Pending;
  }
  if (normalized == "in_progress") {
    return TaskStatus::InProgress;
  }
  if (normalized == "completed") {
    return TaskStatus::Completed;
  }
  if (normalized == "deleted") {
    return TaskStatus::Deleted;
  }
  return std::nullopt;
}

bool TaskIdLess::operator()(const std::string &lhs, const std::string &rhs) const {
  const bool lhs_numeric = is_numeric_id(lhs);
  const bool rhs_numeric = is_numeric_id(rhs);
  if (lhs_numeric && rhs_numeric) {
    const std::string a = strip_leading_zeros(lhs);
    const std::string b = strip_leading_zeros(rhs);
    if (a.size() != b.size()) {
      return a.size() < b.size();
    }
    if (a != b) {
      return a < b;
    }
    return lhs < rhs;
  }
  if (lhs_numeric != rhs_numeric) {
    return lhs_numeric;
  }
  return lhs < rhs;
}

bool is_visible(const Task &task) { return !task.internal && task.status != TaskStatus::Deleted; }

std::vector<Task> visible_tasks(const TaskMap &tasks) {
  std::vector<Task> out;
  out.reserve(tasks.size());
  for (const auto &[id, task] : tasks) {
    if (is_visible(task)) {
      out.push_back(task);
    }
  }
  return out;
}

} // namespace teamlens::model
