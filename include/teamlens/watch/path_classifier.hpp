#pragma once

#include <filesystem>
#include <string>

namespace teamlens::watch {

enum class ChangeKind {
  TeamConfig,
  Inbox,
  Task,
  Ignored,
};

enum class NotificationKind {
  Added,
  Modified,
  Removed,
};

[[nodiscard]] std::string change_kind_to_string(ChangeKind kind);
[[nodiscard]] std::string notification_kind_to_string(NotificationKind kind);

struct ClassifiedChange {
  ChangeKind kind = ChangeKind::Ignored;
  std::string path;
  std::string team;
  std::string agent;
  std::string task_id;
  NotificationKind notification = NotificationKind::Modified;
};

class PathClassifier {
public:
  PathClassifier(const std::filesystem::path &teams_root, const std::filesystem::path &tasks_root);

  [[nodiscard]] ClassifiedChange
  classify(const std::string &path,
           NotificationKind notification = NotificationKind::Modified) const;

  [[nodiscard]] const std::string &teams_root() const { return teams_root_; }
  [[nodiscard]] const std::string &tasks_root() const { return tasks_root_; }

private:
  std::string teams_root_;
  std::string tasks_root_;
};

} // namespace teamlens::watch
