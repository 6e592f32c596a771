#include "teamlens/watch/path_classifier.hpp"

#include "teamlens/common/fs.hpp"

#include <algorithm>
#include <optional>
#include <vector>

namespace teamlens::watch {

namespace {

constexpr const char *JSON_SUFFIX = ".json";

std::string normalize_separators(std::string value) {
  std::replace(value.begin(), value.end(), '\\', '/');
  return value;
}

std::string normalize_root(const std::filesystem::path &root) {
  std::string value = normalize_separators(root.string());
  while (value.size() > 1 && value.back() == '/') {
    value.pop_back();
  }
  return value;
}

std::optional<std::vector<std::string>> relative_segments(const std::string &path,
                                                          const std::string &root) {
  if (root.empty() || path.size() <= root.size() + 1 || !common::starts_with(path, root) ||
      path[root.size()] != '/') {
    return std::nullopt;
  }

  std::vector<std::string> segments;
  std::size_t start = root.size() + 1;
  while (start <= path.size()) {
    const auto slash = path.find('/', start);
    const auto end = slash == std::string::npos ? path.size() : slash;
    if (end > start) {
      std::string segment = path.substr(start, end - start);
      if (segment == "." || segment == "..") {
        return std::nullopt;
      }
      segments.push_back(std::move(segment));
    }
    if (slash == std::string::npos) {
      break;
    }
    start = slash + 1;
  }
  return segments;
}

std::string json_stem(const std::string &file_name) {
  return file_name.substr(0, file_name.size() - std::char_traits<char>::length(JSON_SUFFIX));
}

} // namespace

std::string change_kind_to_string(const ChangeKind kind) {
  switch (kind) {
  case ChangeKind::TeamConfig:
    return "config";
  case ChangeKind::Inbox:
    return "inbox";
  case ChangeKind::Task:
    return "task";
  case ChangeKind::Ignored:
    return "ignored";
  }
  return "ignored";
}

std::string notification_kind_to_string(const NotificationKind kind) {
  switch (kind) {
  case NotificationKind::Added:
    return "added";
  case NotificationKind::Modified:
    return "modified";
  case NotificationKind::Removed:
    return "removed";
  }
  return "modified";
}

PathClassifier::PathClassifier(const std::filesystem::path &teams_root,
                               const std::filesystem::path &tasks_root)
    : teams_root_(normalize_root(teams_root)), tasks_root_(normalize_root(tasks_root)) {}

ClassifiedChange PathClassifier::classify(const std::string &path,
                                          const NotificationKind notification) const {
  ClassifiedChange change;
  change.path = normalize_separators(path);
  change.notification = notification;

  if (!common::ends_with(change.path, JSON_SUFFIX)) {
    return change;
  }

  if (const auto segments = relative_segments(change.path, tasks_root_);
      segments.has_value() && segments->size() == 2) {
    const std::string id = json_stem((*segments)[1]);
    if (!id.empty()) {
      change.kind = ChangeKind::Task;
      change.team = (*segments)[0];
      change.task_id = id;
      return change;
    }
  }

  const auto segments = relative_segments(change.path, teams_root_);
  if (!segments.has_value()) {
    return change;
  }
  if (segments->size() == 2 && (*segments)[1] == "config.json") {
    change.kind = ChangeKind::TeamConfig;
    change.team = (*segments)[0];
    return change;
  }
  if (segments->size() == 3 && (*segments)[1] == "inboxes") {
    const std::string agent = json_stem((*segments)[2]);
    if (!agent.empty()) {
      change.kind = ChangeKind::Inbox;
      change.team = (*segments)[0];
      change.agent = agent;
    }
  }
  return change;
}

} // namespace teamlens::watch
