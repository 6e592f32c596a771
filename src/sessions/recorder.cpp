#include "teamlens/sessions/recorder.hpp"

#include "teamlens/health/health.hpp"
#include "teamlens/observability/global.hpp"

#include <iostream>

namespace teamlens::sessions {

namespace {

constexpr const char *COMPONENT = "recorder";

} // namespace

SessionRecorder::SessionRecorder(SessionStore &store) : store_(store) {}

SessionRecorder::~SessionRecorder() { stop(); }

void SessionRecorder::start() {
  if (running_) {
    return;
  }
  running_ = true;
  worker_ = std::thread([this]() { run_loop(); });
  health::mark_component_ok(COMPONENT);
}

void SessionRecorder::stop() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!running_ && !worker_.joinable()) {
      return;
    }
    running_ = false;
  }
  queue_cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
  health::mark_component_stopped(COMPONENT);
}

bool SessionRecorder::is_running() const { return running_; }

void SessionRecorder::on_change(const state::TeamChange &change) {
  std::size_t depth = 0;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!running_) {
      return;
    }
    queue_.push_back(change);
    depth = queue_.size();
  }
  queue_cv_.notify_one();
  observability::record_queue_depth(COMPONENT, depth);
}

bool SessionRecorder::wait_idle(const std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(queue_mutex_);
  return idle_cv_.wait_for(lock, timeout, [this]() { return queue_.empty() && !busy_; });
}

std::size_t SessionRecorder::queue_depth() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return queue_.size();
}

std::optional<std::int64_t> SessionRecorder::current_session(const std::string &team) const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  const auto it = sessions_.find(team);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void SessionRecorder::run_loop() {
  while (true) {
    state::TeamChange change;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this]() { return !running_ || !queue_.empty(); });
      if (queue_.empty()) {
        break;
      }
      change = std::move(queue_.front());
      queue_.pop_front();
      busy_ = true;
    }

    try {
      auto status = record(change);
      if (!status.ok()) {
        std::cerr << "[recorder] write_failed team=" << change.team_name
                  << " kind=" << state::team_change_kind_to_string(change.kind) << " "
                  << status.error() << "\n";
        health::mark_component_error(COMPONENT, status.error());
        observability::record_error(COMPONENT, status.error());
      }
    } catch (const std::exception &err) {
      std::cerr << "[recorder] exception team=" << change.team_name << " " << err.what() << "\n";
      observability::record_error(COMPONENT, err.what());
    }

    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      busy_ = false;
    }
    idle_cv_.notify_all();
  }
  idle_cv_.notify_all();
}

common::Status SessionRecorder::record(const state::TeamChange &change) {
  std::lock_guard<std::mutex> lock(record_mutex_);
  if (change.team == nullptr) {
    return common::Status::error("change without team state");
  }

  if (change.kind == state::TeamChangeKind::Config) {
    return record_config(change);
  }
  if (change.kind == state::TeamChangeKind::ConfigRemoved) {
    return record_config_removed(change);
  }

  auto session = resolve_session(change);
  if (!session.ok()) {
    return session.status();
  }
  if (!session.value().has_value()) {
    std::cerr << "[recorder] skip_no_session team=" << change.team_name
              << " kind=" << state::team_change_kind_to_string(change.kind) << "\n";
    return common::Status::success();
  }
  const std::int64_t session_id = *session.value();

  if (change.kind == state::TeamChangeKind::Inbox) {
    const auto it = change.team->inboxes.find(change.agent);
    if (it == change.team->inboxes.end()) {
      return common::Status::success();
    }
    auto written = store_.record_messages(session_id, change.agent, it->second);
    if (!written.ok()) {
      return written.status().with_context("messages");
    }
    return common::Status::success();
  }

  const auto it = change.team->tasks.find(change.task_id);
  if (it == change.team->tasks.end()) {
    return common::Status::success();
  }
  return store_.record_task(session_id, it->second).with_context("task");
}

common::Status SessionRecorder::record_config(const state::TeamChange &change) {
  if (!change.team->config.has_value()) {
    return common::Status::success();
  }
  auto config = *change.team->config;
  config.name = change.team_name;

  auto ensured = store_.ensure_session(config);
  if (!ensured.ok()) {
    return ensured.status().with_context("session");
  }
  const auto session_id = ensured.value().id;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_[change.team_name] = session_id;
  }
  if (ensured.value().created) {
    std::cerr << "[recorder] session_start team=" << change.team_name << " id=" << session_id
              << " created_at=" << config.created_at << "\n";
    observability::record_session_started(change.team_name, session_id, config.created_at);
  }

  auto members = store_.record_members(session_id, config.members);
  if (!members.ok()) {
    return members.with_context("members");
  }

  auto ended = store_.end_superseded_sessions(change.team_name, config.created_at);
  if (!ended.ok()) {
    return ended.status().with_context("end superseded");
  }
  for (const auto id : ended.value()) {
    observability::record_session_ended(change.team_name, id);
  }

  // Inbox and task files seen before the config had no session to land in.
  if (ensured.value().created) {
    for (const auto &[agent, messages] : change.team->inboxes) {
      auto written = store_.record_messages(session_id, agent, messages);
      if (!written.ok()) {
        return written.status().with_context("messages");
      }
    }
    auto tasks = store_.record_tasks(session_id, change.team->tasks);
    if (!tasks.ok()) {
      return tasks.with_context("tasks");
    }
  }
  health::mark_component_ok(COMPONENT);
  return common::Status::success();
}

common::Status SessionRecorder::record_config_removed(const state::TeamChange &change) {
  auto session = resolve_session(change);
  if (!session.ok()) {
    return session.status();
  }
  if (!session.value().has_value()) {
    return common::Status::success();
  }
  auto ended = store_.end_session(*session.value());
  if (!ended.ok()) {
    return ended.status().with_context("end session");
  }
  if (ended.value()) {
    std::cerr << "[recorder] session_end team=" << change.team_name
              << " id=" << *session.value() << "\n";
    observability::record_session_ended(change.team_name, *session.value());
  }
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  sessions_.erase(change.team_name);
  return common::Status::success();
}

common::Result<std::optional<std::int64_t>>
SessionRecorder::resolve_session(const state::TeamChange &change) {
  if (auto cached = current_session(change.team_name); cached.has_value()) {
    return common::Result<std::optional<std::int64_t>>::success(cached);
  }

  // A config seen in an earlier run already has its session on disk.
  std::optional<std::int64_t> found;
  if (change.team->config.has_value()) {
    auto exact = store_.find_session(change.team_name, change.team->config->created_at);
    if (!exact.ok()) {
      return common::Result<std::optional<std::int64_t>>::failure(exact.error());
    }
    if (exact.value().has_value()) {
      found = exact.value()->id;
    }
  }
  if (found.has_value()) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_[change.team_name] = *found;
  }
  return common::Result<std::optional<std::int64_t>>::success(found);
}

} // namespace teamlens::sessions
