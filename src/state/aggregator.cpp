#include "teamlens/state/aggregator.hpp"

#include "teamlens/common/fs.hpp"
#include "teamlens/health/health.hpp"
#include "teamlens/model/parse.hpp"
#include "teamlens/observability/global.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>

namespace teamlens::state {

namespace {

constexpr const char *COMPONENT = "aggregator";

void report_read_failure(const watch::ClassifiedChange &change, const std::string &error) {
  std::cerr << "[aggregator] keep_previous kind=" << watch::change_kind_to_string(change.kind)
            << " team=" << change.team << " path=" << change.path << " reason=" << error << "\n";
  observability::record_parse_failure(change.path, error);
}

bool file_missing(const std::string &path) {
  std::error_code ec;
  return !std::filesystem::exists(path, ec);
}

} // namespace

StateAggregator::StateAggregator() : state_(std::make_shared<const WorldState>()) {}

StateAggregator::~StateAggregator() { stop(); }

void StateAggregator::add_sink(ChangeSink *sink) {
  if (sink != nullptr) {
    sinks_.push_back(sink);
  }
}

void StateAggregator::start() {
  if (running_) {
    return;
  }
  running_ = true;
  worker_ = std::thread([this]() { run_loop(); });
  health::mark_component_ok(COMPONENT);
}

void StateAggregator::stop() {
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

bool StateAggregator::is_running() const { return running_; }

void StateAggregator::enqueue(const watch::ClassifiedChange &change) {
  if (change.kind == watch::ChangeKind::Ignored) {
    return;
  }
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

std::size_t StateAggregator::queue_depth() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return queue_.size();
}

bool StateAggregator::wait_idle(const std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(queue_mutex_);
  return idle_cv_.wait_for(lock, timeout, [this]() { return queue_.empty() && !busy_; });
}

void StateAggregator::run_loop() {
  while (true) {
    watch::ClassifiedChange change;
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
      (void)apply(change);
    } catch (const std::exception &err) {
      std::cerr << "[aggregator] apply_exception path=" << change.path << " " << err.what()
                << "\n";
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

std::optional<TeamChange> StateAggregator::apply(const watch::ClassifiedChange &change) {
  std::lock_guard<std::mutex> lock(apply_mutex_);
  const auto started = std::chrono::steady_clock::now();

  std::optional<TeamChange> result;
  followups_.clear();
  switch (change.kind) {
  case watch::ChangeKind::TeamConfig:
    result = apply_config(change);
    break;
  case watch::ChangeKind::Inbox:
    result = apply_inbox(change);
    break;
  case watch::ChangeKind::Task:
    result = apply_task(change);
    break;
  case watch::ChangeKind::Ignored:
    break;
  }
  if (!result.has_value()) {
    return std::nullopt;
  }

  observability::record_file_ingested(
      change.team, watch::change_kind_to_string(change.kind), change.path,
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                            started));
  dispatch(*result);
  for (const auto &followup : followups_) {
    dispatch(followup);
  }
  followups_.clear();
  return result;
}

std::optional<TeamChange>
StateAggregator::apply_config(const watch::ClassifiedChange &change) {
  if (change.notification == watch::NotificationKind::Removed && file_missing(change.path)) {
    const auto existing = team(change.team);
    if (existing == nullptr || !existing->config.has_value()) {
      return std::nullopt;
    }
    std::cerr << "[aggregator] config_removed team=" << change.team << "\n";
    return TeamChange{.team_name = change.team,
                      .kind = TeamChangeKind::ConfigRemoved,
                      .team = existing};
  }

  const auto text = common::read_text_file(change.path);
  if (!text.ok()) {
    report_read_failure(change, text.error());
    return std::nullopt;
  }
  auto parsed = model::parse_team_config(text.value());
  if (!parsed.ok()) {
    report_read_failure(change, parsed.error());
    return std::nullopt;
  }

  auto config = std::move(parsed.value());
  if (config.name.empty()) {
    config.name = change.team;
  }
  model::Team next = current_team(change.team);
  if (next.config.has_value() && next.config->created_at != config.created_at) {
    // A new run starts from an empty board.
    std::cerr << "[aggregator] new_run team=" << change.team
              << " previous_created_at=" << next.config->created_at
              << " created_at=" << config.created_at << "\n";
    std::vector<std::string> agents;
    for (const auto &[agent, messages] : next.inboxes) {
      agents.push_back(agent);
    }
    const bool had_tasks = !next.tasks.empty();
    next.inboxes.clear();
    next.tasks.clear();
    next.config = std::move(config);
    auto published = store_team(std::move(next), true);
    for (auto &agent : agents) {
      followups_.push_back(TeamChange{.team_name = change.team,
                                      .kind = TeamChangeKind::Inbox,
                                      .team = published,
                                      .agent = std::move(agent)});
    }
    if (had_tasks) {
      followups_.push_back(
          TeamChange{.team_name = change.team, .kind = TeamChangeKind::Task, .team = published});
    }
    return TeamChange{.team_name = change.team, .kind = TeamChangeKind::Config, .team = published};
  }
  next.config = std::move(config);
  auto published = store_team(std::move(next), true);
  return TeamChange{.team_name = change.team, .kind = TeamChangeKind::Config, .team = published};
}

std::optional<TeamChange> StateAggregator::apply_inbox(const watch::ClassifiedChange &change) {
  if (change.notification == watch::NotificationKind::Removed && file_missing(change.path)) {
    model::Team next = current_team(change.team);
    if (next.inboxes.erase(change.agent) == 0) {
      return std::nullopt;
    }
    auto published = store_team(std::move(next), false);
    return TeamChange{.team_name = change.team,
                      .kind = TeamChangeKind::Inbox,
                      .team = published,
                      .agent = change.agent};
  }

  const auto text = common::read_text_file(change.path);
  if (!text.ok()) {
    report_read_failure(change, text.error());
    return std::nullopt;
  }
  auto parsed = model::parse_inbox(text.value());
  if (!parsed.ok()) {
    report_read_failure(change, parsed.error());
    return std::nullopt;
  }

  model::Team next = current_team(change.team);
  next.inboxes[change.agent] = std::move(parsed.value());
  auto published = store_team(std::move(next), false);
  return TeamChange{.team_name = change.team,
                    .kind = TeamChangeKind::Inbox,
                    .team = published,
                    .agent = change.agent};
}

std::optional<TeamChange> StateAggregator::apply_task(const watch::ClassifiedChange &change) {
  if (change.notification == watch::NotificationKind::Removed && file_missing(change.path)) {
    model::Team next = current_team(change.team);
    if (next.tasks.erase(change.task_id) == 0) {
      return std::nullopt;
    }
    auto published = store_team(std::move(next), false);
    return TeamChange{.team_name = change.team,
                      .kind = TeamChangeKind::Task,
                      .team = published,
                      .task_id = change.task_id};
  }

  const auto text = common::read_text_file(change.path);
  if (!text.ok()) {
    report_read_failure(change, text.error());
    return std::nullopt;
  }
  auto parsed = model::parse_task(text.value());
  if (!parsed.ok()) {
    report_read_failure(change, parsed.error());
    return std::nullopt;
  }

  auto task = std::move(parsed.value());
  if (task.id != change.task_id) {
    if (!task.id.empty()) {
      std::cerr << "[aggregator] task_id_mismatch team=" << change.team
                << " file=" << change.task_id << " body=" << task.id << "\n";
    }
    task.id = change.task_id;
  }

  model::Team next = current_team(change.team);
  next.tasks[change.task_id] = std::move(task);
  auto published = store_team(std::move(next), false);
  return TeamChange{.team_name = change.team,
                    .kind = TeamChangeKind::Task,
                    .team = published,
                    .task_id = change.task_id};
}

std::shared_ptr<const WorldState> StateAggregator::snapshot() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

std::shared_ptr<const model::Team> StateAggregator::team(const std::string &name) const {
  const auto current = snapshot();
  const auto it = current->teams.find(name);
  if (it == current->teams.end()) {
    return nullptr;
  }
  return it->second;
}

model::Team StateAggregator::current_team(const std::string &name) const {
  if (const auto existing = team(name); existing != nullptr) {
    return *existing;
  }
  model::Team fresh;
  fresh.name = name;
  return fresh;
}

std::shared_ptr<const model::Team> StateAggregator::store_team(model::Team team,
                                                               const bool mark_active) {
  auto published = std::make_shared<const model::Team>(std::move(team));
  auto next = std::make_shared<WorldState>(*snapshot());
  next->teams[published->name] = published;
  if (mark_active || next->active_team.empty()) {
    next->active_team = published->name;
  }
  publish(std::move(next));
  return published;
}

void StateAggregator::publish(std::shared_ptr<const WorldState> next) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  state_ = std::move(next);
}

void StateAggregator::dispatch(const TeamChange &change) {
  for (auto *sink : sinks_) {
    try {
      sink->on_change(change);
    } catch (const std::exception &err) {
      std::cerr << "[aggregator] sink_exception team=" << change.team_name << " " << err.what()
                << "\n";
      observability::record_error(COMPONENT, err.what());
    }
  }
}

} // namespace teamlens::state
