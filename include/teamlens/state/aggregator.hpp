#pragma once

#include "teamlens/state/change.hpp"
#include "teamlens/watch/path_classifier.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace teamlens::state {

class StateAggregator {
public:
  StateAggregator();
  ~StateAggregator();

  StateAggregator(const StateAggregator &) = delete;
  StateAggregator &operator=(const StateAggregator &) = delete;

  // Sinks must be added before start().
  void add_sink(ChangeSink *sink);

  void start();
  void stop();
  [[nodiscard]] bool is_running() const;

  void enqueue(const watch::ClassifiedChange &change);
  [[nodiscard]] std::size_t queue_depth() const;

  [[nodiscard]] bool wait_idle(std::chrono::milliseconds timeout) const;

  std::optional<TeamChange> apply(const watch::ClassifiedChange &change);

  [[nodiscard]] std::shared_ptr<const WorldState> snapshot() const;
  [[nodiscard]] std::shared_ptr<const model::Team> team(const std::string &name) const;

private:
  void run_loop();
  void publish(std::shared_ptr<const WorldState> next);
  void dispatch(const TeamChange &change);

  std::optional<TeamChange> apply_config(const watch::ClassifiedChange &change);
  std::optional<TeamChange> apply_inbox(const watch::ClassifiedChange &change);
  std::optional<TeamChange> apply_task(const watch::ClassifiedChange &change);

  [[nodiscard]] model::Team current_team(const std::string &name) const;
  std::shared_ptr<const model::Team> store_team(model::Team team, bool mark_active);

  std::vector<ChangeSink *> sinks_;

  mutable std::mutex queue_mutex_;
  mutable std::condition_variable queue_cv_;
  mutable std::condition_variable idle_cv_;
  std::deque<watch::ClassifiedChange> queue_;
  bool busy_ = false;
  std::thread worker_;
  std::atomic<bool> running_{false};

  std::mutex apply_mutex_;
  // Changes implied by the last merge, dispatched after it.
  std::vector<TeamChange> followups_;
  mutable std::mutex state_mutex_;
  std::shared_ptr<const WorldState> state_;
};

} // namespace teamlens::state
