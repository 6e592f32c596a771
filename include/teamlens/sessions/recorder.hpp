#pragma once

#include "teamlens/sessions/store.hpp"
#include "teamlens/state/change.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>

namespace teamlens::sessions {

class SessionRecorder final : public state::ChangeSink {
public:
  explicit SessionRecorder(SessionStore &store);
  ~SessionRecorder() override;

  SessionRecorder(const SessionRecorder &) = delete;
  SessionRecorder &operator=(const SessionRecorder &) = delete;

  void start();
  void stop();
  [[nodiscard]] bool is_running() const;

  void on_change(const state::TeamChange &change) override;

  [[nodiscard]] bool wait_idle(std::chrono::milliseconds timeout) const;
  [[nodiscard]] std::size_t queue_depth() const;

  [[nodiscard]] common::Status record(const state::TeamChange &change);

  [[nodiscard]] std::optional<std::int64_t> current_session(const std::string &team) const;

private:
  void run_loop();
  [[nodiscard]] common::Status record_config(const state::TeamChange &change);
  [[nodiscard]] common::Status record_config_removed(const state::TeamChange &change);
  [[nodiscard]] common::Result<std::optional<std::int64_t>>
  resolve_session(const state::TeamChange &change);

  SessionStore &store_;

  mutable std::mutex queue_mutex_;
  mutable std::condition_variable queue_cv_;
  mutable std::condition_variable idle_cv_;
  std::deque<state::TeamChange> queue_;
  bool busy_ = false;
  std::thread worker_;
  std::atomic<bool> running_{false};

  std::mutex record_mutex_;
  mutable std::mutex sessions_mutex_;
  std::unordered_map<std::string, std::int64_t> sessions_;
};

} // namespace teamlens::sessions
