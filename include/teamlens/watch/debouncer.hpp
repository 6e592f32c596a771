#pragma once

#include "teamlens/watch/path_classifier.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace teamlens::watch {

class ChangeDebouncer {
public:
  using Callback = std::function<void(const std::string &path, NotificationKind kind)>;

  ChangeDebouncer(std::chrono::milliseconds delay, Callback callback);
  ~ChangeDebouncer();

  ChangeDebouncer(const ChangeDebouncer &) = delete;
  ChangeDebouncer &operator=(const ChangeDebouncer &) = delete;

  void start();
  void stop();
  [[nodiscard]] bool is_running() const;

  void notify(const std::string &path, NotificationKind kind);
  [[nodiscard]] std::size_t pending() const;

private:
  struct Pending {
    std::chrono::steady_clock::time_point deadline;
    NotificationKind kind = NotificationKind::Modified;
  };

  void run_loop();

  std::chrono::milliseconds delay_;
  Callback callback_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::unordered_map<std::string, Pending> pending_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

} // namespace teamlens::watch
