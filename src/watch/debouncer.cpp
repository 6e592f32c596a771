#include "teamlens/watch/debouncer.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

namespace teamlens::watch {

ChangeDebouncer::ChangeDebouncer(const std::chrono::milliseconds delay, Callback callback)
    : delay_(delay), callback_(std::move(callback)) {}

ChangeDebouncer::~ChangeDebouncer() { stop(); }

void ChangeDebouncer::start() {
  if (running_) {
    return;
  }
  running_ = true;
  thread_ = std::thread([this]() { run_loop(); });
}

void ChangeDebouncer::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    pending_.clear();
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool ChangeDebouncer::is_running() const { return running_; }

void ChangeDebouncer::notify(const std::string &path, const NotificationKind kind) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    auto &entry = pending_[path];
    entry.deadline = std::chrono::steady_clock::now() + delay_;
    // A create immediately followed by writes is still an add.
    if (!(entry.kind == NotificationKind::Added && kind == NotificationKind::Modified)) {
      entry.kind = kind;
    }
  }
  cv_.notify_all();
}

std::size_t ChangeDebouncer::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

void ChangeDebouncer::run_loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (running_) {
    if (pending_.empty()) {
      cv_.wait(lock, [this]() { return !running_ || !pending_.empty(); });
      continue;
    }

    auto next_deadline = std::chrono::steady_clock::time_point::max();
    for (const auto &[path, entry] : pending_) {
      next_deadline = std::min(next_deadline, entry.deadline);
    }
    if (std::chrono::steady_clock::now() < next_deadline) {
      cv_.wait_until(lock, next_deadline);
      continue;
    }

    const auto now = std::chrono::steady_clock::now();
    std::vector<std::pair<std::string, Pending>> due;
    for (auto it = pending_.begin(); it != pending_.end();) {
      if (it->second.deadline <= now) {
        due.emplace_back(it->first, it->second);
        it = pending_.erase(it);
      } else {
        ++it;
      }
    }
    std::sort(due.begin(), due.end(), [](const auto &lhs, const auto &rhs) {
      return lhs.second.deadline < rhs.second.deadline;
    });

    lock.unlock();
    for (const auto &[path, entry] : due) {
      if (!running_) {
        break;
      }
      try {
        callback_(path, entry.kind);
      } catch (const std::exception &err) {
        std::cerr << "[watcher][debounce] callback_exception path=" << path << " " << err.what()
                  << "\n";
      }
    }
    lock.lock();
  }
}

} // namespace teamlens::watch
