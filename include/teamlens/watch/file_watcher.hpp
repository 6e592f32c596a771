#pragma once

#include "teamlens/common/result.hpp"
#include "teamlens/watch/debouncer.hpp"
#include "teamlens/watch/path_classifier.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace teamlens::watch {

struct FileWatcherOptions {
  std::filesystem::path teams_root;
  std::filesystem::path tasks_root;
  std::chrono::milliseconds debounce{100};
};

class FileWatcher {
public:
  using ChangeCallback = std::function<void(const ClassifiedChange &change)>;

  FileWatcher(FileWatcherOptions options, ChangeCallback callback);
  ~FileWatcher();

  FileWatcher(const FileWatcher &) = delete;
  FileWatcher &operator=(const FileWatcher &) = delete;

  [[nodiscard]] common::Status start();
  void stop();
  [[nodiscard]] bool is_running() const;

  [[nodiscard]] std::size_t watch_count() const;

  [[nodiscard]] std::vector<ClassifiedChange> scan() const;

private:
  [[nodiscard]] common::Status add_watch_tree(const std::filesystem::path &dir);
  [[nodiscard]] common::Status add_watch(const std::filesystem::path &dir);
  void read_loop();
  void handle_event(int wd, std::uint32_t mask, const std::string &name);
  void notify_tree(const std::filesystem::path &dir);
  void deliver(const std::string &path, NotificationKind kind);
  void close_handles();

  FileWatcherOptions options_;
  ChangeCallback callback_;
  PathClassifier classifier_;
  ChangeDebouncer debouncer_;

  int inotify_fd_ = -1;
  int stop_pipe_[2] = {-1, -1};
  mutable std::mutex watches_mutex_;
  std::unordered_map<int, std::filesystem::path> watches_;
  std::thread reader_;
  std::atomic<bool> running_{false};
};

} // namespace teamlens::watch
