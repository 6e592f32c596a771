#include "teamlens/watch/file_watcher.hpp"

#include "teamlens/health/health.hpp"
#include "teamlens/observability/global.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>

#include <fcntl.h>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace teamlens::watch {

namespace {

constexpr std::uint32_t WATCH_MASK = IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_MOVED_TO |
                                     IN_MOVED_FROM | IN_DELETE | IN_DELETE_SELF | IN_ONLYDIR;
constexpr const char *COMPONENT = "watcher";

int kind_rank(const ChangeKind kind) {
  switch (kind) {
  case ChangeKind::TeamConfig:
    return 0;
  case ChangeKind::Inbox:
    return 1;
  case ChangeKind::Task:
    return 2;
  case ChangeKind::Ignored:
    return 3;
  }
  return 3;
}

common::Status require_directory(const std::filesystem::path &root, const std::string &label) {
  std::error_code ec;
  if (root.empty()) {
    return common::Status::error(label + " root is empty");
  }
  if (!std::filesystem::is_directory(root, ec)) {
    return common::Status::error(label + " root is not an accessible directory: " +
                                 root.string());
  }
  if (::access(root.c_str(), R_OK | X_OK) != 0) {
    return common::Status::error(label + " root is not readable: " + root.string());
  }
  return common::Status::success();
}

} // namespace

FileWatcher::FileWatcher(FileWatcherOptions options, ChangeCallback callback)
    : options_(std::move(options)), callback_(std::move(callback)),
      classifier_(options_.teams_root, options_.tasks_root),
      debouncer_(options_.debounce, [this](const std::string &path, const NotificationKind kind) {
        deliver(path, kind);
      }) {}

FileWatcher::~FileWatcher() { stop(); }

common::Status FileWatcher::start() {
  if (running_) {
    return common::Status::success();
  }
  health::mark_component_starting(COMPONENT);

  for (const auto &[root, label] :
       {std::pair{options_.teams_root, std::string("teams")},
        std::pair{options_.tasks_root, std::string("tasks")}}) {
    auto status = require_directory(root, label);
    if (!status.ok()) {
      health::mark_component_error(COMPONENT, status.error());
      return status;
    }
  }

  inotify_fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if (inotify_fd_ < 0) {
    const std::string error = std::string("inotify_init1 failed: ") + std::strerror(errno);
    health::mark_component_error(COMPONENT, error);
    return common::Status::error(error);
  }
  if (::pipe2(stop_pipe_, O_CLOEXEC) != 0) {
    const std::string error = std::string("pipe2 failed: ") + std::strerror(errno);
    close_handles();
    health::mark_component_error(COMPONENT, error);
    return common::Status::error(error);
  }

  for (const auto &root : {options_.teams_root, options_.tasks_root}) {
    auto status = add_watch_tree(root);
    if (!status.ok()) {
      close_handles();
      health::mark_component_error(COMPONENT, status.error());
      return status;
    }
  }

  running_ = true;
  debouncer_.start();

  // Watches are live before the scan, so nothing written during it is lost.
  const auto baseline = scan();
  for (const auto &change : baseline) {
    try {
      callback_(change);
    } catch (const std::exception &err) {
      std::cerr << "[watcher] scan_callback_exception path=" << change.path << " " << err.what()
                << "\n";
    }
  }
  std::cerr << "[watcher] started watches=" << watch_count() << " baseline=" << baseline.size()
            << "\n";

  reader_ = std::thread([this]() { read_loop(); });
  health::mark_component_ok(COMPONENT, "watches=" + std::to_string(watch_count()));
  return common::Status::success();
}

void FileWatcher::stop() {
  const bool was_running = running_.exchange(false);
  if (stop_pipe_[1] >= 0) {
    const char byte = 'x';
    if (::write(stop_pipe_[1], &byte, 1) < 0 && errno != EAGAIN) {
      std::cerr << "[watcher] stop signal failed: " << std::strerror(errno) << "\n";
    }
  }
  if (reader_.joinable()) {
    reader_.join();
  }
  debouncer_.stop();
  close_handles();
  if (was_running) {
    health::mark_component_stopped(COMPONENT);
  }
}

bool FileWatcher::is_running() const { return running_; }

std::size_t FileWatcher::watch_count() const {
  std::lock_guard<std::mutex> lock(watches_mutex_);
  return watches_.size();
}

std::vector<ClassifiedChange> FileWatcher::scan() const {
  std::vector<ClassifiedChange> out;
  for (const auto &root : {options_.teams_root, options_.tasks_root}) {
    std::error_code ec;
    auto it = std::filesystem::recursive_directory_iterator(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
      std::cerr << "[watcher] scan_failed root=" << root.string() << " " << ec.message() << "\n";
      continue;
    }
    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
      if (ec) {
        break;
      }
      std::error_code file_ec;
      if (!it->is_regular_file(file_ec)) {
        continue;
      }
      auto change = classifier_.classify(it->path().string(), NotificationKind::Added);
      if (change.kind != ChangeKind::Ignored) {
        out.push_back(std::move(change));
      }
    }
  }
  std::stable_sort(out.begin(), out.end(), [](const auto &lhs, const auto &rhs) {
    if (kind_rank(lhs.kind) != kind_rank(rhs.kind)) {
      return kind_rank(lhs.kind) < kind_rank(rhs.kind);
    }
    return lhs.path < rhs.path;
  });
  // Tasks root is scanned second; dedupe in case the roots overlap.
  out.erase(std::unique(out.begin(), out.end(),
                        [](const auto &lhs, const auto &rhs) { return lhs.path == rhs.path; }),
            out.end());
  return out;
}

common::Status FileWatcher::add_watch_tree(const std::filesystem::path &dir) {
  auto status = add_watch(dir);
  if (!status.ok()) {
    return status;
  }
  std::error_code ec;
  auto it = std::filesystem::recursive_directory_iterator(
      dir, std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec) {
    return common::Status::error("cannot list " + dir.string() + ": " + ec.message());
  }
  for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }
    std::error_code dir_ec;
    if (it->is_directory(dir_ec) && !it->is_symlink(dir_ec)) {
      auto nested = add_watch(it->path());
      if (!nested.ok()) {
        std::cerr << "[watcher] " << nested.error() << "\n";
      }
    }
  }
  return common::Status::success();
}

common::Status FileWatcher::add_watch(const std::filesystem::path &dir) {
  const int wd = ::inotify_add_watch(inotify_fd_, dir.c_str(), WATCH_MASK);
  if (wd < 0) {
    return common::Status::error("inotify_add_watch failed for " + dir.string() + ": " +
                                 std::strerror(errno));
  }
  std::lock_guard<std::mutex> lock(watches_mutex_);
  watches_[wd] = dir;
  return common::Status::success();
}

void FileWatcher::read_loop() {
  alignas(inotify_event) char buffer[64 * 1024];
  pollfd fds[2] = {{.fd = inotify_fd_, .events = POLLIN, .revents = 0},
                   {.fd = stop_pipe_[0], .events = POLLIN, .revents = 0}};

  while (running_) {
    const int rc = ::poll(fds, 2, -1);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      const std::string error = std::string("poll failed: ") + std::strerror(errno);
      health::mark_component_error(COMPONENT, error);
      observability::record_error(COMPONENT, error);
      break;
    }
    if ((fds[1].revents & POLLIN) != 0) {
      break;
    }
    if ((fds[0].revents & POLLIN) == 0) {
      continue;
    }

    while (running_) {
      const ssize_t len = ::read(inotify_fd_, buffer, sizeof(buffer));
      if (len <= 0) {
        break;
      }
      for (char *ptr = buffer; ptr < buffer + len;) {
        const auto *event = reinterpret_cast<const inotify_event *>(ptr);
        const std::string name = event->len > 0 ? std::string(event->name) : std::string();
        try {
          handle_event(event->wd, event->mask, name);
        } catch (const std::exception &err) {
          std::cerr << "[watcher] event_exception " << err.what() << "\n";
        }
        ptr += sizeof(inotify_event) + event->len;
      }
    }
  }
}

void FileWatcher::handle_event(const int wd, const std::uint32_t mask, const std::string &name) {
  if ((mask & IN_Q_OVERFLOW) != 0) {
    std::cerr << "[watcher] queue_overflow rescanning\n";
    observability::record_error(COMPONENT, "inotify queue overflow");
    for (const auto &change : scan()) {
      debouncer_.notify(change.path, NotificationKind::Modified);
    }
    return;
  }

  std::filesystem::path dir;
  {
    std::lock_guard<std::mutex> lock(watches_mutex_);
    const auto it = watches_.find(wd);
    if (it == watches_.end()) {
      return;
    }
    dir = it->second;
    if ((mask & IN_IGNORED) != 0) {
      watches_.erase(it);
      return;
    }
  }
  if ((mask & IN_DELETE_SELF) != 0 || name.empty()) {
    return;
  }

  const auto path = dir / name;
  if ((mask & IN_ISDIR) != 0) {
    if ((mask & (IN_CREATE | IN_MOVED_TO)) != 0) {
      auto status = add_watch_tree(path);
      if (!status.ok()) {
        std::cerr << "[watcher] " << status.error() << "\n";
        return;
      }
      notify_tree(path);
    }
    return;
  }

  NotificationKind kind = NotificationKind::Modified;
  if ((mask & (IN_DELETE | IN_MOVED_FROM)) != 0) {
    kind = NotificationKind::Removed;
  } else if ((mask & (IN_CREATE | IN_MOVED_TO)) != 0) {
    kind = NotificationKind::Added;
  }
  debouncer_.notify(path.string(), kind);
}

void FileWatcher::notify_tree(const std::filesystem::path &dir) {
  std::error_code ec;
  auto it = std::filesystem::recursive_directory_iterator(
      dir, std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec) {
    return;
  }
  for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }
    std::error_code file_ec;
    if (it->is_regular_file(file_ec)) {
      debouncer_.notify(it->path().string(), NotificationKind::Added);
    }
  }
}

void FileWatcher::deliver(const std::string &path, const NotificationKind kind) {
  const auto change = classifier_.classify(path, kind);
  if (change.kind == ChangeKind::Ignored || !running_) {
    return;
  }
  callback_(change);
}

void FileWatcher::close_handles() {
  if (inotify_fd_ >= 0) {
    ::close(inotify_fd_);
    inotify_fd_ = -1;
  }
  for (int &fd : stop_pipe_) {
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }
  std::lock_guard<std::mutex> lock(watches_mutex_);
  watches_.clear();
}

} // namespace teamlens::watch
