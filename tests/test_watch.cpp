#include "test_framework.hpp"

#include "teamlens/watch/debouncer.hpp"
#include "teamlens/watch/file_watcher.hpp"
#include "teamlens/watch/path_classifier.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

namespace {

struct Recorded {
  std::mutex mutex;
  std::vector<teamlens::watch::ClassifiedChange> changes;

  void add(const teamlens::watch::ClassifiedChange &change) {
    std::lock_guard<std::mutex> lock(mutex);
    changes.push_back(change);
  }

  std::size_t count_for(const std::string &path) {
    std::lock_guard<std::mutex> lock(mutex);
    std::size_t count = 0;
    for (const auto &change : changes) {
      if (change.path == path) {
        ++count;
      }
    }
    return count;
  }

  std::vector<teamlens::watch::ClassifiedChange> copy() {
    std::lock_guard<std::mutex> lock(mutex);
    return changes;
  }
};

} // namespace

void register_watch_tests(std::vector<teamlens::tests::TestCase> &tests) {
  using teamlens::tests::require;
  namespace w = teamlens::watch;

  tests.push_back({"watch_classifier_recognizes_layout", [] {
                     const w::PathClassifier classifier("/home/u/.claude/teams/",
                                                        "/home/u/.claude/tasks");
                     const auto config = classifier.classify("/home/u/.claude/teams/alpha/config.json");
                     require(config.kind == w::ChangeKind::TeamConfig && config.team == "alpha",
                             "config path");

                     const auto inbox =
                         classifier.classify("/home/u/.claude/teams/alpha/inboxes/researcher.json",
                                             w::NotificationKind::Added);
                     require(inbox.kind == w::ChangeKind::Inbox && inbox.agent == "researcher",
                             "inbox path");
                     require(inbox.notification == w::NotificationKind::Added, "notification kept");

                     const auto task = classifier.classify("/home/u/.claude/tasks/alpha/12.json");
                     require(task.kind == w::ChangeKind::Task && task.task_id == "12" &&
                                 task.team == "alpha",
                             "task path");
                   }});

  tests.push_back({"watch_classifier_ignores_everything_else", [] {
                     const w::PathClassifier classifier("/t/teams", "/t/tasks");
                     for (const std::string path :
                          {"/t/teams/alpha/config.json.tmp", "/t/teams/alpha/notes.json",
                           "/t/teams/config.json", "/t/teams/alpha/inboxes/deep/x.json",
                           "/t/tasks/alpha/.lock", "/t/tasks/alpha/sub/1.json", "/t/tasks/1.json",
                           "/elsewhere/alpha/config.json", "/t/teamsextra/alpha/config.json",
                           "/t/teams/../teams/alpha/config.json", "/t/tasks/alpha/.json", ""}) {
                       require(classifier.classify(path).kind == w::ChangeKind::Ignored,
                               "should ignore " + path);
                     }
                   }});

  tests.push_back({"watch_debouncer_coalesces_bursts", [] {
                     std::mutex mutex;
                     std::vector<std::pair<std::string, w::NotificationKind>> fired;
                     w::ChangeDebouncer debouncer(
                         std::chrono::milliseconds(50),
                         [&](const std::string &path, const w::NotificationKind kind) {
                           std::lock_guard<std::mutex> lock(mutex);
                           fired.emplace_back(path, kind);
                         });
                     debouncer.start();
                     debouncer.notify("/a.json", w::NotificationKind::Added);
                     for (int i = 0; i < 5; ++i) {
                       debouncer.notify("/a.json", w::NotificationKind::Modified);
                       std::this_thread::sleep_for(std::chrono::milliseconds(5));
                     }
                     debouncer.notify("/b.json", w::NotificationKind::Removed);
                     require(teamlens::testing::wait_until([&] {
                               std::lock_guard<std::mutex> lock(mutex);
                               return fired.size() >= 2;
                             }),
                             "both paths should fire");
                     std::this_thread::sleep_for(std::chrono::milliseconds(120));
                     debouncer.stop();

                     std::lock_guard<std::mutex> lock(mutex);
                     require(fired.size() == 2, "one callback per path");
                     for (const auto &[path, kind] : fired) {
                       if (path == "/a.json") {
                         require(kind == w::NotificationKind::Added, "add then modify stays add");
                       } else {
                         require(kind == w::NotificationKind::Removed, "removal kept");
                       }
                     }
                   }});

  tests.push_back({"watch_debouncer_stop_discards_pending", [] {
                     std::atomic<int> fired{0};
                     w::ChangeDebouncer debouncer(std::chrono::milliseconds(200),
                                                  [&](const std::string &, w::NotificationKind) {
                                                    ++fired;
                                                  });
                     debouncer.start();
                     debouncer.notify("/a.json", w::NotificationKind::Modified);
                     require(debouncer.pending() == 1, "pending entry");
                     debouncer.stop();
                     std::this_thread::sleep_for(std::chrono::milliseconds(250));
                     require(fired.load() == 0, "no callback after stop");
                   }});

  tests.push_back({"watch_watcher_rejects_missing_root", [] {
                     teamlens::testing::TempWorkspace workspace;
                     std::filesystem::create_directories(workspace.teams_dir());
                     w::FileWatcher watcher({.teams_root = workspace.teams_dir(),
                                             .tasks_root = workspace.path() / "nope"},
                                            [](const w::ClassifiedChange &) {});
                     const auto status = watcher.start();
                     require(!status.ok(), "missing tasks root should fail");
                     require(!watcher.is_running(), "watcher not running");
                   }});

  tests.push_back({"watch_watcher_scan_orders_configs_first", [] {
                     teamlens::testing::TempWorkspace workspace;
                     namespace th = teamlens::testing;
                     th::write_file(th::task_file(workspace, "alpha", "1"),
                                    th::task_json("1", "one", "pending"));
                     th::write_file(th::inbox_file(workspace, "alpha", "lead"), "[]");
                     th::write_file(th::config_file(workspace, "alpha"),
                                    th::team_config_json("alpha", 1));
                     th::write_file(workspace.teams_dir() / "alpha" / "scratch.txt", "x");

                     Recorded recorded;
                     w::FileWatcher watcher({.teams_root = workspace.teams_dir(),
                                             .tasks_root = workspace.tasks_dir(),
                                             .debounce = std::chrono::milliseconds(20)},
                                            [&](const w::ClassifiedChange &c) { recorded.add(c); });
                     const auto status = watcher.start();
                     require(status.ok(), status.error());
                     const auto baseline = recorded.copy();
                     watcher.stop();

                     require(baseline.size() == 3, "three recognized files");
                     require(baseline[0].kind == w::ChangeKind::TeamConfig, "config first");
                   }});

  tests.push_back({"watch_watcher_reports_live_changes_and_new_dirs", [] {
                     teamlens::testing::TempWorkspace workspace;
                     namespace th = teamlens::testing;
                     std::filesystem::create_directories(workspace.teams_dir());
                     std::filesystem::create_directories(workspace.tasks_dir());

                     Recorded recorded;
                     w::FileWatcher watcher({.teams_root = workspace.teams_dir(),
                                             .tasks_root = workspace.tasks_dir(),
                                             .debounce = std::chrono::milliseconds(20)},
                                            [&](const w::ClassifiedChange &c) { recorded.add(c); });
                     const auto status = watcher.start();
                     require(status.ok(), status.error());

                     // Directories created after start must be watched too.
                     const auto config = th::config_file(workspace, "beta");
                     th::write_file(config, th::team_config_json("beta", 2));
                     require(th::wait_until([&] { return recorded.count_for(config.string()) > 0; }),
                             "config in new directory reported");

                     const auto task = th::task_file(workspace, "beta", "4");
                     th::write_file(task, th::task_json("4", "four", "pending"));
                     require(th::wait_until([&] { return recorded.count_for(task.string()) > 0; }),
                             "task reported");

                     std::filesystem::remove(task);
                     require(th::wait_until([&] {
                               for (const auto &c : recorded.copy()) {
                                 if (c.path == task.string() &&
                                     c.notification == w::NotificationKind::Removed) {
                                   return true;
                                 }
                               }
                               return false;
                             }),
                             "removal reported");
                     require(watcher.watch_count() >= 4, "nested directories watched");
                     watcher.stop();
                     require(!watcher.is_running(), "stopped");
                   }});
}
