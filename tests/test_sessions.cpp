#include "test_framework.hpp"

#include "teamlens/model/team.hpp"
#include "teamlens/sessions/recorder.hpp"
#include "teamlens/sessions/session.hpp"
#include "teamlens/sessions/store.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace {

teamlens::model::TeamConfig make_config(const std::string &name, const std::int64_t created_at) {
  teamlens::model::TeamConfig config;
  config.name = name;
  config.description = "team " + name;
  config.created_at = created_at;
  config.lead_agent_id = "team-lead@" + name;
  config.members = {
      teamlens::model::Member{.agent_id = "team-lead@" + name, .name = "team-lead",
                              .agent_type = "lead", .joined_at = created_at},
      teamlens::model::Member{.agent_id = "worker@" + name, .name = "worker",
                              .agent_type = "general-purpose", .joined_at = created_at + 1}};
  return config;
}

teamlens::model::InboxMessage make_message(const std::string &from, const std::string &text,
                                           const std::string &timestamp) {
  return teamlens::model::InboxMessage{.from = from, .text = text, .timestamp = timestamp};
}

std::shared_ptr<const teamlens::model::Team> make_team(const teamlens::model::TeamConfig &config) {
  teamlens::model::Team team;
  team.name = config.name;
  team.config = config;
  return std::make_shared<const teamlens::model::Team>(std::move(team));
}

} // namespace

void register_sessions_tests(std::vector<teamlens::tests::TestCase> &tests) {
  using teamlens::tests::require;
  namespace s = teamlens::sessions;
  namespace m = teamlens::model;
  namespace st = teamlens::state;
  namespace th = teamlens::testing;

  tests.push_back({"sessions_store_ensure_is_idempotent", [] {
                     th::TempWorkspace workspace;
                     s::SessionStore store(workspace.db_path());
                     auto opened = store.open();
                     require(opened.ok(), opened.error());

                     const auto first = store.ensure_session(make_config("alpha", 1000));
                     require(first.ok(), first.error());
                     require(first.value().created, "first call creates");
                     const auto second = store.ensure_session(make_config("alpha", 1000));
                     require(second.ok(), second.error());
                     require(!second.value().created, "second call reuses");
                     require(second.value().id == first.value().id, "same id");

                     const auto other = store.ensure_session(make_config("alpha", 2000));
                     require(other.ok() && other.value().id != first.value().id,
                             "new createdAt is a new session");
                     require(store.count_rows("sessions").value() == 2, "two sessions");
                   }});

  tests.push_back({"sessions_store_concurrent_ensure_single_row", [] {
                     th::TempWorkspace workspace;
                     constexpr int kWriters = 6;
                     std::vector<std::unique_ptr<s::SessionStore>> stores;
                     for (int i = 0; i < kWriters; ++i) {
                       stores.push_back(std::make_unique<s::SessionStore>(workspace.db_path()));
                       auto opened = stores.back()->open();
                       require(opened.ok(), opened.error());
                     }

                     std::vector<std::int64_t> ids(kWriters, -1);
                     std::atomic<int> created{0};
                     std::atomic<int> failures{0};
                     std::vector<std::thread> threads;
                     for (int i = 0; i < kWriters; ++i) {
                       threads.emplace_back([&, i] {
                         const auto result = stores[i]->ensure_session(make_config("race", 42));
                         if (!result.ok()) {
                           ++failures;
                           return;
                         }
                         ids[i] = result.value().id;
                         if (result.value().created) {
                           ++created;
                         }
                       });
                     }
                     for (auto &thread : threads) {
                       thread.join();
                     }
                     require(failures.load() == 0, "no writer should fail");
                     require(created.load() == 1, "exactly one writer creates");
                     require(std::all_of(ids.begin(), ids.end(),
                                         [&](const std::int64_t id) { return id == ids[0]; }),
                             "every writer sees the same id");
                     require(stores[0]->count_rows("sessions").value() == 1, "one row");
                   }});

  tests.push_back({"sessions_store_messages_are_unique", [] {
                     th::TempWorkspace workspace;
                     s::SessionStore store(workspace.db_path());
                     require(store.open().ok(), "open");
                     const auto id = store.ensure_session(make_config("alpha", 1)).value().id;

                     const std::vector<m::InboxMessage> inbox = {
                         make_message("team-lead", "first", "2025-01-01T00:00:00Z"),
                         make_message("team-lead", "second", "2025-01-01T00:00:01Z")};
                     const auto written = store.record_messages(id, "worker", inbox);
                     require(written.ok() && written.value() == 2, "two new rows");
                     const auto again = store.record_messages(id, "worker", inbox);
                     require(again.ok() && again.value() == 0, "replay writes nothing");
                     const auto other_recipient = store.record_message(id, "tester", inbox[0]);
                     require(other_recipient.ok() && other_recipient.value(),
                             "same message to another recipient is distinct");
                     require(store.count_rows("messages").value() == 3, "three rows");
                   }});

  tests.push_back({"sessions_store_task_upsert_replaces", [] {
                     th::TempWorkspace workspace;
                     s::SessionStore store(workspace.db_path());
                     require(store.open().ok(), "open");
                     const auto id = store.ensure_session(make_config("alpha", 1)).value().id;

                     m::Task task{.id = "7", .subject = "ship", .status = m::TaskStatus::Pending};
                     require(store.record_task(id, task).ok(), "insert");
                     task.status = m::TaskStatus::Completed;
                     task.owner = "worker";
                     task.blocks = {"8"};
                     require(store.record_task(id, task).ok(), "update");
                     require(store.count_rows("tasks").value() == 1, "one row per task id");

                     const auto detail = store.get_session(id);
                     require(detail.ok(), detail.error());
                     require(detail.value().tasks.size() == 1, "task listed");
                     require(detail.value().tasks[0].status == m::TaskStatus::Completed,
                             "latest status");
                     require(detail.value().tasks[0].blocks == std::vector<std::string>{"8"},
                             "blocks stored");
                   }});

  tests.push_back({"sessions_store_detail_and_history", [] {
                     th::TempWorkspace workspace;
                     s::SessionStore store(workspace.db_path());
                     require(store.open().ok(), "open");
                     const auto config = make_config("alpha", 100);
                     const auto id = store.ensure_session(config).value().id;
                     require(store.record_members(id, config.members).ok(), "members");
                     require(store.record_members(id, config.members).ok(), "members replay");
                     (void)store.record_message(id, "worker",
                                                make_message("team-lead", "go", "2025-01-01T00:00:00Z"));
                     m::TaskMap tasks;
                     tasks["2"] = m::Task{.id = "2", .subject = "b"};
                     tasks["10"] = m::Task{.id = "10", .subject = "c"};
                     tasks["3"] = m::Task{.id = "3", .internal = true};
                     require(store.record_tasks(id, tasks).ok(), "tasks");

                     const auto detail = store.get_session(id);
                     require(detail.ok(), detail.error());
                     const auto &d = detail.value();
                     require(d.summary.team_name == "alpha", "team name");
                     require(d.lead_agent_id == "team-lead@alpha", "lead");
                     require(d.members.size() == 2, "members not duplicated");
                     require(d.members[0].name == "team-lead", "member order kept");
                     require(d.messages.size() == 1 && d.messages[0].recipient == "worker",
                             "message with recipient");
                     require(d.tasks.size() == 2 && d.tasks[0].id == "2" && d.tasks[1].id == "10",
                             "visible tasks in id order");

                     const auto json = s::encode_session_detail_json(d);
                     require(json.find("\"config\":{\"name\":\"alpha\"") != std::string::npos,
                             "config embedded");
                     require(json.find("\"recipient\":\"worker\"") != std::string::npos,
                             "recipient rendered");

                     (void)store.ensure_session(make_config("beta", 50));
                     const auto listed = store.list_sessions();
                     require(listed.ok() && listed.value().size() == 2, "two sessions listed");
                     require(listed.value()[0].team_name == "alpha", "newest createdAt first");
                     const auto history = s::encode_history_json(listed.value());
                     require(history.rfind("{\"sessions\":[{\"id\":", 0) == 0, "history shape");
                     require(history.find("\"endedAt\":null") != std::string::npos, "open session");

                     const auto missing = store.get_session(999);
                     require(!missing.ok(), "unknown id fails");
                     require(missing.error() == "session not found: 999", "not found message");
                     require(!store.count_rows("sqlite_master").ok(), "table whitelist");
                   }});

  tests.push_back({"sessions_store_ends_superseded_sessions", [] {
                     th::TempWorkspace workspace;
                     s::SessionStore store(workspace.db_path());
                     require(store.open().ok(), "open");
                     const auto old_id = store.ensure_session(make_config("alpha", 1)).value().id;
                     const auto other_team = store.ensure_session(make_config("beta", 1)).value().id;
                     (void)store.ensure_session(make_config("alpha", 2));

                     const auto ended = store.end_superseded_sessions("alpha", 2);
                     require(ended.ok(), ended.error());
                     require(ended.value() == std::vector<std::int64_t>{old_id}, "old session ended");
                     const auto again = store.end_superseded_sessions("alpha", 2);
                     require(again.ok() && again.value().empty(), "ending is idempotent");

                     const auto end_beta = store.end_session(other_team);
                     require(end_beta.ok() && end_beta.value(), "explicit end");
                     require(!store.end_session(other_team).value(), "second end is a no-op");

                     const auto latest = store.find_latest_session("alpha");
                     require(latest.ok() && latest.value().has_value(), "latest found");
                     require(latest.value()->created_at == 2, "latest createdAt");
                     require(!latest.value()->ended_at.has_value(), "latest still open");
                   }});

  tests.push_back({"sessions_store_requires_open", [] {
                     th::TempWorkspace workspace;
                     s::SessionStore store(workspace.db_path());
                     require(!store.is_open(), "closed initially");
                     const auto listed = store.list_sessions();
                     require(!listed.ok(), "closed store fails");
                   }});

  tests.push_back({"sessions_recorder_backfills_and_skips_without_session", [] {
                     th::TempWorkspace workspace;
                     s::SessionStore store(workspace.db_path());
                     require(store.open().ok(), "open");
                     s::SessionRecorder recorder(store);

                     // Inbox seen before any config has nowhere to go.
                     m::Team early;
                     early.name = "alpha";
                     early.inboxes["worker"] = {make_message("team-lead", "hi", "t1")};
                     const auto early_team = std::make_shared<const m::Team>(early);
                     auto status = recorder.record(st::TeamChange{.team_name = "alpha",
                                                                  .kind = st::TeamChangeKind::Inbox,
                                                                  .team = early_team,
                                                                  .agent = "worker"});
                     require(status.ok(), status.error());
                     require(store.count_rows("sessions").value() == 0, "no session invented");

                     m::Team with_config = early;
                     with_config.config = make_config("alpha", 500);
                     with_config.tasks["1"] = m::Task{.id = "1", .subject = "one"};
                     status = recorder.record(st::TeamChange{
                         .team_name = "alpha",
                         .kind = st::TeamChangeKind::Config,
                         .team = std::make_shared<const m::Team>(with_config)});
                     require(status.ok(), status.error());
                     require(recorder.current_session("alpha").has_value(), "session cached");
                     require(store.count_rows("messages").value() == 1, "inbox backfilled");
                     require(store.count_rows("tasks").value() == 1, "tasks backfilled");
                     require(store.count_rows("members").value() == 2, "members recorded");
                   }});

  tests.push_back({"sessions_recorder_config_lifecycle", [] {
                     th::TempWorkspace workspace;
                     s::SessionStore store(workspace.db_path());
                     require(store.open().ok(), "open");
                     s::SessionRecorder recorder(store);
                     recorder.start();

                     const auto first = make_team(make_config("alpha", 1));
                     recorder.on_change(st::TeamChange{.team_name = "alpha",
                                                       .kind = st::TeamChangeKind::Config,
                                                       .team = first});
                     const auto second = make_team(make_config("alpha", 2));
                     recorder.on_change(st::TeamChange{.team_name = "alpha",
                                                       .kind = st::TeamChangeKind::Config,
                                                       .team = second});
                     require(recorder.wait_idle(std::chrono::seconds(5)), "recorder idle");

                     auto listed = store.list_sessions();
                     require(listed.ok() && listed.value().size() == 2, "two sessions");
                     require(!listed.value()[0].ended_at.has_value(), "new session open");
                     require(listed.value()[1].ended_at.has_value(), "old session ended");

                     recorder.on_change(st::TeamChange{.team_name = "alpha",
                                                       .kind = st::TeamChangeKind::ConfigRemoved,
                                                       .team = second});
                     recorder.stop();
                     listed = store.list_sessions();
                     require(listed.value()[0].ended_at.has_value(), "removed config ends session");
                     require(!recorder.current_session("alpha").has_value(), "cache cleared");
                   }});
}
