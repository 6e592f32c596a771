#include "test_framework.hpp"

#include "teamlens/cli/commands.hpp"
#include "teamlens/common/json_util.hpp"
#include "teamlens/config/config.hpp"
#include "teamlens/model/team.hpp"
#include "teamlens/runtime/pipeline.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace {

using namespace std::chrono_literals;

std::size_t rows(teamlens::runtime::Pipeline &pipeline, const std::string &table) {
  const auto count = pipeline.store().count_rows(table);
  return count.ok() ? count.value() : 0;
}

std::string task_status(teamlens::runtime::Pipeline &pipeline, const std::string &team,
                        const std::string &id) {
  const auto current = pipeline.aggregator().team(team);
  if (current == nullptr) {
    return "";
  }
  const auto it = current->tasks.find(id);
  return it == current->tasks.end() ? "" : teamlens::model::task_status_to_string(it->second.status);
}

int run(std::vector<std::string> args) {
  args.insert(args.begin(), "teamlens");
  std::vector<char *> argv;
  argv.reserve(args.size());
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  return teamlens::cli::run_cli(static_cast<int>(argv.size()), argv.data());
}

} // namespace

void register_pipeline_integration_tests(std::vector<teamlens::tests::TestCase> &tests) {
  using teamlens::tests::require;
  namespace th = teamlens::testing;
  namespace rt = teamlens::runtime;

  tests.push_back({"integration_task_progress_lands_in_one_session", [] {
                     th::TempWorkspace workspace;
                     const auto config = th::temp_config(workspace);
                     th::write_file(th::config_file(workspace, "T"), th::team_config_json("T", 1000));

                     rt::Pipeline pipeline(config);
                     const auto status = pipeline.start();
                     require(status.ok(), status.error());
                     require(th::wait_until([&] { return rows(pipeline, "sessions") == 1; }),
                             "session recorded from initial scan");

                     const auto task = th::task_file(workspace, "T", "1");
                     th::write_file(task, th::task_json("1", "one", "pending"));
                     require(th::wait_until([&] { return task_status(pipeline, "T", "1") == "pending"; }),
                             "pending observed");
                     th::write_file(task, th::task_json("1", "one", "in_progress"));
                     require(th::wait_until([&] {
                               return task_status(pipeline, "T", "1") == "in_progress";
                             }),
                             "in_progress observed");
                     require(pipeline.wait_idle(5s), "pipeline idle");

                     const auto latest = pipeline.store().find_latest_session("T");
                     require(latest.ok() && latest.value().has_value(), "session exists");
                     const auto detail = pipeline.store().get_session(latest.value()->id);
                     require(detail.ok(), detail.error());
                     require(detail.value().summary.created_at == 1000, "createdAt recorded");
                     require(detail.value().tasks.size() == 1, "one task");
                     require(detail.value().tasks[0].status == teamlens::model::TaskStatus::InProgress,
                             "task in progress");
                     require(rows(pipeline, "sessions") == 1, "exactly one session");
                     pipeline.stop();
                   }});

  tests.push_back({"integration_observer_sees_snapshot_and_updates", [] {
                     th::TempWorkspace workspace;
                     const auto config = th::temp_config(workspace);
                     th::write_file(th::config_file(workspace, "alpha"),
                                    th::team_config_json("alpha", 5, {{"team-lead", "lead"}, {"worker"}}));

                     rt::Pipeline pipeline(config);
                     const auto status = pipeline.start();
                     require(status.ok(), status.error());

                     th::WsTestClient client;
                     require(client.connect(pipeline.port()), "observer connects");
                     const auto snapshot = client.read_until_type("snapshot", 5s);
                     require(snapshot.has_value(), "snapshot received");
                     require(snapshot->find(R"("activeTeam":"alpha")") != std::string::npos,
                             "team from initial scan is active");
                     require(teamlens::common::json_is_valid(*snapshot), "snapshot is valid json");

                     th::write_file(th::inbox_file(workspace, "alpha", "worker"),
                                    "[" + th::inbox_message_json("team-lead", "start task 1",
                                                                 "2025-01-01T00:00:00.000Z") +
                                        "]");
                     const auto update = client.read_until_type("team_update", 5s);
                     require(update.has_value(), "inbox update pushed");
                     require(update->find("start task 1") != std::string::npos, "message carried");

                     require(th::wait_until([&] { return rows(pipeline, "messages") == 1; }),
                             "message persisted");
                     pipeline.stop();
                   }});

  tests.push_back({"integration_restart_is_idempotent_and_new_run_ends_old", [] {
                     th::TempWorkspace workspace;
                     const auto config = th::temp_config(workspace);
                     th::write_file(th::config_file(workspace, "alpha"), th::team_config_json("alpha", 1));
                     th::write_file(th::inbox_file(workspace, "alpha", "worker"),
                                    "[" + th::inbox_message_json("team-lead", "hi", "t1") + "]");
                     th::write_file(th::task_file(workspace, "alpha", "1"),
                                    th::task_json("1", "one", "completed"));

                     for (int run_index = 0; run_index < 2; ++run_index) {
                       rt::Pipeline pipeline(config);
                       const auto status = pipeline.start();
                       require(status.ok(), status.error());
                       require(pipeline.wait_idle(5s), "idle after scan");
                       require(rows(pipeline, "sessions") == 1, "one session across restarts");
                       require(rows(pipeline, "messages") == 1, "messages not duplicated");
                       require(rows(pipeline, "tasks") == 1, "tasks not duplicated");
                       pipeline.stop();
                     }

                     rt::Pipeline pipeline(config);
                     require(pipeline.start().ok(), "third start");
                     th::write_file(th::config_file(workspace, "alpha"), th::team_config_json("alpha", 2));
                     require(th::wait_until([&] { return rows(pipeline, "sessions") == 2; }),
                             "new createdAt starts a session");
                     require(pipeline.wait_idle(5s), "idle");
                     const auto listed = pipeline.store().list_sessions();
                     require(listed.ok() && listed.value().size() == 2, "two sessions");
                     require(listed.value()[0].created_at == 2 && !listed.value()[0].ended_at.has_value(),
                             "new session open");
                     require(listed.value()[1].ended_at.has_value(), "old session ended");
                     pipeline.stop();
                   }});

  tests.push_back({"integration_new_run_does_not_inherit_previous_run", [] {
                     th::TempWorkspace workspace;
                     const auto config = th::temp_config(workspace);
                     const auto config_path = th::config_file(workspace, "T");
                     const auto task = th::task_file(workspace, "T", "1");
                     const auto inbox = th::inbox_file(workspace, "T", "worker");

                     rt::Pipeline pipeline(config);
                     const auto status = pipeline.start();
                     require(status.ok(), status.error());

                     th::write_file(config_path, th::team_config_json("T", 1000));
                     require(th::wait_until([&] { return rows(pipeline, "sessions") == 1; }),
                             "first run recorded");
                     th::write_file(task, th::task_json("1", "old run task", "pending"));
                     th::write_file(inbox, "[" + th::inbox_message_json("team-lead", "old run", "t1") + "]");
                     require(th::wait_until([&] {
                               return rows(pipeline, "tasks") == 1 && rows(pipeline, "messages") == 1;
                             }),
                             "first run data recorded");

                     std::filesystem::remove(task);
                     std::filesystem::remove(inbox);
                     require(th::wait_until([&] {
                               const auto current = pipeline.aggregator().team("T");
                               return current != nullptr && current->tasks.empty() &&
                                      current->inboxes.empty();
                             }),
                             "removed files leave the live model");

                     th::write_file(config_path, th::team_config_json("T", 2000));
                     require(th::wait_until([&] { return rows(pipeline, "sessions") == 2; }),
                             "second run recorded");
                     require(pipeline.wait_idle(5s), "idle");

                     const auto second = pipeline.store().find_session("T", 2000);
                     require(second.ok() && second.value().has_value(), "second session exists");
                     const auto detail = pipeline.store().get_session(second.value()->id);
                     require(detail.ok(), detail.error());
                     require(detail.value().tasks.empty(), "no tasks carried into new run");
                     require(detail.value().messages.empty(), "no messages carried into new run");

                     const auto first = pipeline.store().find_session("T", 1000);
                     require(first.ok() && first.value().has_value(), "first session kept");
                     const auto history = pipeline.store().get_session(first.value()->id);
                     require(history.ok() && history.value().tasks.size() == 1 &&
                                 history.value().messages.size() == 1,
                             "first run history intact");
                     require(history.value().summary.ended_at.has_value(), "first run ended");
                     pipeline.stop();
                   }});

  tests.push_back({"integration_start_fails_on_missing_root", [] {
                     th::TempWorkspace workspace;
                     auto config = th::temp_config(workspace);
                     config.watch.tasks_dir = (workspace.path() / "absent").string();
                     rt::Pipeline pipeline(config);
                     const auto status = pipeline.start();
                     require(!status.ok(), "missing root must fail");
                     require(status.error().rfind("watcher:", 0) == 0, "error names the watcher");
                     require(!pipeline.is_running(), "not running");
                   }});

  tests.push_back({"integration_cli_reads_recorded_history", [] {
                     th::TempWorkspace workspace;
                     const auto config = th::temp_config(workspace);
                     th::write_file(th::config_file(workspace, "alpha"), th::team_config_json("alpha", 9));
                     {
                       rt::Pipeline pipeline(config);
                       require(pipeline.start().ok(), "start");
                       require(th::wait_until([&] { return rows(pipeline, "sessions") == 1; }),
                               "session recorded");
                       pipeline.stop();
                     }

                     workspace.create_file("config.toml",
                                           "[watch]\nteams_dir = \"" + config.watch.teams_dir +
                                               "\"\ntasks_dir = \"" + config.watch.tasks_dir +
                                               "\"\n[store]\ndb_path = \"" + config.store.db_path +
                                               "\"\n");
                     const std::string config_arg = "--config=" + (workspace.path() / "config.toml").string();
                     require(run({config_arg, "history"}) == 0, "history succeeds");
                     require(run({config_arg, "session", "alpha"}) == 0, "latest session by team");
                     require(run({config_arg, "session", "1"}) == 0, "session by id");
                     require(run({config_arg, "session", "404"}) == 1, "unknown session fails");
                     require(run({config_arg, "session", "nobody"}) == 1, "unknown team fails");
                     require(run({config_arg, "session"}) == 1, "missing argument fails");
                     require(run({"version"}) == 0, "version");
                     require(run({"frobnicate"}) == 1, "unknown command");
                     require(run({"--config"}) == 1, "missing config value");
                     teamlens::config::clear_config_path_override();
                   }});
}
