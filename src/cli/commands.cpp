#include "teamlens/cli/commands.hpp"

#include "teamlens/common/fs.hpp"
#include "teamlens/config/config.hpp"
#include "teamlens/health/health.hpp"
#include "teamlens/observability/factory.hpp"
#include "teamlens/observability/global.hpp"
#include "teamlens/runtime/pipeline.hpp"
#include "teamlens/sessions/session.hpp"
#include "teamlens/sessions/store.hpp"

#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <pthread.h>
#include <string>
#include <utility>
#include <vector>

namespace teamlens::cli {

namespace {

std::string version_string() {
#ifdef TEAMLENS_VERSION
  return std::string("teamlens ") + TEAMLENS_VERSION;
#else
  return "teamlens 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

bool parse_u64(const std::string &text, std::uint64_t &out) {
  if (text.empty()) {
    return false;
  }
  std::uint64_t value = 0;
  for (const char ch : text) {
    if (ch < '0' || ch > '9') {
      return false;
    }
    const auto digit = static_cast<std::uint64_t>(ch - '0');
    if (value > (UINT64_MAX - digit) / 10) {
      return false;
    }
    value = value * 10 + digit;
  }
  out = value;
  return true;
}

common::Result<config::Config> load_validated_config() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  auto validation = config::validate_config(cfg.value());
  if (!validation.ok()) {
    return common::Result<config::Config>::failure("invalid config: " + validation.error());
  }
  for (const auto &warning : validation.value()) {
    std::cerr << "[config] warning " << warning << "\n";
  }
  return cfg;
}

int open_store(const config::Config &cfg, sessions::SessionStore &store) {
  if (!std::filesystem::exists(cfg.store.db_path)) {
    std::cerr << "no session database at " << cfg.store.db_path << "\n";
    return 1;
  }
  const auto status = store.open();
  if (!status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }
  return 0;
}

int run_serve(std::vector<std::string> args) {
  auto cfg = load_validated_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  auto config = cfg.value();

  std::string value;
  if (take_option(args, "--port", "-p", value)) {
    std::uint64_t port = 0;
    if (!parse_u64(value, port) || port == 0 || port > 65535) {
      std::cerr << "invalid --port: " << value << "\n";
      return 1;
    }
    config.broadcast.port = static_cast<std::uint16_t>(port);
  }
  if (take_option(args, "--host", "", value)) {
    config.broadcast.host = value;
  }
  if (!args.empty()) {
    std::cerr << "unexpected argument: " << args.front() << "\n";
    return 1;
  }

  observability::set_global_observer(observability::create_observer(config));

  // Block the shutdown signals before any worker thread exists so that only
  // sigwait below receives them.
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
    std::cerr << "failed to block shutdown signals\n";
    return 1;
  }

  runtime::Pipeline pipeline(config);
  const auto status = pipeline.start();
  if (!status.ok()) {
    std::cerr << "failed to start: " << status.error() << "\n";
    return 1;
  }

  std::cout << version_string() << " observing " << config.watch.teams_dir << "\n";
  std::cout << "observers: " << (config.broadcast.tls_enabled ? "wss" : "ws") << "://"
            << config.broadcast.host << ":" << pipeline.port() << "\n";
  std::cout << "sessions: " << config.store.db_path << "\n";

  int received = 0;
  if (sigwait(&signals, &received) != 0) {
    std::cerr << "[serve] sigwait failed\n";
  } else {
    std::cerr << "[serve] signal=" << received << " shutting down\n";
  }
  pipeline.stop();
  return 0;
}

int run_history(const std::vector<std::string> &args) {
  if (!args.empty()) {
    std::cerr << "usage: teamlens history\n";
    return 1;
  }
  auto cfg = load_validated_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  sessions::SessionStore store(cfg.value().store.db_path, cfg.value().store.busy_timeout_ms);
  if (open_store(cfg.value(), store) != 0) {
    return 1;
  }
  auto listed = store.list_sessions();
  if (!listed.ok()) {
    std::cerr << listed.error() << "\n";
    return 1;
  }
  std::cout << sessions::encode_history_json(listed.value()) << "\n";
  return 0;
}

int run_session(const std::vector<std::string> &args) {
  if (args.size() != 1) {
    std::cerr << "usage: teamlens session <id|team>\n";
    return 1;
  }
  auto cfg = load_validated_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  sessions::SessionStore store(cfg.value().store.db_path, cfg.value().store.busy_timeout_ms);
  if (open_store(cfg.value(), store) != 0) {
    return 1;
  }

  std::int64_t session_id = 0;
  std::uint64_t numeric = 0;
  if (parse_u64(args[0], numeric) && numeric <= static_cast<std::uint64_t>(INT64_MAX)) {
    session_id = static_cast<std::int64_t>(numeric);
  } else {
    auto latest = store.find_latest_session(args[0]);
    if (!latest.ok()) {
      std::cerr << latest.error() << "\n";
      return 1;
    }
    if (!latest.value().has_value()) {
      std::cerr << "no sessions recorded for team " << args[0] << "\n";
      return 1;
    }
    session_id = latest.value()->id;
  }

  auto detail = store.get_session(session_id);
  if (!detail.ok()) {
    std::cerr << detail.error() << "\n";
    return 1;
  }
  std::cout << sessions::encode_session_detail_json(detail.value()) << "\n";
  return 0;
}

int run_status() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  const auto &config = cfg.value();
  const auto cp = config::config_path();
  if (cp.ok()) {
    std::cout << "Config: " << cp.value().string()
              << (std::filesystem::exists(cp.value()) ? "" : " (defaults)") << "\n";
  }
  std::cout << config::describe_config(config) << "\n";

  auto validation = config::validate_config(config);
  if (!validation.ok()) {
    health::mark_component_error("config", validation.error());
  } else {
    for (const auto &warning : validation.value()) {
      std::cout << "Warning: " << warning << "\n";
    }
    health::mark_component_ok("config");
  }

  for (const auto &[name, root] : {std::pair<std::string, std::string>{"teams_dir", config.watch.teams_dir},
                                   std::pair<std::string, std::string>{"tasks_dir", config.watch.tasks_dir}}) {
    if (std::filesystem::is_directory(root)) {
      health::mark_component_ok(name, root);
    } else {
      health::mark_component_error(name, "not a directory: " + root);
    }
  }

  if (std::filesystem::exists(config.store.db_path)) {
    sessions::SessionStore store(config.store.db_path, config.store.busy_timeout_ms);
    const auto opened = store.open();
    if (!opened.ok()) {
      health::mark_component_error("store", opened.error());
    } else {
      auto count = store.count_rows("sessions");
      if (count.ok()) {
        std::cout << "Sessions recorded: " << count.value() << "\n";
        health::mark_component_ok("store", "sessions=" + std::to_string(count.value()));
      } else {
        health::mark_component_error("store", count.error());
      }
    }
  } else {
    std::cout << "Sessions recorded: 0 (no database yet)\n";
  }

  std::cout << health::snapshot_json() << "\n";
  return health::snapshot().all_ok() ? 0 : 1;
}

} // namespace

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "USAGE\n";
  std::cout << "  teamlens [--config PATH] <command> [options]\n\n";
  std::cout << "COMMANDS\n";
  std::cout << "  serve [--host H] [--port N]   Watch team files and stream to observers (default)\n";
  std::cout << "  history                       Print recorded sessions as JSON\n";
  std::cout << "  session <id|team>             Print one session (latest for a team) as JSON\n";
  std::cout << "  status                        Show resolved configuration and health\n";
  std::cout << "  version                       Show version\n";
  std::cout << "  help                          Show this help\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    return run_serve({});
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "serve") {
    return run_serve(std::move(args));
  }
  if (subcommand == "history") {
    return run_history(args);
  }
  if (subcommand == "session") {
    return run_session(args);
  }
  if (subcommand == "status") {
    return run_status();
  }
  if (common::starts_with(subcommand, "-")) {
    // Options without a command apply to serve.
    args.insert(args.begin(), subcommand);
    return run_serve(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace teamlens::cli
