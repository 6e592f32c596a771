#include "test_framework.hpp"

#include "teamlens/common/fs.hpp"
#include "teamlens/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

struct ConfigOverrideGuard {
  explicit ConfigOverrideGuard(const std::filesystem::path &path) {
    teamlens::config::set_config_path_override(path);
  }
  ~ConfigOverrideGuard() { teamlens::config::clear_config_path_override(); }
};

} // namespace

void register_config_tests(std::vector<teamlens::tests::TestCase> &tests) {
  using teamlens::tests::require;
  namespace cfg = teamlens::config;

  tests.push_back({"config_defaults_are_valid", [] {
                     cfg::Config config;
                     require(config.watch.teams_dir == "~/.claude/teams", "teams default");
                     require(config.watch.tasks_dir == "~/.claude/tasks", "tasks default");
                     require(config.broadcast.port == 3847, "port default");
                     require(config.broadcast.heartbeat_secs == 5, "heartbeat default");
                     const auto validation = cfg::validate_config(config);
                     require(validation.ok(), validation.error());
                     require(validation.value().empty(), "defaults should not warn");
                   }});

  tests.push_back({"config_parse_reads_every_section", [] {
                     const auto parsed = cfg::parse_config(R"(
[watch]
teams_dir = "/data/teams"
tasks_dir = "/data/tasks"
debounce_ms = 50

[store]
db_path = "/data/s.db"

[broadcast]
host = "0.0.0.0"
port = 9000
heartbeat_secs = 2
max_clients = 8
max_queued_messages = 64

[observability]
backend = "none"
)");
                     require(parsed.ok(), parsed.error());
                     const auto &c = parsed.value();
                     require(c.watch.teams_dir == "/data/teams", "teams_dir");
                     require(c.watch.tasks_dir == "/data/tasks", "tasks_dir");
                     require(c.watch.debounce_ms == 50, "debounce");
                     require(c.store.db_path == "/data/s.db", "db_path");
                     require(c.broadcast.host == "0.0.0.0", "host");
                     require(c.broadcast.port == 9000, "port");
                     require(c.broadcast.heartbeat_secs == 2, "heartbeat");
                     require(c.broadcast.max_clients == 8, "max_clients");
                     require(c.broadcast.max_queued_messages == 64, "queue bound");
                     require(c.observability.backend == "none", "backend");

                     const auto validation = cfg::validate_config(c);
                     require(validation.ok(), validation.error());
                     require(validation.value().size() == 1, "non-loopback host should warn");
                   }});

  tests.push_back({"config_validation_rejects_bad_values", [] {
                     cfg::Config config;
                     config.watch.teams_dir = "  ";
                     require(!cfg::validate_config(config).ok(), "empty teams root");

                     config = cfg::Config{};
                     config.broadcast.port = 0;
                     require(!cfg::validate_config(config).ok(), "zero port");

                     config = cfg::Config{};
                     config.broadcast.heartbeat_secs = 0;
                     require(!cfg::validate_config(config).ok(), "zero heartbeat");

                     config = cfg::Config{};
                     config.watch.debounce_ms = 20000;
                     require(!cfg::validate_config(config).ok(), "debounce too long");

                     config = cfg::Config{};
                     config.broadcast.tls_enabled = true;
                     const auto tls = cfg::validate_config(config);
                     require(!tls.ok(), "tls without files");
                     require(tls.error().find("tls_cert_file") != std::string::npos,
                             "tls error should name the missing setting");
                   }});

  tests.push_back({"config_load_applies_env_and_expansion", [] {
                     teamlens::testing::TempWorkspace workspace;
                     workspace.create_file("config.toml",
                                           "[watch]\nteams_dir = \"$TEAMLENS_TEST_ROOT/teams\"\n"
                                           "[broadcast]\nport = 4100\n");
                     ConfigOverrideGuard override_guard(workspace.path() / "config.toml");
                     EnvGuard root("TEAMLENS_TEST_ROOT", workspace.path().string());
                     EnvGuard tasks("TEAMLENS_TASKS_DIR", std::string("/env/tasks"));
                     EnvGuard port("TEAMLENS_PORT", std::string("4200"));
                     EnvGuard teams("TEAMLENS_TEAMS_DIR", std::nullopt);
                     EnvGuard db("TEAMLENS_DB_PATH", std::nullopt);

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().watch.teams_dir ==
                                 (workspace.path() / "teams").string(),
                             "env var in path should expand");
                     require(loaded.value().watch.tasks_dir == "/env/tasks", "env override");
                     require(loaded.value().broadcast.port == 4200, "env port wins");
                   }});

  tests.push_back({"config_missing_file_yields_defaults", [] {
                     teamlens::testing::TempWorkspace workspace;
                     ConfigOverrideGuard override_guard(workspace.path() / "absent.toml");
                     EnvGuard port("TEAMLENS_PORT", std::nullopt);
                     EnvGuard db("TEAMLENS_DB_PATH", std::nullopt);
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().broadcast.port == 3847, "default port");
                     require(!teamlens::common::starts_with(loaded.value().store.db_path, "~"),
                             "tilde should be expanded");
                   }});

  tests.push_back({"config_invalid_toml_reports_path", [] {
                     teamlens::testing::TempWorkspace workspace;
                     workspace.create_file("bad.toml", "[watch]\nthis line is broken\n");
                     ConfigOverrideGuard override_guard(workspace.path() / "bad.toml");
                     const auto loaded = cfg::load_config();
                     require(!loaded.ok(), "broken toml should fail");
                     require(loaded.error().find("bad.toml") != std::string::npos,
                             "error should carry the file path");
                   }});

  tests.push_back({"config_parse_reports_mistyped_values", [] {
                     const auto port = cfg::parse_config("[broadcast]\nport = 70000\n");
                     require(!port.ok(), "port beyond 16 bits rejected");
                     require(port.error().find("broadcast.port") != std::string::npos,
                             "error names the key");

                     const auto text_port = cfg::parse_config("[broadcast]\nport = \"4000\"\n");
                     require(!text_port.ok(), "quoted port rejected");

                     const auto flag = cfg::parse_config("[broadcast]\ntls_enabled = 1\n");
                     require(!flag.ok(), "numeric bool rejected");

                     const auto unknown = cfg::parse_config("[watch]\nteams_dri = \"/x\"\n");
                     require(unknown.ok(), "unknown keys only warn");
                     require(unknown.value().watch.teams_dir == "~/.claude/teams",
                             "unknown key ignored");
                   }});

  tests.push_back({"config_describe_is_json", [] {
                     cfg::Config config;
                     const auto text = cfg::describe_config(config);
                     require(text.find("\"port\":3847") != std::string::npos, "port rendered");
                     require(text.front() == '{' && text.back() == '}', "object rendered");
                   }});
}
