#include "teamlens/config/config.hpp"

#include "teamlens/common/fs.hpp"
#include "teamlens/common/json_util.hpp"
#include "teamlens/common/toml.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

namespace teamlens::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".teamlens";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

constexpr const char *KNOWN_KEYS[] = {
    "watch.teams_dir",         "watch.tasks_dir",
    "watch.debounce_ms",       "store.db_path",
    "store.busy_timeout_ms",   "broadcast.host",
    "broadcast.port",          "broadcast.heartbeat_secs",
    "broadcast.max_clients",   "broadcast.max_queued_messages",
    "broadcast.tls_enabled",   "broadcast.tls_cert_file",
    "broadcast.tls_key_file",  "observability.backend",
};

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("TEAMLENS_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

const char *non_empty_env(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

bool is_valid_host(const std::string &host) {
  const std::string trimmed = common::trim(host);
  if (trimmed.empty()) {
    return false;
  }
  return trimmed.find_first_of(" \t/") == std::string::npos;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (auto override_path = resolved_config_path_override(); override_path.has_value()) {
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path();
    }
    return common::Result<std::filesystem::path>::success(parent);
  }
  auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(*override_path);
  }
  auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  g_config_path_override = std::move(path);
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

void apply_env_overrides(Config &config) {
  if (const char *teams = non_empty_env("TEAMLENS_TEAMS_DIR"); teams != nullptr) {
    config.watch.teams_dir = teams;
  }
  if (const char *tasks = non_empty_env("TEAMLENS_TASKS_DIR"); tasks != nullptr) {
    config.watch.tasks_dir = tasks;
  }
  if (const char *db = non_empty_env("TEAMLENS_DB_PATH"); db != nullptr) {
    config.store.db_path = db;
  }
  if (const char *port = non_empty_env("TEAMLENS_PORT"); port != nullptr) {
    const std::string raw(port);
    std::uint16_t parsed = 0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
    if (ec == std::errc() && ptr == raw.data() + raw.size()) {
      config.broadcast.port = parsed;
    }
  }
}

void expand_config_paths(Config &config) {
  config.watch.teams_dir = common::expand_path(config.watch.teams_dir);
  config.watch.tasks_dir = common::expand_path(config.watch.tasks_dir);
  config.store.db_path = common::expand_path(config.store.db_path);
  if (!config.broadcast.tls_cert_file.empty()) {
    config.broadcast.tls_cert_file = common::expand_path(config.broadcast.tls_cert_file);
  }
  if (!config.broadcast.tls_key_file.empty()) {
    config.broadcast.tls_key_file = common::expand_path(config.broadcast.tls_key_file);
  }
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  for (const auto &status : {
           doc.read_string("watch.teams_dir", config.watch.teams_dir),
           doc.read_string("watch.tasks_dir", config.watch.tasks_dir),
           doc.read_uint("watch.debounce_ms", config.watch.debounce_ms),
           doc.read_string("store.db_path", config.store.db_path),
           doc.read_uint("store.busy_timeout_ms", config.store.busy_timeout_ms),
           doc.read_string("broadcast.host", config.broadcast.host),
           doc.read_uint("broadcast.port", config.broadcast.port),
           doc.read_uint("broadcast.heartbeat_secs", config.broadcast.heartbeat_secs),
           doc.read_uint("broadcast.max_clients", config.broadcast.max_clients),
           doc.read_uint("broadcast.max_queued_messages", config.broadcast.max_queued_messages),
           doc.read_bool("broadcast.tls_enabled", config.broadcast.tls_enabled),
           doc.read_string("broadcast.tls_cert_file", config.broadcast.tls_cert_file),
           doc.read_string("broadcast.tls_key_file", config.broadcast.tls_key_file),
           doc.read_string("observability.backend", config.observability.backend),
       }) {
    if (!status.ok()) {
      return common::Result<Config>::failure(status.error());
    }
  }

  for (const auto &key : doc.keys()) {
    if (std::find(std::begin(KNOWN_KEYS), std::end(KNOWN_KEYS), key) == std::end(KNOWN_KEYS)) {
      std::cerr << "[config] warning unknown_key=" << key << "\n";
    }
  }
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  Config config;
  const auto path = cfg_path_result.value();
  if (std::filesystem::exists(path)) {
    std::ifstream file(path);
    if (!file) {
      return common::Result<Config>::failure("Unable to open config file: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    auto parsed = parse_config(buffer.str());
    if (!parsed.ok()) {
      return common::Result<Config>::failure(path.string() + ": " + parsed.error());
    }
    config = std::move(parsed.value());
  }

  apply_env_overrides(config);
  expand_config_paths(config);
  return common::Result<Config>::success(std::move(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (common::trim(config.watch.teams_dir).empty()) {
    return common::Result<std::vector<std::string>>::failure("watch.teams_dir is empty");
  }
  if (common::trim(config.watch.tasks_dir).empty()) {
    return common::Result<std::vector<std::string>>::failure("watch.tasks_dir is empty");
  }
  if (config.watch.debounce_ms == 0 || config.watch.debounce_ms > 10'000) {
    return common::Result<std::vector<std::string>>::failure(
        "watch.debounce_ms must be between 1 and 10000");
  }
  if (common::trim(config.store.db_path).empty()) {
    return common::Result<std::vector<std::string>>::failure("store.db_path is empty");
  }
  if (config.broadcast.port == 0) {
    return common::Result<std::vector<std::string>>::failure("broadcast.port must be 1-65535");
  }
  if (!is_valid_host(config.broadcast.host)) {
    return common::Result<std::vector<std::string>>::failure("broadcast.host is invalid: " +
                                                              config.broadcast.host);
  }
  if (config.broadcast.heartbeat_secs == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "broadcast.heartbeat_secs must be non-zero");
  }
  if (config.broadcast.max_clients == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "broadcast.max_clients must be non-zero");
  }
  if (config.broadcast.tls_enabled &&
      (config.broadcast.tls_cert_file.empty() || config.broadcast.tls_key_file.empty())) {
    return common::Result<std::vector<std::string>>::failure(
        "broadcast.tls_enabled requires tls_cert_file and tls_key_file");
  }

  const std::string host = common::trim(config.broadcast.host);
  if (host != "127.0.0.1" && host != "localhost") {
    warnings.push_back("broadcast.host " + host +
                       " exposes team state without authentication");
  }
  if (config.broadcast.max_queued_messages < 16) {
    warnings.push_back("broadcast.max_queued_messages below 16 drops slow observers quickly");
  }
  if (config.watch.teams_dir == config.watch.tasks_dir) {
    warnings.push_back("watch.teams_dir and watch.tasks_dir are the same directory");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

std::string describe_config(const Config &config) {
  std::ostringstream out;
  out << "{\"watch\":{\"teams_dir\":\"" << common::json_escape(config.watch.teams_dir)
      << "\",\"tasks_dir\":\"" << common::json_escape(config.watch.tasks_dir)
      << "\",\"debounce_ms\":" << config.watch.debounce_ms << "}";
  out << ",\"store\":{\"db_path\":\"" << common::json_escape(config.store.db_path) << "\"}";
  out << ",\"broadcast\":{\"host\":\"" << common::json_escape(config.broadcast.host)
      << "\",\"port\":" << config.broadcast.port
      << ",\"heartbeat_secs\":" << config.broadcast.heartbeat_secs
      << ",\"max_clients\":" << config.broadcast.max_clients
      << ",\"tls_enabled\":" << (config.broadcast.tls_enabled ? "true" : "false") << "}";
  out << ",\"observability\":{\"backend\":\""
      << common::json_escape(config.observability.backend) << "\"}}";
  return out.str();
}

} // namespace teamlens::config
