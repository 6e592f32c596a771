#pragma once

#include <cstdint>
#include <string>

namespace teamlens::config {

struct WatchConfig {
  std::string teams_dir = "~/.claude/teams";
  std::string tasks_dir = "~/.claude/tasks";
  std::uint32_t debounce_ms = 100;
};

struct StoreConfig {
  std::string db_path = "~/.teamlens/sessions.db";
  std::uint32_t busy_timeout_ms = 5000;
};

struct BroadcastConfig {
  std::string host = "127.0.0.1";
  std::uint16_t port = 3847;
  std::uint32_t heartbeat_secs = 5;
  std::size_t max_clients = 256;
  std::size_t max_queued_messages = 1024;
  bool tls_enabled = false;
  std::string tls_cert_file;
  std::string tls_key_file;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  WatchConfig watch;
  StoreConfig store;
  BroadcastConfig broadcast;
  ObservabilityConfig observability;
};

} // namespace teamlens::config
