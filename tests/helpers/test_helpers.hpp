#pragma once

#include "teamlens/config/schema.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace teamlens::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  [[nodiscard]] std::filesystem::path teams_dir() const { return path_ / "teams"; }
  [[nodiscard]] std::filesystem::path tasks_dir() const { return path_ / "tasks"; }
  [[nodiscard]] std::filesystem::path db_path() const { return path_ / "db" / "sessions.db"; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

/// Config rooted inside `workspace` with both roots created, a fast
/// debounce, and a free local port.
config::Config temp_config(const TempWorkspace &workspace);

void write_file(const std::filesystem::path &path, const std::string &content);

struct MemberSpec {
  std::string name;
  std::string agent_type = "general-purpose";
};

std::string team_config_json(const std::string &name, std::int64_t created_at,
                             const std::vector<MemberSpec> &members = {{"team-lead", "lead"}});
std::string inbox_message_json(const std::string &from, const std::string &text,
                               const std::string &timestamp, bool read = false);
std::string task_json(const std::string &id, const std::string &subject,
                      const std::string &status, const std::string &extra_fields = "");

std::filesystem::path config_file(const TempWorkspace &workspace, const std::string &team);
std::filesystem::path inbox_file(const TempWorkspace &workspace, const std::string &team,
                                 const std::string &agent);
std::filesystem::path task_file(const TempWorkspace &workspace, const std::string &team,
                                const std::string &id);

bool wait_until(const std::function<bool()> &predicate,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

/// Binds an ephemeral loopback port and releases it.
std::uint16_t free_port();

/// Minimal blocking WebSocket client for driving the observer endpoint.
class WsTestClient {
public:
  WsTestClient() = default;
  ~WsTestClient();

  WsTestClient(const WsTestClient &) = delete;
  WsTestClient &operator=(const WsTestClient &) = delete;

  /// Connects and completes the upgrade. Returns the HTTP status line on
  /// failure through `status_line`.
  bool connect(std::uint16_t port, std::string *status_line = nullptr);
  bool send_text(const std::string &text);
  /// Next text frame, answering nothing; nullopt on timeout or close.
  std::optional<std::string> read_text(std::chrono::milliseconds timeout);
  /// Skips frames until one whose "type" equals `type`.
  std::optional<std::string> read_until_type(const std::string &type,
                                             std::chrono::milliseconds timeout);
  void close();

private:
  bool read_exact(std::uint8_t *out, std::size_t size,
                  std::chrono::steady_clock::time_point deadline);

  int fd_ = -1;
};

} // namespace teamlens::testing
