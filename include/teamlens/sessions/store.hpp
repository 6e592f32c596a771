#pragma once

#include "teamlens/common/result.hpp"
#include "teamlens/model/team.hpp"
#include "teamlens/sessions/session.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <vector>

namespace teamlens::sessions {

struct EnsuredSession {
  std::int64_t id = 0;
  bool created = false;
};

class SessionStore {
public:
  explicit SessionStore(std::filesystem::path db_path, std::uint32_t busy_timeout_ms = 5000);
  ~SessionStore();

  SessionStore(const SessionStore &) = delete;
  SessionStore &operator=(const SessionStore &) = delete;

  [[nodiscard]] common::Status open();
  void close();
  [[nodiscard]] bool is_open() const;
  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

  /// One session per (team, createdAt). Concurrent callers all get the
  /// same id; exactly one of them sees `created`.
  [[nodiscard]] common::Result<EnsuredSession> ensure_session(const model::TeamConfig &config);
  [[nodiscard]] common::Status record_members(std::int64_t session_id,
                                              const std::vector<model::Member> &members);
  [[nodiscard]] common::Result<bool> record_message(std::int64_t session_id,
                                                    const std::string &recipient,
                                                    const model::InboxMessage &message);
  [[nodiscard]] common::Result<std::size_t>
  record_messages(std::int64_t session_id, const std::string &recipient,
                  const std::vector<model::InboxMessage> &messages);
  [[nodiscard]] common::Status record_task(std::int64_t session_id, const model::Task &task);
  [[nodiscard]] common::Status record_tasks(std::int64_t session_id, const model::TaskMap &tasks);

  [[nodiscard]] common::Result<bool> end_session(std::int64_t session_id);
  [[nodiscard]] common::Result<std::vector<std::int64_t>>
  end_superseded_sessions(const std::string &team, std::int64_t created_at);

  [[nodiscard]] common::Result<std::optional<SessionSummary>>
  find_session(const std::string &team, std::int64_t created_at);
  [[nodiscard]] common::Result<std::optional<SessionSummary>>
  find_latest_session(const std::string &team);
  [[nodiscard]] common::Result<std::vector<SessionSummary>> list_sessions();
  [[nodiscard]] common::Result<SessionDetail> get_session(std::int64_t session_id);

  [[nodiscard]] common::Result<std::size_t> count_rows(const std::string &table);

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Result<std::optional<SessionSummary>>
  query_summary(const std::string &sql, const std::string &team, std::optional<std::int64_t> created_at);
  [[nodiscard]] common::Result<bool> insert_message(std::int64_t session_id,
                                                    const std::string &recipient,
                                                    const model::InboxMessage &message);
  [[nodiscard]] common::Status upsert_task(std::int64_t session_id, const model::Task &task);

  std::filesystem::path db_path_;
  std::uint32_t busy_timeout_ms_;
  sqlite3 *db_ = nullptr;
  mutable std::mutex mutex_;
};

} // namespace teamlens::sessions
