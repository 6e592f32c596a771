#include "teamlens/sessions/store.hpp"

#include "teamlens/common/fs.hpp"
#include "teamlens/common/json_util.hpp"
#include "teamlens/model/json.hpp"

#include <algorithm>

namespace teamlens::sessions {

namespace {

constexpr const char *NOT_OPEN = "session store is not open";
constexpr const char *SUMMARY_COLUMNS =
    "id, team_name, description, created_at, started_at, ended_at";

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(msg);
  }
  return common::Status::success();
}

void rollback(sqlite3 *db) { (void)exec_sql(db, "ROLLBACK;"); }

void bind_text(sqlite3_stmt *stmt, const int index, const std::string &value) {
  sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::string column_text(sqlite3_stmt *stmt, const int col) {
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, col));
  return text == nullptr ? std::string() : std::string(text);
}

SessionSummary row_to_summary(sqlite3_stmt *stmt) {
  SessionSummary summary;
  summary.id = sqlite3_column_int64(stmt, 0);
  summary.team_name = column_text(stmt, 1);
  summary.description = column_text(stmt, 2);
  summary.created_at = sqlite3_column_int64(stmt, 3);
  summary.started_at = column_text(stmt, 4);
  if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) {
    summary.ended_at = column_text(stmt, 5);
  }
  return summary;
}

std::vector<std::string> parse_id_list(const std::string &json) {
  std::vector<std::string> ids;
  for (const auto &element : common::json_split_top_level_values(json)) {
    ids.push_back(common::json_scalar_text(element));
  }
  return ids;
}

bool is_constraint_violation(const int rc) { return (rc & 0xff) == SQLITE_CONSTRAINT; }

} // namespace

SessionStore::SessionStore(std::filesystem::path db_path, const std::uint32_t busy_timeout_ms)
    : db_path_(std::move(db_path)), busy_timeout_ms_(busy_timeout_ms) {}

SessionStore::~SessionStore() { close(); }

common::Status SessionStore::open() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ != nullptr) {
    return common::Status::success();
  }

  if (db_path_.has_parent_path()) {
    auto dir = common::ensure_dir(db_path_.parent_path());
    if (!dir.ok()) {
      return common::Status::error("cannot create database directory: " + dir.error());
    }
  }

  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(db_path_.string().c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    const std::string error =
        db_ == nullptr ? std::string("out of memory") : std::string(sqlite3_errmsg(db_));
    sqlite3_close(db_);
    db_ = nullptr;
    return common::Status::error("cannot open " + db_path_.string() + ": " + error);
  }
  sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout_ms_));

  auto status = init_schema();
  if (!status.ok()) {
    sqlite3_close(db_);
    db_ = nullptr;
    return status.with_context("session store schema");
  }
  return common::Status::success();
}

void SessionStore::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ != nullptr) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

bool SessionStore::is_open() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return db_ != nullptr;
}

common::Status SessionStore::init_schema() {
  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }
  status = exec_sql(db_, "PRAGMA foreign_keys=ON;");
  if (!status.ok()) {
    return status;
  }

  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS sessions (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  team_name TEXT NOT NULL,
  created_at INTEGER NOT NULL,
  description TEXT NOT NULL DEFAULT '',
  lead_agent_id TEXT NOT NULL DEFAULT '',
  config_json TEXT NOT NULL,
  started_at TEXT NOT NULL,
  ended_at TEXT,
  UNIQUE(team_name, created_at)
);
CREATE TABLE IF NOT EXISTS members (
  session_id INTEGER NOT NULL REFERENCES sessions(id),
  agent_id TEXT NOT NULL,
  name TEXT NOT NULL DEFAULT '',
  agent_type TEXT NOT NULL DEFAULT '',
  model TEXT NOT NULL DEFAULT '',
  color TEXT NOT NULL DEFAULT '',
  joined_at INTEGER NOT NULL DEFAULT 0,
  position INTEGER NOT NULL DEFAULT 0,
  UNIQUE(session_id, agent_id)
);
CREATE TABLE IF NOT EXISTS messages (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  session_id INTEGER NOT NULL REFERENCES sessions(id),
  recipient TEXT NOT NULL,
  sender TEXT NOT NULL,
  timestamp TEXT NOT NULL,
  text TEXT NOT NULL,
  color TEXT NOT NULL DEFAULT '',
  read INTEGER NOT NULL DEFAULT 0,
  kind TEXT NOT NULL DEFAULT 'plain_text',
  payload TEXT,
  UNIQUE(session_id, recipient, sender, timestamp)
);
CREATE TABLE IF NOT EXISTS tasks (
  session_id INTEGER NOT NULL REFERENCES sessions(id),
  task_id TEXT NOT NULL,
  subject TEXT NOT NULL DEFAULT '',
  description TEXT NOT NULL DEFAULT '',
  active_form TEXT NOT NULL DEFAULT '',
  status TEXT NOT NULL,
  owner TEXT NOT NULL DEFAULT '',
  blocks TEXT NOT NULL DEFAULT '[]',
  blocked_by TEXT NOT NULL DEFAULT '[]',
  internal INTEGER NOT NULL DEFAULT 0,
  updated_at TEXT NOT NULL,
  UNIQUE(session_id, task_id)
);
CREATE INDEX IF NOT EXISTS idx_messages_session ON messages(session_id, timestamp);
)");
}

common::Result<std::optional<SessionSummary>>
SessionStore::query_summary(const std::string &sql, const std::string &team,
                            const std::optional<std::int64_t> created_at) {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::optional<SessionSummary>>::failure(sqlite3_errmsg(db_));
  }
  bind_text(stmt, 1, team);
  if (created_at.has_value()) {
    sqlite3_bind_int64(stmt, 2, *created_at);
  }

  std::optional<SessionSummary> out;
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    out = row_to_summary(stmt);
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    return common::Result<std::optional<SessionSummary>>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::optional<SessionSummary>>::success(std::move(out));
}

common::Result<EnsuredSession> SessionStore::ensure_session(const model::TeamConfig &config) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<EnsuredSession>::failure(NOT_OPEN);
  }

  const std::string select_sql = std::string("SELECT ") + SUMMARY_COLUMNS +
                                 " FROM sessions WHERE team_name = ?1 AND created_at = ?2";
  auto existing = query_summary(select_sql, config.name, config.created_at);
  if (!existing.ok()) {
    return common::Result<EnsuredSession>::failure(existing.error());
  }
  if (existing.value().has_value()) {
    return common::Result<EnsuredSession>::success(
        EnsuredSession{.id = existing.value()->id, .created = false});
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT INTO sessions(team_name, created_at, description, lead_agent_id, "
                    "config_json, started_at) VALUES(?1, ?2, ?3, ?4, ?5, ?6)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<EnsuredSession>::failure(sqlite3_errmsg(db_));
  }
  bind_text(stmt, 1, config.name);
  sqlite3_bind_int64(stmt, 2, config.created_at);
  bind_text(stmt, 3, config.description);
  bind_text(stmt, 4, config.lead_agent_id);
  bind_text(stmt, 5, model::team_config_to_json(config));
  bind_text(stmt, 6, common::now_rfc3339());

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc == SQLITE_DONE) {
    return common::Result<EnsuredSession>::success(
        EnsuredSession{.id = sqlite3_last_insert_rowid(db_), .created = true});
  }
  if (!is_constraint_violation(rc)) {
    return common::Result<EnsuredSession>::failure(sqlite3_errmsg(db_));
  }

  // Another writer created it between our lookup and insert.
  auto raced = query_summary(select_sql, config.name, config.created_at);
  if (!raced.ok()) {
    return common::Result<EnsuredSession>::failure(raced.error());
  }
  if (!raced.value().has_value()) {
    return common::Result<EnsuredSession>::failure("session vanished after unique conflict");
  }
  return common::Result<EnsuredSession>::success(
      EnsuredSession{.id = raced.value()->id, .created = false});
}

common::Status SessionStore::record_members(const std::int64_t session_id,
                                            const std::vector<model::Member> &members) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(NOT_OPEN);
  }

  auto status = exec_sql(db_, "BEGIN IMMEDIATE;");
  if (!status.ok()) {
    return status;
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT OR IGNORE INTO members(session_id, agent_id, name, agent_type, model, "
                    "color, joined_at, position) VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    const std::string error = sqlite3_errmsg(db_);
    rollback(db_);
    return common::Status::error(error);
  }

  for (std::size_t i = 0; i < members.size(); ++i) {
    const auto &member = members[i];
    const std::string key = member.agent_id.empty() ? member.name : member.agent_id;
    if (key.empty()) {
      continue;
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    sqlite3_bind_int64(stmt, 1, session_id);
    bind_text(stmt, 2, key);
    bind_text(stmt, 3, member.name);
    bind_text(stmt, 4, member.agent_type);
    bind_text(stmt, 5, member.model);
    bind_text(stmt, 6, member.color);
    sqlite3_bind_int64(stmt, 7, member.joined_at);
    sqlite3_bind_int64(stmt, 8, static_cast<std::int64_t>(i));
    if (sqlite3_step(stmt) != SQLITE_DONE) {
      const std::string error = sqlite3_errmsg(db_);
      sqlite3_finalize(stmt);
      rollback(db_);
      return common::Status::error(error);
    }
  }
  sqlite3_finalize(stmt);

  status = exec_sql(db_, "COMMIT;");
  if (!status.ok()) {
    rollback(db_);
  }
  return status;
}

common::Result<bool> SessionStore::insert_message(const std::int64_t session_id,
                                                  const std::string &recipient,
                                                  const model::InboxMessage &message) {
  sqlite3_stmt *stmt = nullptr;
  const char *sql =
      "INSERT OR IGNORE INTO messages(session_id, recipient, sender, timestamp, text, color, "
      "read, kind, payload) VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, session_id);
  bind_text(stmt, 2, recipient);
  bind_text(stmt, 3, message.from);
  bind_text(stmt, 4, message.timestamp);
  bind_text(stmt, 5, message.text);
  bind_text(stmt, 6, message.color);
  sqlite3_bind_int(stmt, 7, message.read ? 1 : 0);
  bind_text(stmt, 8, model::message_kind_to_string(message.kind));
  if (message.payload_json.empty()) {
    sqlite3_bind_null(stmt, 9);
  } else {
    bind_text(stmt, 9, message.payload_json);
  }

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<bool>::success(sqlite3_changes(db_) > 0);
}

common::Result<bool> SessionStore::record_message(const std::int64_t session_id,
                                                  const std::string &recipient,
                                                  const model::InboxMessage &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<bool>::failure(NOT_OPEN);
  }
  return insert_message(session_id, recipient, message);
}

common::Result<std::size_t>
SessionStore::record_messages(const std::int64_t session_id, const std::string &recipient,
                              const std::vector<model::InboxMessage> &messages) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::size_t>::failure(NOT_OPEN);
  }

  auto status = exec_sql(db_, "BEGIN IMMEDIATE;");
  if (!status.ok()) {
    return common::Result<std::size_t>::failure(status.error());
  }
  std::size_t inserted = 0;
  for (const auto &message : messages) {
    auto result = insert_message(session_id, recipient, message);
    if (!result.ok()) {
      rollback(db_);
      return common::Result<std::size_t>::failure(result.error());
    }
    if (result.value()) {
      ++inserted;
    }
  }
  status = exec_sql(db_, "COMMIT;");
  if (!status.ok()) {
    rollback(db_);
    return common::Result<std::size_t>::failure(status.error());
  }
  return common::Result<std::size_t>::success(inserted);
}

common::Status SessionStore::upsert_task(const std::int64_t session_id, const model::Task &task) {
  sqlite3_stmt *stmt = nullptr;
  const char *sql = R"(
INSERT INTO tasks(session_id, task_id, subject, description, active_form, status, owner,
                  blocks, blocked_by, internal, updated_at)
VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)
ON CONFLICT(session_id, task_id) DO UPDATE SET
  subject = excluded.subject,
  description = excluded.description,
  active_form = excluded.active_form,
  status = excluded.status,
  owner = excluded.owner,
  blocks = excluded.blocks,
  blocked_by = excluded.blocked_by,
  internal = excluded.internal,
  updated_at = excluded.updated_at
)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, session_id);
  bind_text(stmt, 2, task.id);
  bind_text(stmt, 3, task.subject);
  bind_text(stmt, 4, task.description);
  bind_text(stmt, 5, task.active_form);
  bind_text(stmt, 6, model::task_status_to_string(task.status));
  bind_text(stmt, 7, task.owner);
  bind_text(stmt, 8, common::json_string_array(task.blocks));
  bind_text(stmt, 9, common::json_string_array(task.blocked_by));
  sqlite3_bind_int(stmt, 10, task.internal ? 1 : 0);
  bind_text(stmt, 11, common::now_rfc3339());

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Status SessionStore::record_task(const std::int64_t session_id, const model::Task &task) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(NOT_OPEN);
  }
  return upsert_task(session_id, task);
}

common::Status SessionStore::record_tasks(const std::int64_t session_id,
                                          const model::TaskMap &tasks) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(NOT_OPEN);
  }
  auto status = exec_sql(db_, "BEGIN IMMEDIATE;");
  if (!status.ok()) {
    return status;
  }
  for (const auto &[id, task] : tasks) {
    status = upsert_task(session_id, task);
    if (!status.ok()) {
      rollback(db_);
      return status;
    }
  }
  status = exec_sql(db_, "COMMIT;");
  if (!status.ok()) {
    rollback(db_);
  }
  return status;
}

common::Result<bool> SessionStore::end_session(const std::int64_t session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<bool>::failure(NOT_OPEN);
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_,
                         "UPDATE sessions SET ended_at = ?2 WHERE id = ?1 AND ended_at IS NULL",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, session_id);
  bind_text(stmt, 2, common::now_rfc3339());
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<bool>::success(sqlite3_changes(db_) > 0);
}

common::Result<std::vector<std::int64_t>>
SessionStore::end_superseded_sessions(const std::string &team, const std::int64_t created_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<std::int64_t>>::failure(NOT_OPEN);
  }

  auto status = exec_sql(db_, "BEGIN IMMEDIATE;");
  if (!status.ok()) {
    return common::Result<std::vector<std::int64_t>>::failure(status.error());
  }

  std::vector<std::int64_t> ended;
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_,
                         "SELECT id FROM sessions WHERE team_name = ?1 AND created_at < ?2 AND "
                         "ended_at IS NULL ORDER BY id",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    const std::string error = sqlite3_errmsg(db_);
    rollback(db_);
    return common::Result<std::vector<std::int64_t>>::failure(error);
  }
  bind_text(stmt, 1, team);
  sqlite3_bind_int64(stmt, 2, created_at);
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    ended.push_back(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);

  if (!ended.empty()) {
    if (sqlite3_prepare_v2(db_,
                           "UPDATE sessions SET ended_at = ?3 WHERE team_name = ?1 AND "
                           "created_at < ?2 AND ended_at IS NULL",
                           -1, &stmt, nullptr) != SQLITE_OK) {
      const std::string error = sqlite3_errmsg(db_);
      rollback(db_);
      return common::Result<std::vector<std::int64_t>>::failure(error);
    }
    bind_text(stmt, 1, team);
    sqlite3_bind_int64(stmt, 2, created_at);
    bind_text(stmt, 3, common::now_rfc3339());
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
      const std::string error = sqlite3_errmsg(db_);
      rollback(db_);
      return common::Result<std::vector<std::int64_t>>::failure(error);
    }
  }

  status = exec_sql(db_, "COMMIT;");
  if (!status.ok()) {
    rollback(db_);
    return common::Result<std::vector<std::int64_t>>::failure(status.error());
  }
  return common::Result<std::vector<std::int64_t>>::success(std::move(ended));
}

common::Result<std::optional<SessionSummary>>
SessionStore::find_session(const std::string &team, const std::int64_t created_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::optional<SessionSummary>>::failure(NOT_OPEN);
  }
  return query_summary(std::string("SELECT ") + SUMMARY_COLUMNS +
                           " FROM sessions WHERE team_name = ?1 AND created_at = ?2",
                       team, created_at);
}

common::Result<std::optional<SessionSummary>>
SessionStore::find_latest_session(const std::string &team) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::optional<SessionSummary>>::failure(NOT_OPEN);
  }
  return query_summary(std::string("SELECT ") + SUMMARY_COLUMNS +
                           " FROM sessions WHERE team_name = ?1 "
                           "ORDER BY created_at DESC, id DESC LIMIT 1",
                       team, std::nullopt);
}

common::Result<std::vector<SessionSummary>> SessionStore::list_sessions() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<SessionSummary>>::failure(NOT_OPEN);
  }
  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string("SELECT ") + SUMMARY_COLUMNS +
                          " FROM sessions ORDER BY created_at DESC, id DESC";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<SessionSummary>>::failure(sqlite3_errmsg(db_));
  }
  std::vector<SessionSummary> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    out.push_back(row_to_summary(stmt));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<SessionSummary>>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::vector<SessionSummary>>::success(std::move(out));
}

common::Result<SessionDetail> SessionStore::get_session(const std::int64_t session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<SessionDetail>::failure(NOT_OPEN);
  }

  SessionDetail detail;
  sqlite3_stmt *stmt = nullptr;
  const std::string session_sql = std::string("SELECT ") + SUMMARY_COLUMNS +
                                  ", lead_agent_id, config_json FROM sessions WHERE id = ?1";
  if (sqlite3_prepare_v2(db_, session_sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<SessionDetail>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, session_id);
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    detail.summary = row_to_summary(stmt);
    detail.lead_agent_id = column_text(stmt, 6);
    detail.config_json = column_text(stmt, 7);
  }
  sqlite3_finalize(stmt);
  if (rc == SQLITE_DONE) {
    return common::Result<SessionDetail>::failure("session not found: " +
                                                  std::to_string(session_id));
  }
  if (rc != SQLITE_ROW) {
    return common::Result<SessionDetail>::failure(sqlite3_errmsg(db_));
  }

  if (sqlite3_prepare_v2(db_,
                         "SELECT agent_id, name, agent_type, model, color, joined_at FROM members "
                         "WHERE session_id = ?1 ORDER BY position, agent_id",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<SessionDetail>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, session_id);
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    detail.members.push_back(model::Member{.agent_id = column_text(stmt, 0),
                                           .name = column_text(stmt, 1),
                                           .agent_type = column_text(stmt, 2),
                                           .model = column_text(stmt, 3),
                                           .color = column_text(stmt, 4),
                                           .joined_at = sqlite3_column_int64(stmt, 5)});
  }
  sqlite3_finalize(stmt);

  if (sqlite3_prepare_v2(db_,
                         "SELECT recipient, sender, text, timestamp, color, read, kind, payload "
                         "FROM messages WHERE session_id = ?1 ORDER BY timestamp, id",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<SessionDetail>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, session_id);
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    SessionMessage entry;
    entry.recipient = column_text(stmt, 0);
    entry.message.from = column_text(stmt, 1);
    entry.message.text = column_text(stmt, 2);
    entry.message.timestamp = column_text(stmt, 3);
    entry.message.color = column_text(stmt, 4);
    entry.message.read = sqlite3_column_int(stmt, 5) != 0;
    entry.message.kind =
        model::message_kind_from_string(column_text(stmt, 6)).value_or(model::MessageKind::PlainText);
    entry.message.payload_json = column_text(stmt, 7);
    detail.messages.push_back(std::move(entry));
  }
  sqlite3_finalize(stmt);

  if (sqlite3_prepare_v2(db_,
                         "SELECT task_id, subject, description, active_form, status, owner, "
                         "blocks, blocked_by, internal FROM tasks WHERE session_id = ?1",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<SessionDetail>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, session_id);
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    model::Task task;
    task.id = column_text(stmt, 0);
    task.subject = column_text(stmt, 1);
    task.description = column_text(stmt, 2);
    task.active_form = column_text(stmt, 3);
    task.status =
        model::task_status_from_string(column_text(stmt, 4)).value_or(model::TaskStatus::Pending);
    task.owner = column_text(stmt, 5);
    task.blocks = parse_id_list(column_text(stmt, 6));
    task.blocked_by = parse_id_list(column_text(stmt, 7));
    task.internal = sqlite3_column_int(stmt, 8) != 0;
    if (model::is_visible(task)) {
      detail.tasks.push_back(std::move(task));
    }
  }
  sqlite3_finalize(stmt);
  std::sort(detail.tasks.begin(), detail.tasks.end(),
            [](const model::Task &lhs, const model::Task &rhs) {
              return model::TaskIdLess{}(lhs.id, rhs.id);
            });

  return common::Result<SessionDetail>::success(std::move(detail));
}

common::Result<std::size_t> SessionStore::count_rows(const std::string &table) {
  if (table != "sessions" && table != "members" && table != "messages" && table != "tasks") {
    return common::Result<std::size_t>::failure("unknown table: " + table);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::size_t>::failure(NOT_OPEN);
  }
  sqlite3_stmt *stmt = nullptr;
  const std::string sql = "SELECT COUNT(*) FROM " + table;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::size_t>::failure(sqlite3_errmsg(db_));
  }
  std::size_t count = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    count = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::size_t>::success(count);
}

} // namespace teamlens::sessions
