#include "uidgen/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

#include <array>
#include <functional>
#include <set>
#include <string_view>

namespace uidgen::storage::sqlite {

namespace {

using BoolResult = core::Result<bool, std::string>;

// One row per recorded id. (topic, event_id) is the key, so recording the same id twice
// under a topic fails; idx is the append position within the topic.
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS audit_events (
  event_id TEXT NOT NULL,
  topic TEXT NOT NULL,
  unique_id TEXT NOT NULL,
  payload TEXT NOT NULL,
  created_at TEXT NOT NULL,
  idx INTEGER NOT NULL,
  PRIMARY KEY(topic, event_id)
);

CREATE UNIQUE INDEX IF NOT EXISTS idx_audit_events_topic ON audit_events(topic, idx);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (1, datetime('now'));
)";

constexpr std::array<std::string_view, 6> kAuditColumns = {
    "event_id", "topic", "unique_id", "payload", "created_at", "idx"};

BoolResult run_script(sqlite3* db, const char* sql, const std::string& context) {
  char* err_msg = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : sqlite3_errmsg(db);
    sqlite3_free(err_msg);
    return BoolResult::err(context + ": " + error);
  }
  return BoolResult::ok(true);
}

}  // namespace

void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  sqlite3_close(db);
}

void PreparedStatement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  sqlite3_finalize(stmt);
}

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  sqlite3* db = nullptr;
  if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
    std::string error = db != nullptr ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    return core::Result<std::shared_ptr<SqliteDb>, std::string>::err(
        "Failed to open audit database " + path + ": " + error);
  }

  return core::Result<std::shared_ptr<SqliteDb>, std::string>::ok(
      std::shared_ptr<SqliteDb>(new SqliteDb(db)));
}

int SqliteDb::schema_version() const {
  PreparedStatement stmt(db_.get(), "SELECT MAX(version) FROM schema_version");
  if (!stmt.is_valid() || sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return 0;
  }
  return sqlite3_column_int(stmt.get(), 0);
}

BoolResult SqliteDb::ensure_schema_v1() {
  if (schema_version() < 1) {
    auto applied = run_script(db_.get(), kSchemaV1, "Failed to create audit schema");
    if (!applied.has_value()) {
      return applied;
    }
  }
  return check_audit_columns();
}

BoolResult SqliteDb::check_audit_columns() const {
  PreparedStatement stmt(db_.get(), "PRAGMA table_info(audit_events)");
  if (!stmt.is_valid()) {
    return BoolResult::err("Failed to inspect audit_events: " + stmt.error());
  }

  std::set<std::string, std::less<>> present;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    const auto* name = sqlite3_column_text(stmt.get(), 1);
    if (name != nullptr) {
      present.emplace(reinterpret_cast<const char*>(name));  // NOLINT
    }
  }
  if (present.empty()) {
    return BoolResult::err("audit_events table is missing");
  }

  std::string missing;
  for (const auto column : kAuditColumns) {
    if (present.find(column) == present.end()) {
      missing += missing.empty() ? "" : ", ";
      missing += column;
    }
  }
  if (!missing.empty()) {
    return BoolResult::err("audit_events has an unexpected layout, missing: " + missing);
  }
  return BoolResult::ok(true);
}

BoolResult SqliteDb::exec(const std::string& sql) {
  return run_script(db_.get(), sql.c_str(), "SQL execution failed");
}

std::string SqliteDb::last_error() const {
  return sqlite3_errmsg(db_.get());
}

PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw_stmt = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw_stmt, nullptr) != SQLITE_OK) {
    error_ = sqlite3_errmsg(db);
    sqlite3_finalize(raw_stmt);
    return;
  }
  stmt_.reset(raw_stmt);
}

}  // namespace uidgen::storage::sqlite
