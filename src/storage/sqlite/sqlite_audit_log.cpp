#include "uidgen/storage/sqlite/sqlite_audit_log.h"

#include <sqlite3.h>

#include <stdexcept>
#include <utility>

namespace uidgen::storage::sqlite {

namespace {

std::string column_text(sqlite3_stmt* stmt, int column) {
  const auto* raw = sqlite3_column_text(stmt, column);
  return raw != nullptr ? reinterpret_cast<const char*>(raw) : "";  // NOLINT
}

}  // namespace

SqliteAuditLog::SqliteAuditLog(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

void SqliteAuditLog::append(const AuditEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);

  const char* sql = R"(
    INSERT INTO audit_events (event_id, topic, unique_id, payload, created_at, idx)
    VALUES (?, ?, ?, ?, ?, ?)
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("Failed to prepare audit insert: " + stmt.error());
  }

  const int idx = next_index(event.topic);

  sqlite3_bind_text(stmt.get(), 1, event.event_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, event.topic.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 3, event.unique_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 4, event.payload.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 5, event.created_at.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt.get(), 6, idx);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    // Give the idx back so the next append for this topic does not leave a gap.
    topic_indices_[event.topic] = idx;
    throw std::runtime_error("Failed to append audit event " + event.event_id + ": " +
                             db_->last_error());
  }
}

std::vector<AuditEvent> SqliteAuditLog::query(const std::string& topic) const {
  std::lock_guard<std::mutex> lock(mutex_);

  const char* sql = topic.empty()
                        ? "SELECT event_id, topic, unique_id, payload, created_at"
                          "  FROM audit_events ORDER BY topic, idx"
                        : "SELECT event_id, topic, unique_id, payload, created_at"
                          "  FROM audit_events WHERE topic = ? ORDER BY idx";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("Failed to prepare audit query: " + stmt.error());
  }

  if (!topic.empty()) {
    sqlite3_bind_text(stmt.get(), 1, topic.c_str(), -1, SQLITE_TRANSIENT);
  }

  std::vector<AuditEvent> result;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    AuditEvent event;
    event.event_id = column_text(stmt.get(), 0);
    event.topic = column_text(stmt.get(), 1);
    event.unique_id = column_text(stmt.get(), 2);
    event.payload = column_text(stmt.get(), 3);
    event.created_at = column_text(stmt.get(), 4);
    result.push_back(std::move(event));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error("Failed to read audit events: " + db_->last_error());
  }

  return result;
}

std::vector<std::string> SqliteAuditLog::list_topics() const {
  std::lock_guard<std::mutex> lock(mutex_);

  PreparedStatement stmt(db_->connection(),
                         "SELECT DISTINCT topic FROM audit_events ORDER BY topic");
  if (!stmt.is_valid()) {
    throw std::runtime_error("Failed to prepare audit topic query: " + stmt.error());
  }

  std::vector<std::string> topics;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    topics.push_back(column_text(stmt.get(), 0));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error("Failed to read audit topics: " + db_->last_error());
  }
  return topics;
}

int SqliteAuditLog::next_index(const std::string& topic) {
  auto it = topic_indices_.find(topic);
  if (it != topic_indices_.end()) {
    return it->second++;
  }

  // New topic: continue from the existing max index
  PreparedStatement idx_stmt(db_->connection(),
                             "SELECT MAX(idx) FROM audit_events WHERE topic = ?");
  int max_idx = -1;
  if (idx_stmt.is_valid()) {
    sqlite3_bind_text(idx_stmt.get(), 1, topic.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(idx_stmt.get()) == SQLITE_ROW &&
        sqlite3_column_type(idx_stmt.get(), 0) != SQLITE_NULL) {
      max_idx = sqlite3_column_int(idx_stmt.get(), 0);
    }
  }

  const int idx = max_idx + 1;
  topic_indices_[topic] = idx + 1;
  return idx;
}

}  // namespace uidgen::storage::sqlite
