#pragma once

#include "uidgen/storage/audit_log.h"
#include "uidgen/storage/sqlite/sqlite_db.h"

#include <map>
#include <memory>
#include <mutex>

namespace uidgen::storage::sqlite {

// SqliteAuditLog implements IAuditLog with SQLite backend.
// Maintains an append-only log with deterministic per-topic ordering via the idx column.
// Thread-safe append operations using mutex for the idx counters.
//
// Every operation throws std::runtime_error when SQLite fails, so a read error is never
// mistaken for an empty log. append() also throws when the same event_id is appended twice
// under one topic.
class SqliteAuditLog final : public IAuditLog {
 public:
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& topic) const override;
  [[nodiscard]] std::vector<std::string> list_topics() const override;

 private:
  std::shared_ptr<SqliteDb> db_;

  mutable std::mutex mutex_;
  std::map<std::string, int> topic_indices_;

  // Reserve the next idx for topic. Reads MAX(idx) from the database the first time a
  // topic is seen so that appends continue an existing log.
  int next_index(const std::string& topic);
};

}  // namespace uidgen::storage::sqlite
