#pragma once

#include "uidgen/core/result.h"

#include <memory>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace uidgen::storage::sqlite {

// SqliteDb owns the connection behind the audit store.
//
// open() does not touch the schema. Call ensure_schema_v1() before handing the connection
// to SqliteAuditLog: it creates the audit tables on a fresh file and refuses a file whose
// audit_events table has a different layout.
class SqliteDb {
 public:
  // ":memory:" opens a private in-memory database.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // 0 when schema_version is absent or empty.
  [[nodiscard]] int schema_version() const;

  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v1();

  [[nodiscard]] core::Result<bool, std::string> exec(const std::string& sql);

  [[nodiscard]] std::string last_error() const;

  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  // Error unless audit_events exists with every column SqliteAuditLog reads or writes.
  [[nodiscard]] core::Result<bool, std::string> check_audit_columns() const;

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
};

// Statement handle, finalized on destruction. When preparation fails, is_valid() is false
// and error() holds SQLite's message.
class PreparedStatement {
 public:
  PreparedStatement(sqlite3* db, const std::string& sql);
  ~PreparedStatement() = default;

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }
  [[nodiscard]] const std::string& error() const { return error_; }
  [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

}  // namespace uidgen::storage::sqlite
