#include "uidgen/core/time_source.h"
#include "uidgen/core/uuid_generator.h"
#include "uidgen/publish/audit_log_listener.h"
#include "uidgen/storage/audit_log.h"
#include "uidgen/storage/sqlite/sqlite_audit_log.h"
#include "uidgen/storage/sqlite/sqlite_db.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <stdexcept>

using namespace uidgen;

// Helper: open an in-memory DB with schema v1 applied.
static std::shared_ptr<storage::sqlite::SqliteDb> make_db() {
  auto result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(result.has_value());
  auto db = result.value();
  auto schema = db->ensure_schema_v1();
  REQUIRE(schema.has_value());
  return db;
}

static storage::AuditEvent make_event(const std::string& unique_id,
                                      const std::string& topic = "ids") {
  return {"evt-" + unique_id, topic, unique_id, "{}", "2026-01-01T00:00:00Z"};
}

TEST_CASE("InMemoryAuditLog returns events per topic in append order", "[audit_log]") {
  storage::InMemoryAuditLog log;
  log.append(make_event("1-1-0", "a"));
  log.append(make_event("2-1-0", "b"));
  log.append(make_event("3-1-0", "a"));

  const auto a = log.query("a");
  REQUIRE(a.size() == 2);
  CHECK(a[0].unique_id == "1-1-0");
  CHECK(a[1].unique_id == "3-1-0");

  CHECK(log.query("").size() == 3);
  CHECK(log.query("missing").empty());
  CHECK(log.list_topics() == std::vector<std::string>{"a", "b"});
}

TEST_CASE("SqliteDb applies schema v1 idempotently", "[audit_log][sqlite]") {
  auto db = make_db();
  CHECK(db->schema_version() == 1);

  auto again = db->ensure_schema_v1();
  REQUIRE(again.has_value());
  CHECK(db->schema_version() == 1);
}

// A file whose audit_events table predates the current layout.
static std::shared_ptr<storage::sqlite::SqliteDb> make_foreign_db(bool with_schema_version) {
  auto result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(result.has_value());
  auto db = result.value();
  REQUIRE(db->exec("CREATE TABLE audit_events (event_id TEXT, trace_id TEXT, idx INTEGER);"
                   "INSERT INTO audit_events VALUES ('evt-2', 't', 0), ('evt-1', 't', 1);")
              .has_value());
  if (with_schema_version) {
    REQUIRE(db->exec("CREATE TABLE schema_version (version INTEGER PRIMARY KEY, applied_at TEXT);"
                     "INSERT INTO schema_version VALUES (1, '2026-01-01');")
                .has_value());
  }
  return db;
}

TEST_CASE("SqliteDb rejects an audit_events table with another layout", "[audit_log][sqlite]") {
  SECTION("schema_version already records v1") {
    auto db = make_foreign_db(true);
    CHECK(db->schema_version() == 1);
    const auto schema = db->ensure_schema_v1();
    REQUIRE_FALSE(schema.has_value());
    CHECK(schema.error().find("topic") != std::string::npos);
  }

  SECTION("no schema_version table") {
    auto db = make_foreign_db(false);
    CHECK(db->schema_version() == 0);
    CHECK_FALSE(db->ensure_schema_v1().has_value());
  }
}

TEST_CASE("SqliteAuditLog reads fail loudly on an unreadable table", "[audit_log][sqlite]") {
  auto db = make_foreign_db(true);
  const storage::sqlite::SqliteAuditLog log(db);

  CHECK_THROWS_AS(log.query("t"), std::runtime_error);
  CHECK_THROWS_AS(log.query(""), std::runtime_error);
  CHECK_THROWS_AS(log.list_topics(), std::runtime_error);
}

TEST_CASE("SqliteDb::exec reports SQL errors", "[audit_log][sqlite]") {
  auto db = make_db();
  const auto result = db->exec("SELECT * FROM no_such_table");
  REQUIRE_FALSE(result.has_value());
  CHECK_FALSE(result.error().empty());
}

TEST_CASE("SqliteAuditLog round-trips events in append order", "[audit_log][sqlite]") {
  auto db = make_db();
  storage::sqlite::SqliteAuditLog log(db);

  log.append(make_event("10-5-0", "a"));
  log.append(make_event("10-5-1", "a"));
  log.append(make_event("11-5-0", "b"));

  const auto a = log.query("a");
  REQUIRE(a.size() == 2);
  CHECK(a[0].event_id == "evt-10-5-0");
  CHECK(a[0].topic == "a");
  CHECK(a[0].payload == "{}");
  CHECK(a[0].created_at == "2026-01-01T00:00:00Z");
  CHECK(a[1].unique_id == "10-5-1");

  CHECK(log.query("").size() == 3);
  CHECK(log.list_topics() == std::vector<std::string>{"a", "b"});
}

TEST_CASE("SqliteAuditLog rejects a duplicate id under one topic", "[audit_log][sqlite]") {
  auto db = make_db();
  storage::sqlite::SqliteAuditLog log(db);

  log.append(make_event("10-5-0"));
  CHECK_THROWS_AS(log.append(make_event("10-5-0")), std::runtime_error);

  // The failed append leaves no gap: the next event still follows the first.
  log.append(make_event("10-5-1"));
  const auto events = log.query("ids");
  REQUIRE(events.size() == 2);
  CHECK(events[1].unique_id == "10-5-1");
}

TEST_CASE("SqliteAuditLog continues an existing topic after reopening", "[audit_log][sqlite]") {
  auto db = make_db();
  {
    storage::sqlite::SqliteAuditLog log(db);
    log.append(make_event("1-1-0"));
    log.append(make_event("2-1-0"));
  }

  storage::sqlite::SqliteAuditLog reopened(db);
  reopened.append(make_event("3-1-0"));

  const auto events = reopened.query("ids");
  REQUIRE(events.size() == 3);
  CHECK(events[2].unique_id == "3-1-0");
}

TEST_CASE("AuditLogListener records every generated id", "[audit_log][listener]") {
  storage::InMemoryAuditLog log;
  core::FixedTimeSource clock(core::Timestamp(std::chrono::seconds(1767225600)));
  publish::AuditLogListener listener(log, "uuid-audit-log", clock);

  core::GeneratorOptions options;
  options.node_address = 42;
  options.time_source = &clock;
  options.listener = &listener;
  core::UuidGenerator generator(options);

  const auto first = generator.generate();
  const auto second = generator.generate();

  const auto events = log.query("uuid-audit-log");
  REQUIRE(events.size() == 2);
  CHECK(events[0].unique_id == first.to_string());
  CHECK(events[1].unique_id == second.to_string());
  CHECK(events[0].event_id == "evt-" + first.to_string());
  CHECK(events[0].created_at == "2026-01-01T00:00:00Z");

  const auto payload = nlohmann::json::parse(events[1].payload);
  CHECK(payload.at("unique_id") == second.to_string());
  CHECK(payload.at("node_address") == 42);
  CHECK(payload.at("sequence") == 1);
  CHECK(payload.at("timestamp") == second.timestamp());
}

TEST_CASE("AuditLogListener failures propagate out of generate", "[audit_log][listener]") {
  auto db = make_db();
  storage::sqlite::SqliteAuditLog log(db);
  core::FixedTimeSource clock(core::Timestamp(std::chrono::seconds(1)));
  publish::AuditLogListener listener(log, "ids", clock);

  // Pre-record the id the generator is about to produce.
  log.append(make_event(core::UniqueId{core::kTicksPerSecond, 7, 0}.to_string()));

  core::GeneratorOptions options;
  options.node_address = 7;
  options.time_source = &clock;
  options.listener = &listener;
  core::UuidGenerator generator(options);

  CHECK_THROWS_AS(generator.generate(), std::runtime_error);
}
