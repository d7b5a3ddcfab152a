#include "verify.h"

#include "uidgen/storage/audit_log.h"
#include "uidgen/storage/sqlite/sqlite_audit_log.h"
#include "uidgen/storage/sqlite/sqlite_db.h"

#include "shared/arg_parser.h"
#include "verify_logic.h"
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct VerifyCliConfig {
  std::optional<std::string> db_path;                      // NOLINT(readability-identifier-naming)
  std::string topic{uidgen::storage::kDefaultAuditTopic};  // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_verify(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<uidgen::apps::Option<VerifyCliConfig>> options = {
      {"--db", true, "Path to SQLite audit database",
       [](VerifyCliConfig& c, const std::string& v) {
         c.db_path = v;
         return std::string{};
       }},
      {"--topic", true, "Audit topic to verify (default uuid-audit-log)",
       [](VerifyCliConfig& c, const std::string& v) {
         c.topic = v;
         return std::string{};
       }},
  };
  const auto parsed = uidgen::apps::parse_options(argc, argv, options, 2);
  if (!parsed.has_value()) {
    std::cerr << "Error: " << parsed.error() << "\n";
    return 1;
  }
  const VerifyCliConfig& config = parsed.value();

  if (!config.db_path.has_value()) {
    std::cerr << "Error: --db <path> is required\n";
    return 1;
  }

  auto db_result = uidgen::storage::sqlite::SqliteDb::open(config.db_path.value());
  if (!db_result.has_value()) {
    std::cerr << db_result.error() << "\n";
    return 1;
  }
  auto db = db_result.value();
  auto schema_result = db->ensure_schema_v1();
  if (!schema_result.has_value()) {
    std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
    return 1;
  }

  try {
    const uidgen::storage::sqlite::SqliteAuditLog audit_log(db);
    return uidgen::cli::execute_verify(config.topic, audit_log, std::cout, std::cerr);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
