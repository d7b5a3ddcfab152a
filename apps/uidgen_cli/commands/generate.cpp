#include "generate.h"

#include "uidgen/core/listener.h"
#include "uidgen/core/time_source.h"
#include "uidgen/core/uuid_generator.h"
#include "uidgen/publish/audit_log_listener.h"
#include "uidgen/publish/redis_config.h"
#include "uidgen/publish/redis_publisher.h"
#include "uidgen/storage/sqlite/sqlite_audit_log.h"
#include "uidgen/storage/sqlite/sqlite_db.h"

#include "generate_config.h"
#include "generate_logic.h"
#include <exception>
#include <iostream>
#include <memory>
#include <string>

int cmd_generate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  using namespace uidgen;

  if (argc > 2 && std::string(argv[2]) == "--help") {  // NOLINT
    std::cout << cli::generate_usage();
    return 0;
  }

  const auto parsed = cli::parse_generate_args(argc, argv);
  if (!parsed.has_value()) {
    std::cerr << "Error: " << parsed.error() << "\n" << cli::generate_usage();
    return 1;
  }
  const cli::GenerateConfig& config = parsed.value();

  // Validate before emitting any diagnostics so no partial messages appear on error.
  const std::string config_error = cli::validate_generate_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  core::SystemTimeSource time_source;
  core::CompositeListener listeners;

  // ── Audit log ────────────────────────────────────────────────────────────
  std::unique_ptr<storage::sqlite::SqliteAuditLog> audit_log;
  std::unique_ptr<publish::AuditLogListener> audit_listener;
  if (config.db_path.has_value()) {
    auto db_result = storage::sqlite::SqliteDb::open(config.db_path.value());
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

    audit_log = std::make_unique<storage::sqlite::SqliteAuditLog>(db);
    audit_listener =
        std::make_unique<publish::AuditLogListener>(*audit_log, config.topic, time_source);
    listeners.add(*audit_listener);
    std::cerr << "Audit log:   SQLite -- " << config.db_path.value() << " (topic "
              << config.topic << ")\n";
  }

  // ── Redis publisher ──────────────────────────────────────────────────────
  std::unique_ptr<publish::RedisPublisher> publisher;
  if (config.redis_uri.has_value()) {
    // Format was validated above.
    const auto redis_config = publish::parse_redis_uri(config.redis_uri.value()).value();
    try {
      publisher = std::make_unique<publish::RedisPublisher>(redis_config, config.topic);
    } catch (const std::exception& e) {
      std::cerr << "Error: " << e.what() << "\n";
      return 1;
    }
    listeners.add(*publisher);
    std::cerr << "Publisher:   Redis -- " << publish::redis_config_to_log_string(redis_config)
              << " (channel " << config.topic << ")\n";
  }

  core::GeneratorOptions options;
  options.node_address = config.node_address;
  options.time_source = &time_source;
  options.listener = listeners.empty() ? nullptr : &listeners;
  core::UuidGenerator generator(options);

  if (config.node_address.has_value()) {
    std::cerr << "Node:        " << generator.node_address() << " (pinned)\n";
  } else {
    std::cerr << "Node:        " << generator.node_address() << " (host default)\n";
  }

  try {
    const int rc = cli::execute_generate(config.count, config.format, generator, std::cout);
    if (publisher) {
      std::cerr << "Published " << publisher->published() << " ids ("
                << publisher->deliveries() << " subscriber deliveries)\n";
    }
    return rc;
  } catch (const std::exception& e) {
    std::cerr << "Error: generation aborted: " << e.what() << "\n";
    return 1;
  }
}
