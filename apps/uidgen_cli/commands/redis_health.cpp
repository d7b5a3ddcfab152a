#include "redis_health.h"

#include "uidgen/publish/redis_config.h"
#include "uidgen/publish/redis_health.h"

#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct RedisHealthCliConfig {
  std::optional<std::string> redis_uri;  // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_redis_health(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<uidgen::apps::Option<RedisHealthCliConfig>> options = {
      {"--redis", true, "Redis URI (e.g. tcp://127.0.0.1:6379)",
       [](RedisHealthCliConfig& c, const std::string& v) {
         c.redis_uri = v;
         return std::string{};
       }},
  };
  const auto parsed = uidgen::apps::parse_options(argc, argv, options, 2);
  if (!parsed.has_value()) {
    std::cerr << "Error: " << parsed.error() << "\n";
    return 1;
  }

  const auto& redis_uri = parsed.value().redis_uri;
  if (!redis_uri.has_value()) {
    std::cerr << "Error: --redis <uri> is required\n";
    return 1;
  }

  const auto redis_config = uidgen::publish::parse_redis_uri(redis_uri.value());
  if (!redis_config.has_value()) {
    std::cerr << "Error: invalid Redis URI '" << redis_uri.value() << "'\n"
              << "Accepted formats: tcp://host:port, redis://host:port[/N], tcp://host\n";
    return 1;
  }

  const auto result = uidgen::publish::redis_ping(redis_config.value());
  if (result.reachable) {
    std::cout << "OK: Redis reachable at "
              << uidgen::publish::redis_config_to_log_string(redis_config.value()) << "\n";
    return 0;
  }

  std::cerr << "ERROR: " << result.error << "\n";
  return 1;
}
