#pragma once

#include <optional>
#include <string>

namespace uidgen::publish {

// RedisConfig is a parsed Redis endpoint.
//
// Accepted URI forms:
//   tcp://host            port 6379, database 0
//   tcp://host:port
//   redis://host:port
//   redis://host:port/N   database N (redis:// only)
struct RedisConfig {
  std::string uri;   // NOLINT(readability-identifier-naming)
  std::string host;  // NOLINT(readability-identifier-naming)
  int port{6379};    // NOLINT(readability-identifier-naming)
  int database{0};   // NOLINT(readability-identifier-naming)
};

// parse_redis_uri returns the parsed endpoint, or nullopt when the scheme is not
// tcp:// or redis://, the host is empty, the port is not in [1, 65535], or the
// database suffix is not a non-negative integer.
[[nodiscard]] std::optional<RedisConfig> parse_redis_uri(const std::string& uri);

// redis_connection_uri renders a config as the "tcp://host:port/N" form redis++ accepts.
[[nodiscard]] std::string redis_connection_uri(const RedisConfig& config);

// redis_config_to_log_string renders "host:port" (plus "/N" for a non-zero database)
// for startup diagnostics.
[[nodiscard]] std::string redis_config_to_log_string(const RedisConfig& config);

}  // namespace uidgen::publish
