#pragma once

#include "uidgen/publish/redis_config.h"

#include <string>

namespace uidgen::publish {

// RedisHealthResult holds the outcome of a redis_ping() call.
struct RedisHealthResult {
  bool reachable{false};  // NOLINT(readability-identifier-naming)
  std::string error;      // NOLINT(readability-identifier-naming)
};

// redis_ping opens a short-lived connection to config and sends PING.
// Never throws; errors are reported in RedisHealthResult.error.
[[nodiscard]] RedisHealthResult redis_ping(const RedisConfig& config);

}  // namespace uidgen::publish
