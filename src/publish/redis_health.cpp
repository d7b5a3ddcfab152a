#include "uidgen/publish/redis_health.h"

#include <sw/redis++/redis++.h>

namespace uidgen::publish {

RedisHealthResult redis_ping(const RedisConfig& config) {
  try {
    sw::redis::Redis redis(redis_connection_uri(config));
    redis.ping();
    return RedisHealthResult{true, ""};
  } catch (const std::exception& e) {
    return RedisHealthResult{false, e.what()};
  }
}

}  // namespace uidgen::publish
