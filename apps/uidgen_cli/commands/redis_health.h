#pragma once

// cmd_redis_health: PING a Redis endpoint and report reachability.
// Usage: uidgen_cli redis-health --redis <uri>
int cmd_redis_health(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
