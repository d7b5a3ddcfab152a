#include "uidgen/publish/redis_config.h"

#include <charconv>
#include <string_view>
#include <system_error>

namespace uidgen::publish {

namespace {

constexpr std::string_view kTcpScheme = "tcp://";
constexpr std::string_view kRedisScheme = "redis://";

// Parses a non-empty run of decimal digits; rejects signs, spaces and trailing text.
std::optional<int> parse_decimal(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  int value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size() || value < 0) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<RedisConfig> parse_redis_uri(const std::string& uri) {
  std::string_view rest{uri};
  bool allows_database = false;

  if (rest.starts_with(kTcpScheme)) {
    rest.remove_prefix(kTcpScheme.size());
  } else if (rest.starts_with(kRedisScheme)) {
    rest.remove_prefix(kRedisScheme.size());
    allows_database = true;
  } else {
    return std::nullopt;
  }

  RedisConfig config;
  config.uri = uri;

  if (const auto slash = rest.find('/'); slash != std::string_view::npos) {
    if (!allows_database) {
      return std::nullopt;
    }
    const auto database = parse_decimal(rest.substr(slash + 1));
    if (!database.has_value()) {
      return std::nullopt;
    }
    config.database = *database;
    rest = rest.substr(0, slash);
  }

  if (const auto colon = rest.rfind(':'); colon != std::string_view::npos) {
    const auto port = parse_decimal(rest.substr(colon + 1));
    if (!port.has_value() || *port < 1 || *port > 65535) {
      return std::nullopt;
    }
    config.port = *port;
    rest = rest.substr(0, colon);
  }

  if (rest.empty()) {
    return std::nullopt;
  }
  config.host = std::string{rest};

  return config;
}

std::string redis_connection_uri(const RedisConfig& config) {
  return "tcp://" + config.host + ":" + std::to_string(config.port) + "/" +
         std::to_string(config.database);
}

std::string redis_config_to_log_string(const RedisConfig& config) {
  std::string out = config.host + ":" + std::to_string(config.port);
  if (config.database != 0) {
    out += "/" + std::to_string(config.database);
  }
  return out;
}

}  // namespace uidgen::publish
