#include "generate_config.h"

#include "uidgen/publish/redis_config.h"

#include "shared/arg_parser.h"
#include <charconv>
#include <system_error>
#include <vector>

namespace uidgen::cli {

namespace {

// Whole-string signed decimal parse.
template <typename Int>
std::optional<Int> parse_integer(const std::string& value) {
  Int out{};
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
  if (value.empty() || ec != std::errc{} || ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  return out;
}

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

std::string handle_count(GenerateConfig& config, const std::string& value) {
  const auto count = parse_integer<long long>(value);
  if (!count.has_value()) {
    return "Invalid --count: " + value + " (expected a positive integer)";
  }
  config.count = *count;
  return "";
}

std::string handle_node_address(GenerateConfig& config, const std::string& value) {
  const auto node = parse_integer<std::int64_t>(value);
  if (!node.has_value()) {
    return "Invalid --node-address: " + value + " (expected a signed 64-bit integer)";
  }
  config.node_address = *node;
  return "";
}

std::string handle_format(GenerateConfig& config, const std::string& value) {
  if (value == "text") {
    config.format = OutputFormat::kText;
    return "";
  }
  if (value == "json") {
    config.format = OutputFormat::kJson;
    return "";
  }
  return "Invalid --format: " + value + " (valid: text, json)";
}

std::string handle_db(GenerateConfig& config, const std::string& value) {
  config.db_path = value;
  return "";
}

std::string handle_redis(GenerateConfig& config, const std::string& value) {
  config.redis_uri = value;
  return "";
}

std::string handle_topic(GenerateConfig& config, const std::string& value) {
  config.topic = value;
  return "";
}

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<GenerateConfig>> build_option_registry() {
  return {
      {"--count", true, "Number of identifiers to generate (default 1)", handle_count},
      {"--node-address", true, "Pin the node address instead of the host default",
       handle_node_address},
      {"--format", true, "Output format (text|json)", handle_format},
      {"--db", true, "Record each identifier in this SQLite audit log", handle_db},
      {"--redis", true, "Publish each identifier to this Redis URI", handle_redis},
      {"--topic", true, "Audit topic / Redis channel (default uuid-audit-log)", handle_topic},
  };
}

}  // namespace

core::Result<GenerateConfig, std::string> parse_generate_args(int argc, char* argv[]) {
  return apps::parse_options(argc, argv, build_option_registry(), 2, GenerateConfig{});
}

std::string generate_usage() {
  return "Usage: uidgen_cli generate [options]\n" + apps::format_usage(build_option_registry());
}

std::string validate_generate_config(const GenerateConfig& config) {
  if (config.count < 1) {
    return "Error: --count must be at least 1 (got " + std::to_string(config.count) + ")";
  }

  if (config.topic.empty()) {
    return "Error: --topic must not be empty";
  }

  if (config.redis_uri.has_value() &&
      !publish::parse_redis_uri(config.redis_uri.value()).has_value()) {
    return "Error: --redis URI '" + config.redis_uri.value() +
           "' is not a valid Redis URI.\n"
           "       Accepted formats: tcp://host:port, redis://host:port[/N], tcp://host";
  }

  return "";
}

}  // namespace uidgen::cli
