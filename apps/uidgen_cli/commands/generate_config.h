#pragma once

#include "uidgen/core/result.h"
#include "uidgen/storage/audit_log.h"

#include <cstdint>
#include <optional>
#include <string>

namespace uidgen::cli {

enum class OutputFormat {
  kText,  // NOLINT(readability-identifier-naming)
  kJson,  // NOLINT(readability-identifier-naming)
};

// GenerateConfig holds the parsed flags of `uidgen_cli generate`.
// Every field has an explicit default; optional fields mean "not configured".
struct GenerateConfig {
  long long count{1};                        // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> node_address;  // NOLINT(readability-identifier-naming)
  OutputFormat format{OutputFormat::kText};  // NOLINT(readability-identifier-naming)
  std::optional<std::string> db_path;        // NOLINT(readability-identifier-naming)
  std::optional<std::string> redis_uri;      // NOLINT(readability-identifier-naming)
  std::string topic{storage::kDefaultAuditTopic};  // NOLINT(readability-identifier-naming)
};

// parse_generate_args reads argv[2..argc-1] (argv[1] is the subcommand name).
[[nodiscard]] core::Result<GenerateConfig, std::string> parse_generate_args(
    int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// usage text listing every generate flag
[[nodiscard]] std::string generate_usage();

// validate_generate_config checks startup preconditions.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - count is positive
// - topic is non-empty
// - if redis_uri is present, parse_redis_uri() must succeed
[[nodiscard]] std::string validate_generate_config(const GenerateConfig& config);

}  // namespace uidgen::cli
