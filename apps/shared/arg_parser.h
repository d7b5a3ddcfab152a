#pragma once

#include "uidgen/core/result.h"

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace uidgen::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns "" on success or an error message describing the rejected value.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<std::string(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag to its
// handler, and returns the populated config.
//
// Fails on the first unknown flag, missing flag value, or handler error.
// Non-flag tokens are skipped so callers can read positional arguments themselves.
template <typename Config>
core::Result<Config, std::string> parse_options(
    int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
    const std::vector<Option<Config>>& options, int start = 1, Config default_config = {}) {
  using ParseResult = core::Result<Config, std::string>;
  Config config = std::move(default_config);

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    const auto it = option_map.find(arg);
    if (it == option_map.end()) {
      if (!arg.empty() && arg[0] == '-') {
        return ParseResult::err("Unknown option: " + arg);
      }
      continue;
    }

    const Option<Config>* opt = it->second;
    std::string value;
    if (opt->requires_value) {
      if (i + 1 >= argc) {
        return ParseResult::err("Option " + arg + " requires a value");
      }
      value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    const std::string error = opt->handler(config, value);
    if (!error.empty()) {
      return ParseResult::err(error);
    }
  }

  return ParseResult::ok(std::move(config));
}

// format_usage renders one line per option: "  --name <value>  description".
template <typename Config>
std::string format_usage(const std::vector<Option<Config>>& options) {
  std::string out;
  for (const auto& opt : options) {
    out += "  " + opt.name + (opt.requires_value ? " <value>" : "") + "  " + opt.description + "\n";
  }
  return out;
}

}  // namespace uidgen::apps
