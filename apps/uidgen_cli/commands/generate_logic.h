#pragma once

#include "uidgen/core/uuid_generator.h"

#include "generate_config.h"
#include <iosfwd>

namespace uidgen::cli {

// execute_generate calls generator.generate() `count` times and writes the identifiers
// to out: one canonical id per line (kText) or a JSON array of
// {"node_address","sequence","timestamp","unique_id"} objects (kJson).
//
// Listener failures (audit log, Redis) propagate out of this function.
// Takes only the generator; composition of listeners happens in cmd_generate.
int execute_generate(long long count, OutputFormat format, core::UuidGenerator& generator,
                     std::ostream& out);

}  // namespace uidgen::cli
