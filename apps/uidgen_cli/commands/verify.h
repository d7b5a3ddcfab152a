#pragma once

// cmd_verify: check that the ids recorded under a topic are unique and increasing.
// Usage: uidgen_cli verify --db <db-path> [--topic <name>]
int cmd_verify(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
