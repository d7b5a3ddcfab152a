#pragma once

// cmd_generate: mint identifiers and print them.
// Usage: uidgen_cli generate [--count N] [--node-address X] [--format text|json]
//                            [--db <db-path>] [--redis <uri>] [--topic <name>]
// With --db every id is recorded in the SQLite audit log under --topic;
// with --redis every id is PUBLISHed on the --topic channel.
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
