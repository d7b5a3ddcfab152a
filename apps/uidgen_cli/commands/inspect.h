#pragma once

// cmd_parse: parse a canonical id and print its fields as JSON.
// Usage: uidgen_cli parse <id>
int cmd_parse(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_node_address: print the node address a default generator would use.
int cmd_node_address();

// cmd_version: print the build version.
int cmd_version();
