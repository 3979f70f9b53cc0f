#pragma once

// cmd_resolve: resolve filenames against the work-unit listing and print JSON.
// Usage: dcm_cli resolve --config <json> [--date <YYYY-MM-DD>] <filename>...
int cmd_resolve(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
