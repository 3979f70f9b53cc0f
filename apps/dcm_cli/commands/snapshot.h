#pragma once

// cmd_snapshot: print the stored end-of-period snapshot.
// Usage: dcm_cli snapshot --db <path> --date <YYYY-MM-DD>
int cmd_snapshot(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
