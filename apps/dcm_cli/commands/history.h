#pragma once

// cmd_history: find the most recent file that satisfied a unit's category.
// Usage: dcm_cli history --config <json> --root <dir> --unit <identifier>
//                        --category finished|planned [--date <YYYY-MM-DD>]
int cmd_history(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
