#pragma once

// cmd_match: score arbitrary strings against a candidate list (and optionally
// the date pattern) and print per-target outcomes plus a best-first ranking.
// Usage: dcm_cli match --candidates <a,b,...> [--strategy exact|fuzzy|hybrid]
//                      [--exact-mode contains|equals|suffix]
//                      [--fuzzy-mode whole|prefix|token] [--threshold <0..1>]
//                      [--with-date] [--min-score <0..1>] <input>...
int cmd_match(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
