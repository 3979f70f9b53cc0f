#pragma once

#include "dcm/core/date.h"
#include "dcm/core/result.h"
#include "dcm/domain/file_category.h"
#include "dcm/domain/work_unit.h"
#include "dcm/history/historical_search.h"
#include "dcm/matching/target.h"
#include "dcm/resolve/identity_resolver.h"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dcm::apps {

// ReferenceConfig is the period's reference data and policy, loaded from JSON:
//
// {
//   "work_units": [{"identifier": "MAHROUS", "team_number": "317",
//                   "aliases": ["Mahrous"], "leaders": ["..."], "sheet_id": "..."}],
//   "extensions": [".kmz"],
//   "categories": {"finished": {"keywords": [...]}, "planned": {"keywords": [...]}},
//   "fuzzy_threshold": 0.65,
//   "lookback_days": 30,
//   "planned_lookahead_days": 5,
//   "deadline": "20:30",
//   "status_interval_seconds": 300,
//   "urgent_hour": 19,
//   "urgent_remaining_threshold": 5,
//   "historical_workers": 1
// }
//
// Only work_units is required; every other key falls back to the default below.
struct ReferenceConfig {
  std::vector<domain::WorkUnitIdentity> work_units;           // NOLINT(readability-identifier-naming)
  std::vector<std::string> extensions{".kmz"};                // NOLINT(readability-identifier-naming)
  domain::CategoryVocabulary vocabulary{                      // NOLINT(readability-identifier-naming)
                                        domain::CategoryVocabulary::defaults()};
  double fuzzy_threshold{matching::kDefaultFuzzyThreshold};   // NOLINT(readability-identifier-naming)
  int lookback_days{30};                                      // NOLINT(readability-identifier-naming)
  int planned_lookahead_days{5};                              // NOLINT(readability-identifier-naming)
  int deadline_hour{20};                                      // NOLINT(readability-identifier-naming)
  int deadline_minute{30};                                    // NOLINT(readability-identifier-naming)
  int status_interval_seconds{300};                           // NOLINT(readability-identifier-naming)
  std::optional<int> urgent_hour{19};                         // NOLINT(readability-identifier-naming)
  std::size_t urgent_remaining_threshold{5};                  // NOLINT(readability-identifier-naming)
  unsigned historical_workers{1};                             // NOLINT(readability-identifier-naming)
};

// Returns the parsed config, or a message naming the offending key.
[[nodiscard]] core::Result<ReferenceConfig, std::string> parse_reference_config(
    const std::string& json_text);

[[nodiscard]] core::Result<ReferenceConfig, std::string> load_reference_config(
    const std::filesystem::path& path);

// Parses "HH:MM" (24-hour clock).
[[nodiscard]] std::optional<std::pair<int, int>> parse_clock_time(const std::string& text);

// Returns "" when the reference data can drive a resolver, else the first problem.
[[nodiscard]] std::string validate_reference_config(const ReferenceConfig& config);

[[nodiscard]] resolve::ResolverConfig make_resolver_config(const ReferenceConfig& config,
                                                           const core::Date& period_date);

[[nodiscard]] history::HistoricalSearchOptions make_history_options(const ReferenceConfig& config);

}  // namespace dcm::apps
