#pragma once

#include "dcm/core/clock.h"
#include "dcm/core/date.h"
#include "dcm/domain/work_unit_state.h"

#include <optional>
#include <string>
#include <vector>

namespace dcm::domain {

// PeriodSnapshot is the end-of-period satisfaction record handed to report
// collaborators and persisted by the snapshot store. Every category line has a
// `detail` that is one of:
//   <satisfying file path>
//   "backfilled from historical search on <YYYY-MM-DD>"
//   "unsatisfied"
struct CategoryEntry {
  std::string category;                  // NOLINT(readability-identifier-naming)
  bool satisfied{false};                 // NOLINT(readability-identifier-naming)
  std::string source;                    // NOLINT(readability-identifier-naming)
  std::string detail;                    // NOLINT(readability-identifier-naming)
  std::optional<std::string> path;       // NOLINT(readability-identifier-naming)
  std::optional<std::string> file_date;  // NOLINT(readability-identifier-naming)
};

struct UnitEntry {
  std::string unit;                       // NOLINT(readability-identifier-naming)
  std::string team_number;                // NOLINT(readability-identifier-naming)
  std::string status;                     // NOLINT(readability-identifier-naming)
  std::vector<CategoryEntry> categories;  // NOLINT(readability-identifier-naming)
};

struct PeriodSnapshot {
  int snapshot_format_version{1};  // NOLINT(readability-identifier-naming)
  std::string period_date;         // NOLINT(readability-identifier-naming)
  std::string finished_at;         // NOLINT(readability-identifier-naming)
  std::string end_reason;          // NOLINT(readability-identifier-naming)
  std::vector<UnitEntry> units;    // NOLINT(readability-identifier-naming)
};

constexpr const char* kUnsatisfiedDetail = "unsatisfied";

// describe_slot renders the snapshot detail text for one category slot.
[[nodiscard]] std::string describe_slot(const CategorySlot& slot);

// make_period_snapshot lists units in the order given, categories in
// kAllFileCategories order (required categories only).
[[nodiscard]] PeriodSnapshot make_period_snapshot(const std::vector<WorkUnitState>& states,
                                                  const core::Date& period_date,
                                                  core::Timestamp finished_at,
                                                  const std::string& end_reason);

// to_json serializes a PeriodSnapshot. Object keys sort alphabetically, so the
// output is deterministic for the same input.
[[nodiscard]] std::string to_json(const PeriodSnapshot& snapshot);

// period_snapshot_from_json throws nlohmann::json::exception on malformed input, missing
// fields or wrong types.
[[nodiscard]] PeriodSnapshot period_snapshot_from_json(const std::string& json_str);

}  // namespace dcm::domain
