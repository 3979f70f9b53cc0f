#pragma once

#include "dcm/core/date.h"
#include "dcm/core/ids.h"
#include "dcm/domain/file_category.h"
#include "dcm/matching/match_strategy.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace dcm::resolve {

// RejectionReason values are named outcomes, not failures: each tells the
// monitor exactly why a dropped file did not count. Checked in declaration order.
enum class RejectionReason {
  kUnsupportedExtension,
  kNoIdentifierMatch,
  kNoCategoryMatch,
  kNoDateFound,
  kDateOutOfRange,
};

[[nodiscard]] std::string_view to_string(RejectionReason reason);

struct Rejection {
  RejectionReason reason{RejectionReason::kNoIdentifierMatch};
  std::string filename;
  std::string detail;       // human-readable explanation; never empty
  double best_score{0.0};   // best score seen for the failing target
};

struct ResolvedFile {
  core::WorkUnitId unit;
  domain::FileCategory category{domain::FileCategory::kFinishedObservations};
  core::Date file_date;
  std::string filename;
  matching::MatchSource identifier_strategy{matching::MatchSource::kNone};
  double identifier_score{0.0};
  double overall_score{0.0};
};

// Inclusive calendar range.
struct DateRange {
  core::Date first;
  core::Date last;

  [[nodiscard]] bool contains(const core::Date& d) const { return first <= d && d <= last; }
};

// AcceptedDateRanges holds the filename-date window each category must fall in
// for the active period. A category without an entry accepts any valid date.
struct AcceptedDateRanges {
  std::map<domain::FileCategory, DateRange> by_category;

  // Finished observations must carry the period day itself; planned routes are
  // submitted ahead, dated from the next day up to `planned_lookahead_days` out.
  [[nodiscard]] static AcceptedDateRanges for_period(const core::Date& period_day,
                                                     int planned_lookahead_days);

  [[nodiscard]] std::optional<DateRange> range_for(domain::FileCategory category) const;
};

}  // namespace dcm::resolve
