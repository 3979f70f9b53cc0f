#pragma once

#include "dcm/core/date.h"
#include "dcm/core/ids.h"
#include "dcm/domain/file_category.h"
#include "dcm/history/folder_layout.h"
#include "dcm/resolve/identity_resolver.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dcm::history {

enum class LookupStrategy {
  kExact,
  kFuzzy,
  kNone,
};

[[nodiscard]] std::string_view to_string(LookupStrategy strategy);

// HistoricalLookupResult is a complete answer even when nothing was found:
// kNone with a reason means "no data in the window", which is distinct from a
// filesystem failure (those are listed in scan_errors).
struct HistoricalLookupResult {
  std::optional<std::filesystem::path> path;
  LookupStrategy strategy{LookupStrategy::kNone};
  std::optional<core::Date> effective_date;  // parsed from the filename
  std::optional<core::Date> folder_date;     // day folder the file was found under
  double score{0.0};
  std::string reason;
  std::vector<std::string> scan_errors;

  [[nodiscard]] bool found() const { return path.has_value(); }
};

struct HistoricalSearchOptions {
  int lookback_days{30};
  unsigned worker_threads{1};  // > 1 fans the fuzzy scan out over std::async tasks
};

// HistoricalSearch finds the most recent file that satisfied (unit, category)
// on or before a given day.
//
// Exact phase: for each filename date d from up_to back through the window,
// look for the expected canonical name in every day folder of the window.
// The first hit wins.
//
// Fuzzy phase (only when the exact phase found nothing): read every file under
// the window's day folders, keep those the resolver identifies as the same
// unit and category, and pick the latest date embedded in the filename. The
// folder date is ignored for ranking, so a file stored under the wrong day is
// still dated correctly. Equal dates prefer the lexically later filename.
//
// The resolver is borrowed and must outlive the search.
class HistoricalSearch {
 public:
  HistoricalSearch(const resolve::IdentityResolver& resolver, FolderLayout layout,
                   HistoricalSearchOptions options = HistoricalSearchOptions{});

  // latest_accepted caps the filename date of fuzzy candidates; defaults to up_to.
  // earliest_accepted, when set, is a floor on the filename date in both phases:
  // the exact walk stops there and older fuzzy candidates are dropped. Without
  // it a file sitting in a window folder counts even when its filename carries
  // an older date.
  [[nodiscard]] HistoricalLookupResult find_last_satisfying(
      const core::WorkUnitId& unit, domain::FileCategory category, const core::Date& up_to,
      std::optional<core::Date> latest_accepted = std::nullopt,
      std::optional<core::Date> earliest_accepted = std::nullopt) const;

  // Period-level lookup used at the deadline: searches up to the last day the
  // resolver's accepted range for `category` allows (period_date when the
  // category has no range). Planned routes must also be dated on or after the
  // first day of their range; finished observations keep an open floor.
  [[nodiscard]] HistoricalLookupResult find_for_period(const core::WorkUnitId& unit,
                                                       domain::FileCategory category,
                                                       const core::Date& period_date) const;

  [[nodiscard]] const resolve::IdentityResolver& resolver() const { return resolver_; }
  [[nodiscard]] const FolderLayout& layout() const { return layout_; }
  [[nodiscard]] const HistoricalSearchOptions& options() const { return options_; }

 private:
  struct Candidate {
    std::filesystem::path path;
    std::string filename;
    core::Date file_date;
    core::Date folder_date;
    double score{0.0};
  };

  struct ScanBatch {
    std::vector<Candidate> candidates;
    std::vector<std::string> errors;
  };

  [[nodiscard]] std::optional<HistoricalLookupResult> exact_phase(
      const core::WorkUnitId& unit, domain::FileCategory category, const core::Date& up_to,
      const std::optional<core::Date>& earliest, std::vector<std::string>& errors) const;

  [[nodiscard]] ScanBatch scan_folders(const std::vector<core::Date>& folder_days,
                                       const core::WorkUnitId& unit,
                                       domain::FileCategory category,
                                       const core::Date& latest,
                                       const std::optional<core::Date>& earliest) const;

  const resolve::IdentityResolver& resolver_;
  FolderLayout layout_;
  HistoricalSearchOptions options_;
};

}  // namespace dcm::history
