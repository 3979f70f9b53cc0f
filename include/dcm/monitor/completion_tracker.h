#pragma once

#include "dcm/core/clock.h"
#include "dcm/core/date.h"
#include "dcm/core/ids.h"
#include "dcm/domain/file_category.h"
#include "dcm/domain/work_unit.h"
#include "dcm/domain/work_unit_state.h"
#include "dcm/resolve/resolution.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace dcm::monitor {

// TransitionOutcome describes what a tracker update did to a work unit.
enum class TransitionOutcome {
  kApplied,      // a category went from unsatisfied to satisfied
  kRefreshed,    // category was already satisfied; last file details updated
  kUnknownUnit,  // unit is not in the listing; nothing changed
};

[[nodiscard]] std::string_view to_string(TransitionOutcome outcome);

struct TransitionResult {
  TransitionOutcome outcome{TransitionOutcome::kUnknownUnit};
  domain::CompletionStatus before_state{domain::CompletionStatus::kPending};
  domain::CompletionStatus after_state{domain::CompletionStatus::kPending};
  int64_t transition_index{0};  // per unit; advances on kApplied only
  std::string error_message;    // populated for kUnknownUnit
};

// CompletionTracker owns the WorkUnitState of every listed unit for one period.
//
// Thread-safety: none. The monitor's dispatch thread is the only writer.
// Determinism: states() lists units in listing order.
class CompletionTracker {
 public:
  CompletionTracker(const std::vector<domain::WorkUnitIdentity>& roster,
                    std::vector<domain::FileCategory> required_categories);

  TransitionResult apply(const resolve::ResolvedFile& resolution, const std::string& path,
                         core::Timestamp at);

  TransitionResult apply_backfill(const core::WorkUnitId& unit, domain::FileCategory category,
                                  const std::string& path, const core::Date& file_date,
                                  core::Timestamp at);

  [[nodiscard]] const domain::WorkUnitState* find(const core::WorkUnitId& unit) const;
  [[nodiscard]] const std::vector<domain::WorkUnitState>& states() const { return states_; }
  [[nodiscard]] const std::vector<domain::FileCategory>& required_categories() const {
    return required_;
  }

  [[nodiscard]] bool all_satisfied() const;
  [[nodiscard]] std::size_t satisfied_count() const;
  [[nodiscard]] int64_t transition_index(const core::WorkUnitId& unit) const;

 private:
  TransitionResult record(const core::WorkUnitId& unit, domain::FileCategory category,
                          const std::string& path, const core::Date& file_date,
                          domain::SatisfactionSource source, core::Timestamp at);

  std::vector<domain::FileCategory> required_;
  std::vector<domain::WorkUnitState> states_;
  std::map<std::string, std::size_t> index_by_unit_;     // key: unit id value
  std::map<std::string, int64_t> transition_index_;      // key: unit id value
};

}  // namespace dcm::monitor
