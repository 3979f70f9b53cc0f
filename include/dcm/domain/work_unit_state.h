#pragma once

#include "dcm/core/clock.h"
#include "dcm/core/date.h"
#include "dcm/domain/file_category.h"
#include "dcm/domain/work_unit.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dcm::domain {

enum class CompletionStatus {
  kPending,             // no required category satisfied
  kPartiallySatisfied,  // some but not all required categories satisfied
  kSatisfied,           // every required category satisfied; terminal for the period
};

[[nodiscard]] std::string_view to_string(CompletionStatus status);

enum class SatisfactionSource {
  kLive,      // resolved from a file-created event
  kBackfill,  // recovered by historical search at period end
};

[[nodiscard]] std::string_view to_string(SatisfactionSource source);

struct CategorySlot {
  bool satisfied{false};
  std::string last_filename;
  std::string last_path;
  std::optional<core::Date> resolved_date;
  SatisfactionSource source{SatisfactionSource::kLive};
  std::optional<core::Timestamp> updated_at;
};

// SlotUpdate reports what record() did to a category slot.
enum class SlotUpdate {
  kNewlySatisfied,  // slot went from unsatisfied to satisfied
  kRefreshed,       // slot was already satisfied; only last file details changed
};

// WorkUnitState tracks, for one work unit and one collection period, which file
// categories have been satisfied.
//
// Invariants:
// - A satisfied slot never becomes unsatisfied (monotonic).
// - status() is derived from the slots of required categories only.
// - Recording the same file twice leaves the state equal to recording it once.
class WorkUnitState {
 public:
  WorkUnitState(WorkUnitIdentity identity, std::vector<FileCategory> required_categories);

  [[nodiscard]] const WorkUnitIdentity& identity() const { return identity_; }
  [[nodiscard]] const std::vector<FileCategory>& required_categories() const {
    return required_;
  }

  [[nodiscard]] CompletionStatus status() const;
  [[nodiscard]] bool is_satisfied(FileCategory category) const;
  [[nodiscard]] const CategorySlot& slot(FileCategory category) const;

  // Required categories not yet satisfied, in kAllFileCategories order.
  [[nodiscard]] std::vector<FileCategory> outstanding() const;

  [[nodiscard]] std::optional<core::Timestamp> last_updated() const { return last_updated_; }

  SlotUpdate record(FileCategory category, const std::string& path, const core::Date& file_date,
                    SatisfactionSource source, core::Timestamp at);

 private:
  WorkUnitIdentity identity_;
  std::vector<FileCategory> required_;
  std::map<FileCategory, CategorySlot> slots_;
  std::optional<core::Timestamp> last_updated_;
};

}  // namespace dcm::domain
