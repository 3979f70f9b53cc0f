#include "dcm/domain/work_unit_state.h"

#include <algorithm>
#include <filesystem>

namespace dcm::domain {

std::string_view to_string(CompletionStatus status) {
  switch (status) {
    case CompletionStatus::kPending:
      return "pending";
    case CompletionStatus::kPartiallySatisfied:
      return "partially_satisfied";
    case CompletionStatus::kSatisfied:
      return "satisfied";
  }
  return "unknown";
}

std::string_view to_string(SatisfactionSource source) {
  switch (source) {
    case SatisfactionSource::kLive:
      return "live";
    case SatisfactionSource::kBackfill:
      return "backfill";
  }
  return "unknown";
}

WorkUnitState::WorkUnitState(WorkUnitIdentity identity,
                             std::vector<FileCategory> required_categories)
    : identity_(std::move(identity)), required_(std::move(required_categories)) {
  for (const auto category : kAllFileCategories) {
    slots_.emplace(category, CategorySlot{});
  }
}

CompletionStatus WorkUnitState::status() const {
  const auto satisfied = static_cast<std::size_t>(std::count_if(
      required_.begin(), required_.end(), [this](FileCategory c) { return is_satisfied(c); }));

  if (satisfied == required_.size()) {
    return CompletionStatus::kSatisfied;
  }
  if (satisfied == 0) {
    return CompletionStatus::kPending;
  }
  return CompletionStatus::kPartiallySatisfied;
}

bool WorkUnitState::is_satisfied(FileCategory category) const {
  return slots_.at(category).satisfied;
}

const CategorySlot& WorkUnitState::slot(FileCategory category) const {
  return slots_.at(category);
}

std::vector<FileCategory> WorkUnitState::outstanding() const {
  std::vector<FileCategory> result;
  for (const auto category : kAllFileCategories) {
    const bool required = std::find(required_.begin(), required_.end(), category) != required_.end();
    if (required && !is_satisfied(category)) {
      result.push_back(category);
    }
  }
  return result;
}

SlotUpdate WorkUnitState::record(FileCategory category, const std::string& path,
                                 const core::Date& file_date, SatisfactionSource source,
                                 core::Timestamp at) {
  auto& slot = slots_.at(category);
  const bool was_satisfied = slot.satisfied;

  slot.satisfied = true;
  slot.last_path = path;
  slot.last_filename = std::filesystem::path(path).filename().string();
  slot.resolved_date = file_date;
  slot.source = source;
  slot.updated_at = at;
  last_updated_ = at;

  return was_satisfied ? SlotUpdate::kRefreshed : SlotUpdate::kNewlySatisfied;
}

}  // namespace dcm::domain
