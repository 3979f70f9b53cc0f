#include "dcm/monitor/completion_tracker.h"

#include <algorithm>

namespace dcm::monitor {

std::string_view to_string(TransitionOutcome outcome) {
  switch (outcome) {
    case TransitionOutcome::kApplied:
      return "applied";
    case TransitionOutcome::kRefreshed:
      return "refreshed";
    case TransitionOutcome::kUnknownUnit:
      break;
  }
  return "unknown_unit";
}

CompletionTracker::CompletionTracker(const std::vector<domain::WorkUnitIdentity>& roster,
                                     std::vector<domain::FileCategory> required_categories)
    : required_(std::move(required_categories)) {
  states_.reserve(roster.size());
  for (const auto& identity : roster) {
    index_by_unit_.emplace(identity.id.value, states_.size());
    transition_index_.emplace(identity.id.value, 0);
    states_.emplace_back(identity, required_);
  }
}

TransitionResult CompletionTracker::apply(const resolve::ResolvedFile& resolution,
                                          const std::string& path, core::Timestamp at) {
  return record(resolution.unit, resolution.category, path, resolution.file_date,
                domain::SatisfactionSource::kLive, at);
}

TransitionResult CompletionTracker::apply_backfill(const core::WorkUnitId& unit,
                                                   domain::FileCategory category,
                                                   const std::string& path,
                                                   const core::Date& file_date,
                                                   core::Timestamp at) {
  return record(unit, category, path, file_date, domain::SatisfactionSource::kBackfill, at);
}

TransitionResult CompletionTracker::record(const core::WorkUnitId& unit,
                                           domain::FileCategory category,
                                           const std::string& path, const core::Date& file_date,
                                           domain::SatisfactionSource source,
                                           core::Timestamp at) {
  const auto it = index_by_unit_.find(unit.value);
  if (it == index_by_unit_.end()) {
    return TransitionResult{
        .outcome = TransitionOutcome::kUnknownUnit,
        .before_state = domain::CompletionStatus::kPending,
        .after_state = domain::CompletionStatus::kPending,
        .transition_index = 0,
        .error_message = "Work unit not in listing: " + unit.value,
    };
  }

  auto& state = states_[it->second];
  auto& index = transition_index_[unit.value];
  const auto before = state.status();

  const auto update = state.record(category, path, file_date, source, at);
  if (update == domain::SlotUpdate::kNewlySatisfied) {
    ++index;
  }

  return TransitionResult{
      .outcome = update == domain::SlotUpdate::kNewlySatisfied ? TransitionOutcome::kApplied
                                                               : TransitionOutcome::kRefreshed,
      .before_state = before,
      .after_state = state.status(),
      .transition_index = index,
      .error_message = "",
  };
}

const domain::WorkUnitState* CompletionTracker::find(const core::WorkUnitId& unit) const {
  const auto it = index_by_unit_.find(unit.value);
  return it == index_by_unit_.end() ? nullptr : &states_[it->second];
}

bool CompletionTracker::all_satisfied() const {
  return std::all_of(states_.begin(), states_.end(), [](const domain::WorkUnitState& s) {
    return s.status() == domain::CompletionStatus::kSatisfied;
  });
}

std::size_t CompletionTracker::satisfied_count() const {
  return static_cast<std::size_t>(
      std::count_if(states_.begin(), states_.end(), [](const domain::WorkUnitState& s) {
        return s.status() == domain::CompletionStatus::kSatisfied;
      }));
}

int64_t CompletionTracker::transition_index(const core::WorkUnitId& unit) const {
  const auto it = transition_index_.find(unit.value);
  return it == transition_index_.end() ? 0 : it->second;
}

}  // namespace dcm::monitor
