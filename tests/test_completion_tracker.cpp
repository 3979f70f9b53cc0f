#include "dcm/monitor/completion_tracker.h"

#include "test_support.h"

#include <catch2/catch_test_macros.hpp>

using namespace dcm;
using dcm::testing::at_utc;
using dcm::testing::ymd;

namespace {

std::vector<domain::WorkUnitIdentity> roster() {
  domain::WorkUnitIdentity a;
  a.id = core::WorkUnitId{"MAHROUS"};
  domain::WorkUnitIdentity b;
  b.id = core::WorkUnitId{"ALTAIRAT"};
  return {a, b};
}

std::vector<domain::FileCategory> both() {
  return {domain::kAllFileCategories.begin(), domain::kAllFileCategories.end()};
}

resolve::ResolvedFile resolved(const std::string& unit, domain::FileCategory category,
                               const core::Date& date) {
  resolve::ResolvedFile file;
  file.unit = core::WorkUnitId{unit};
  file.category = category;
  file.file_date = date;
  file.filename = unit + ".kmz";
  return file;
}

const core::Date kPeriod = ymd(2025, 8, 30);

}  // namespace

TEST_CASE("CompletionTracker: transitions advance the per-unit index", "[monitor][tracker]") {
  monitor::CompletionTracker tracker(roster(), both());
  const auto t = at_utc(kPeriod, 12);

  const auto first = tracker.apply(
      resolved("MAHROUS", domain::FileCategory::kFinishedObservations, kPeriod), "/in/1.kmz", t);
  CHECK(first.outcome == monitor::TransitionOutcome::kApplied);
  CHECK(first.before_state == domain::CompletionStatus::kPending);
  CHECK(first.after_state == domain::CompletionStatus::kPartiallySatisfied);
  CHECK(first.transition_index == 1);

  const auto second = tracker.apply(
      resolved("MAHROUS", domain::FileCategory::kPlannedRoutes, ymd(2025, 8, 31)), "/in/2.kmz", t);
  CHECK(second.outcome == monitor::TransitionOutcome::kApplied);
  CHECK(second.after_state == domain::CompletionStatus::kSatisfied);
  CHECK(second.transition_index == 2);

  CHECK(tracker.transition_index(core::WorkUnitId{"ALTAIRAT"}) == 0);
  CHECK(tracker.satisfied_count() == 1);
  CHECK_FALSE(tracker.all_satisfied());
}

TEST_CASE("CompletionTracker: a satisfied unit only refreshes on later files",
          "[monitor][tracker]") {
  monitor::CompletionTracker tracker(roster(), both());
  const auto t = at_utc(kPeriod, 12);
  tracker.apply(resolved("MAHROUS", domain::FileCategory::kFinishedObservations, kPeriod),
                "/in/1.kmz", t);
  tracker.apply(resolved("MAHROUS", domain::FileCategory::kPlannedRoutes, ymd(2025, 8, 31)),
                "/in/2.kmz", t);

  const auto again = tracker.apply(
      resolved("MAHROUS", domain::FileCategory::kFinishedObservations, kPeriod), "/in/3.kmz",
      at_utc(kPeriod, 13));
  CHECK(again.outcome == monitor::TransitionOutcome::kRefreshed);
  CHECK(again.before_state == domain::CompletionStatus::kSatisfied);
  CHECK(again.after_state == domain::CompletionStatus::kSatisfied);
  CHECK(again.transition_index == 2);

  const auto* state = tracker.find(core::WorkUnitId{"MAHROUS"});
  REQUIRE(state != nullptr);
  CHECK(state->slot(domain::FileCategory::kFinishedObservations).last_path == "/in/3.kmz");
}

TEST_CASE("CompletionTracker: unknown units change nothing", "[monitor][tracker]") {
  monitor::CompletionTracker tracker(roster(), both());

  const auto result = tracker.apply(
      resolved("NOBODY", domain::FileCategory::kFinishedObservations, kPeriod), "/in/x.kmz",
      at_utc(kPeriod, 12));
  CHECK(result.outcome == monitor::TransitionOutcome::kUnknownUnit);
  CHECK(result.error_message == "Work unit not in listing: NOBODY");
  CHECK(tracker.find(core::WorkUnitId{"NOBODY"}) == nullptr);
  CHECK(tracker.satisfied_count() == 0);
}

TEST_CASE("CompletionTracker: backfill marks the slot source", "[monitor][tracker]") {
  monitor::CompletionTracker tracker(roster(), {domain::FileCategory::kFinishedObservations});

  const auto result =
      tracker.apply_backfill(core::WorkUnitId{"ALTAIRAT"}, domain::FileCategory::kFinishedObservations,
                             "/archive/x.kmz", ymd(2025, 8, 21), at_utc(kPeriod, 21));
  CHECK(result.outcome == monitor::TransitionOutcome::kApplied);
  CHECK(result.after_state == domain::CompletionStatus::kSatisfied);

  const auto* state = tracker.find(core::WorkUnitId{"ALTAIRAT"});
  REQUIRE(state != nullptr);
  const auto& slot = state->slot(domain::FileCategory::kFinishedObservations);
  CHECK(slot.source == domain::SatisfactionSource::kBackfill);
  CHECK(slot.resolved_date == ymd(2025, 8, 21));
}

TEST_CASE("CompletionTracker: states keep listing order", "[monitor][tracker]") {
  monitor::CompletionTracker tracker(roster(), both());
  REQUIRE(tracker.states().size() == 2);
  CHECK(tracker.states()[0].identity().id.value == "MAHROUS");
  CHECK(tracker.states()[1].identity().id.value == "ALTAIRAT");
  CHECK(tracker.required_categories().size() == 2);
}

TEST_CASE("CompletionTracker: empty listing is trivially complete", "[monitor][tracker]") {
  monitor::CompletionTracker tracker({}, both());
  CHECK(tracker.all_satisfied());
  CHECK(tracker.satisfied_count() == 0);
}

TEST_CASE("TransitionOutcome: names", "[monitor][tracker]") {
  CHECK(monitor::to_string(monitor::TransitionOutcome::kApplied) == "applied");
  CHECK(monitor::to_string(monitor::TransitionOutcome::kRefreshed) == "refreshed");
  CHECK(monitor::to_string(monitor::TransitionOutcome::kUnknownUnit) == "unknown_unit");
}
