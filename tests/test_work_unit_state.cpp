#include "dcm/domain/file_category.h"
#include "dcm/domain/work_unit.h"
#include "dcm/domain/work_unit_state.h"

#include "test_support.h"

#include <catch2/catch_test_macros.hpp>

using namespace dcm;
using dcm::testing::at_utc;
using dcm::testing::ymd;

namespace {

domain::WorkUnitIdentity mahrous() {
  domain::WorkUnitIdentity identity;
  identity.id = core::WorkUnitId{"MAHROUS"};
  identity.team_number = "317";
  identity.aliases = {"Mahrous", "MAHROUS", "", "MHR"};
  return identity;
}

std::vector<domain::FileCategory> both() {
  return {domain::kAllFileCategories.begin(), domain::kAllFileCategories.end()};
}

const core::Date kPeriod = ymd(2025, 8, 30);

}  // namespace

TEST_CASE("WorkUnitIdentity: accepted names drop empties and duplicates", "[domain]") {
  const auto names = mahrous().accepted_names();
  REQUIRE(names.size() == 3);
  CHECK(names[0] == "MAHROUS");
  CHECK(names[1] == "Mahrous");
  CHECK(names[2] == "MHR");
}

TEST_CASE("WorkUnitState: pending, partial, satisfied", "[domain][state]") {
  domain::WorkUnitState state(mahrous(), both());
  CHECK(state.status() == domain::CompletionStatus::kPending);
  CHECK(state.outstanding().size() == 2);
  CHECK_FALSE(state.last_updated().has_value());

  const auto t1 = at_utc(kPeriod, 15);
  CHECK(state.record(domain::FileCategory::kPlannedRoutes, "/in/a.kmz", ymd(2025, 8, 31),
                     domain::SatisfactionSource::kLive, t1) == domain::SlotUpdate::kNewlySatisfied);
  CHECK(state.status() == domain::CompletionStatus::kPartiallySatisfied);
  REQUIRE(state.outstanding().size() == 1);
  CHECK(state.outstanding()[0] == domain::FileCategory::kFinishedObservations);

  const auto t2 = at_utc(kPeriod, 16);
  state.record(domain::FileCategory::kFinishedObservations, "/in/b.kmz", kPeriod,
               domain::SatisfactionSource::kLive, t2);
  CHECK(state.status() == domain::CompletionStatus::kSatisfied);
  CHECK(state.outstanding().empty());
  CHECK(state.last_updated() == t2);
}

TEST_CASE("WorkUnitState: a later file for a satisfied category only refreshes details",
          "[domain][state]") {
  domain::WorkUnitState state(mahrous(), both());
  const auto t = at_utc(kPeriod, 15);
  state.record(domain::FileCategory::kFinishedObservations, "/in/first.kmz", kPeriod,
               domain::SatisfactionSource::kLive, t);
  state.record(domain::FileCategory::kPlannedRoutes, "/in/plan.kmz", ymd(2025, 8, 31),
               domain::SatisfactionSource::kLive, t);
  REQUIRE(state.status() == domain::CompletionStatus::kSatisfied);

  const auto update =
      state.record(domain::FileCategory::kFinishedObservations, "/in/second.kmz", kPeriod,
                   domain::SatisfactionSource::kLive, at_utc(kPeriod, 17));
  CHECK(update == domain::SlotUpdate::kRefreshed);
  CHECK(state.status() == domain::CompletionStatus::kSatisfied);
  CHECK(state.slot(domain::FileCategory::kFinishedObservations).last_filename == "second.kmz");
  CHECK(state.slot(domain::FileCategory::kFinishedObservations).last_path == "/in/second.kmz");
}

TEST_CASE("WorkUnitState: recording the same file twice equals recording it once",
          "[domain][state]") {
  domain::WorkUnitState once(mahrous(), both());
  domain::WorkUnitState twice(mahrous(), both());
  const auto t = at_utc(kPeriod, 15);

  once.record(domain::FileCategory::kFinishedObservations, "/in/a.kmz", kPeriod,
              domain::SatisfactionSource::kLive, t);
  twice.record(domain::FileCategory::kFinishedObservations, "/in/a.kmz", kPeriod,
               domain::SatisfactionSource::kLive, t);
  twice.record(domain::FileCategory::kFinishedObservations, "/in/a.kmz", kPeriod,
               domain::SatisfactionSource::kLive, t);

  const auto& a = once.slot(domain::FileCategory::kFinishedObservations);
  const auto& b = twice.slot(domain::FileCategory::kFinishedObservations);
  CHECK(once.status() == twice.status());
  CHECK(a.satisfied == b.satisfied);
  CHECK(a.last_path == b.last_path);
  CHECK(a.resolved_date == b.resolved_date);
  CHECK(a.updated_at == b.updated_at);
}

TEST_CASE("WorkUnitState: status counts required categories only", "[domain][state]") {
  domain::WorkUnitState state(mahrous(), {domain::FileCategory::kFinishedObservations});
  CHECK(state.outstanding().size() == 1);

  state.record(domain::FileCategory::kPlannedRoutes, "/in/plan.kmz", ymd(2025, 8, 31),
               domain::SatisfactionSource::kLive, at_utc(kPeriod, 10));
  CHECK(state.status() == domain::CompletionStatus::kPending);

  state.record(domain::FileCategory::kFinishedObservations, "/in/done.kmz", kPeriod,
               domain::SatisfactionSource::kBackfill, at_utc(kPeriod, 21));
  CHECK(state.status() == domain::CompletionStatus::kSatisfied);
  CHECK(state.slot(domain::FileCategory::kFinishedObservations).source ==
        domain::SatisfactionSource::kBackfill);
}

TEST_CASE("FileCategory: names, folders and parsing", "[domain]") {
  CHECK(domain::to_string(domain::FileCategory::kFinishedObservations) == "finished_observations");
  CHECK(domain::folder_name(domain::FileCategory::kPlannedRoutes) == "Planned routes");
  CHECK(domain::canonical_token(domain::FileCategory::kFinishedObservations) ==
        "finished_points_and_tracks");
  CHECK(domain::parse_file_category("planned") == domain::FileCategory::kPlannedRoutes);
  CHECK(domain::parse_file_category("finished_observations") ==
        domain::FileCategory::kFinishedObservations);
  CHECK_FALSE(domain::parse_file_category("photos").has_value());

  const auto vocabulary = domain::CategoryVocabulary::defaults();
  CHECK(vocabulary.keywords_for(domain::FileCategory::kFinishedObservations).size() == 5);
  CHECK(vocabulary.keywords_for(domain::FileCategory::kPlannedRoutes).size() == 6);
}
