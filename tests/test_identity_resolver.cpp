#include "dcm/resolve/identity_resolver.h"

#include "test_support.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace dcm;
using dcm::testing::ymd;
using Catch::Approx;

namespace {

std::vector<domain::WorkUnitIdentity> roster() {
  domain::WorkUnitIdentity mahrous;
  mahrous.id = core::WorkUnitId{"MAHROUS"};
  mahrous.team_number = "317";
  mahrous.aliases = {"MHR"};
  mahrous.leaders = {"Ahmed"};

  domain::WorkUnitIdentity altairat;
  altairat.id = core::WorkUnitId{"ALTAIRAT"};
  altairat.team_number = "318";

  return {mahrous, altairat};
}

resolve::ResolverConfig config_for(const core::Date& period) {
  resolve::ResolverConfig config;
  config.date_ranges = resolve::AcceptedDateRanges::for_period(period, 5);
  return config;
}

const core::Date kPeriod = ymd(2025, 8, 30);

}  // namespace

TEST_CASE("IdentityResolver: misspelled identifier resolves through fuzzy matching",
          "[resolve]") {
  resolve::IdentityResolver resolver(roster(), config_for(kPeriod));

  const auto result = resolver.resolve("mahros_finished_points_20250830.kmz");
  REQUIRE(result.has_value());
  const auto& file = result.value();
  CHECK(file.unit.value == "MAHROUS");
  CHECK(file.category == domain::FileCategory::kFinishedObservations);
  CHECK(file.file_date == kPeriod);
  CHECK(file.identifier_strategy == matching::MatchSource::kFuzzy);
  CHECK(file.identifier_score == Approx(0.676244).margin(1e-5));
  CHECK(file.filename == "mahros_finished_points_20250830.kmz");
}

TEST_CASE("IdentityResolver: canonical names resolve exactly", "[resolve]") {
  resolve::IdentityResolver resolver(roster(), config_for(kPeriod));

  const auto finished = resolver.resolve("MAHROUS_finished_points_and_tracks_20250830.kmz");
  REQUIRE(finished.has_value());
  CHECK(finished.value().identifier_strategy == matching::MatchSource::kExact);
  CHECK(finished.value().identifier_score == 1.0);

  const auto planned = resolver.resolve("ALTAIRAT_plan_routes_20250831.kmz");
  REQUIRE(planned.has_value());
  CHECK(planned.value().unit.value == "ALTAIRAT");
  CHECK(planned.value().category == domain::FileCategory::kPlannedRoutes);
  CHECK(planned.value().file_date == ymd(2025, 8, 31));
}

TEST_CASE("IdentityResolver: aliases map back to the unit identifier", "[resolve]") {
  resolve::IdentityResolver resolver(roster(), config_for(kPeriod));

  const auto result = resolver.resolve("MHR_finished_points_20250830.kmz");
  REQUIRE(result.has_value());
  CHECK(result.value().unit.value == "MAHROUS");
}

TEST_CASE("IdentityResolver: misspelled category keyword still resolves", "[resolve]") {
  resolve::IdentityResolver resolver(roster(), config_for(kPeriod));

  const auto result = resolver.resolve("MAHROUS_finshed_points_20250830.kmz");
  REQUIRE(result.has_value());
  CHECK(result.value().category == domain::FileCategory::kFinishedObservations);
}

TEST_CASE("IdentityResolver: only the final path component is read", "[resolve]") {
  resolve::IdentityResolver resolver(roster(), config_for(kPeriod));

  const auto result = resolver.resolve("/data/ALTAIRAT_2025/inbox/MAHROUS_finished_points_20250830.kmz");
  REQUIRE(result.has_value());
  CHECK(result.value().unit.value == "MAHROUS");
}

TEST_CASE("IdentityResolver: out-of-range date is rejected despite clean matches", "[resolve]") {
  resolve::IdentityResolver resolver(roster(), config_for(kPeriod));

  const auto result = resolver.resolve("MAHROUS_finished_points_and_tracks_20260830.kmz");
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().reason == resolve::RejectionReason::kDateOutOfRange);
  CHECK_FALSE(result.error().detail.empty());

  const auto identification = resolver.identify("MAHROUS_finished_points_and_tracks_20260830.kmz");
  CHECK(identification.unit.has_value());
  CHECK(identification.category.has_value());
}

TEST_CASE("IdentityResolver: planned routes must be dated after the period day", "[resolve]") {
  resolve::IdentityResolver resolver(roster(), config_for(kPeriod));

  const auto same_day = resolver.resolve("ALTAIRAT_plan_routes_20250830.kmz");
  REQUIRE_FALSE(same_day.has_value());
  CHECK(same_day.error().reason == resolve::RejectionReason::kDateOutOfRange);

  CHECK(resolver.resolve("ALTAIRAT_plan_routes_20250904.kmz").has_value());
  CHECK_FALSE(resolver.resolve("ALTAIRAT_plan_routes_20250905.kmz").has_value());
}

TEST_CASE("IdentityResolver: rejection reasons follow check order", "[resolve]") {
  resolve::IdentityResolver resolver(roster(), config_for(kPeriod));

  SECTION("unsupported extension is reported first") {
    const auto result = resolver.resolve("nobody_notes.pdf");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().reason == resolve::RejectionReason::kUnsupportedExtension);
  }
  SECTION("unknown identifier") {
    const auto result = resolver.resolve("ZZZQQQ_finished_points_20250830.kmz");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().reason == resolve::RejectionReason::kNoIdentifierMatch);
    CHECK(result.error().best_score < 0.65);
  }
  SECTION("no category keyword") {
    const auto result = resolver.resolve("MAHROUS_notes_20250830.kmz");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().reason == resolve::RejectionReason::kNoCategoryMatch);
    CHECK(result.error().best_score == Approx(0.45905).margin(1e-4));
  }
  SECTION("no calendar date") {
    const auto result = resolver.resolve("MAHROUS_finished_points.kmz");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().reason == resolve::RejectionReason::kNoDateFound);
  }
}

TEST_CASE("IdentityResolver: empty listing rejects every input without throwing", "[resolve]") {
  resolve::IdentityResolver resolver({}, config_for(kPeriod));

  for (const char* name : {"MAHROUS_finished_points_20250830.kmz",
                           "ALTAIRAT_plan_routes_20250831.kmz", "x.kmz"}) {
    const auto result = resolver.resolve(name);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().reason == resolve::RejectionReason::kNoIdentifierMatch);
  }
}

TEST_CASE("IdentityResolver: invalid threshold fails construction", "[resolve]") {
  auto config = config_for(kPeriod);
  config.fuzzy_threshold = -0.1;
  CHECK_THROWS_AS(resolve::IdentityResolver(roster(), config), std::invalid_argument);
}

TEST_CASE("IdentityResolver: find_unit looks up by identifier", "[resolve]") {
  resolve::IdentityResolver resolver(roster(), config_for(kPeriod));

  const auto* unit = resolver.find_unit(core::WorkUnitId{"ALTAIRAT"});
  REQUIRE(unit != nullptr);
  CHECK(unit->team_number == "318");
  CHECK(resolver.find_unit(core::WorkUnitId{"MHR"}) == nullptr);
}
