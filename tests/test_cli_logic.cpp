#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "history_logic.h"
#include "match_logic.h"
#include "resolve_logic.h"
#include "snapshot_logic.h"
#include "dcm/history/folder_layout.h"
#include "dcm/matching/presets.h"
#include "dcm/storage/snapshot_store.h"
#include "test_support.h"

#include <stdexcept>

using namespace dcm;
using dcm::testing::TempDir;
using dcm::testing::touch;
using dcm::testing::ymd;
using Catch::Approx;

namespace {

const core::Date kPeriod = ymd(2025, 8, 30);

std::vector<domain::WorkUnitIdentity> roster() {
  domain::WorkUnitIdentity mahrous;
  mahrous.id = core::WorkUnitId{"MAHROUS"};
  mahrous.team_number = "317";
  domain::WorkUnitIdentity altairat;
  altairat.id = core::WorkUnitId{"ALTAIRAT"};
  altairat.team_number = "318";
  return {mahrous, altairat};
}

resolve::IdentityResolver make_resolver() {
  resolve::ResolverConfig config;
  config.date_ranges = resolve::AcceptedDateRanges::for_period(kPeriod, 5);
  return resolve::IdentityResolver(roster(), config);
}

matching::TargetConfig unit_target() {
  matching::TargetConfig config;
  config.name = "unit";
  config.kind = matching::TargetKind::kIdentifier;
  config.strategy = matching::StrategyKind::kExact;
  config.candidates = {"MAHROUS", "ALTAIRAT"};
  config.required = true;
  return config;
}

}  // namespace

// ── resolve ─────────────────────────────────────────────────────────────────

TEST_CASE("resolve_files_json: one entry per input in order", "[cli][resolve]") {
  const auto resolver = make_resolver();
  const auto out = resolve_files_json(
      resolver, {"MAHROUS_finished_points_and_tracks_20250830.kmz", "photo.jpg"});

  REQUIRE(out.is_array());
  REQUIRE(out.size() == 2);

  const auto& accepted = out[0];
  CHECK(accepted.at("accepted") == true);
  CHECK(accepted.at("unit") == "MAHROUS");
  CHECK(accepted.at("category") == "finished_observations");
  CHECK(accepted.at("file_date") == "2025-08-30");
  CHECK(accepted.at("strategy") == "exact");
  CHECK(accepted.at("score").get<double>() == Approx(1.0));

  const auto& rejected = out[1];
  CHECK(rejected.at("accepted") == false);
  CHECK(rejected.at("input") == "photo.jpg");
  CHECK(rejected.at("reason") == "UnsupportedExtension");
  CHECK_FALSE(rejected.at("detail").get<std::string>().empty());
  CHECK_FALSE(rejected.contains("unit"));
}

TEST_CASE("resolve_files_json: out-of-range date names the reason", "[cli][resolve]") {
  const auto resolver = make_resolver();
  const auto out = resolve_files_json(resolver, {"ALTAIRAT_finished_points_20250829.kmz"});
  REQUIRE(out.size() == 1);
  CHECK(out[0].at("reason") == "DateOutOfRange");
}

// ── match ───────────────────────────────────────────────────────────────────

TEST_CASE("run_multi_match: results in input order, ranking best first", "[cli][match]") {
  const std::vector<matching::TargetConfig> targets{unit_target(),
                                                    matching::date_target("date")};
  const auto out = run_multi_match(targets,
                                   {"SOMEONE_finished_points_20250830.kmz",
                                    "ALTAIRAT_plan_routes_20250831.kmz", "README"},
                                   0.5);

  const auto& results = out.at("results");
  REQUIRE(results.size() == 3);
  CHECK(results[0].at("input") == "SOMEONE_finished_points_20250830.kmz");
  CHECK(results[0].at("complete") == false);
  CHECK(results[0].at("unmatched_required") == nlohmann::json::array({"unit"}));
  CHECK(results[0].at("overall_score").get<double>() == Approx(0.5));
  CHECK(results[0].at("outcomes").at("unit").at("matched").is_null());

  const auto& complete = results[1];
  CHECK(complete.at("complete") == true);
  CHECK(complete.at("outcomes").at("unit").at("matched") == "ALTAIRAT");
  CHECK(complete.at("outcomes").at("unit").at("span").at("start") == 0);
  CHECK(complete.at("outcomes").at("date").at("strategy") == "pattern");

  const auto& ranking = out.at("ranking");
  REQUIRE(ranking.size() == 2);
  CHECK(ranking[0].at("input") == "ALTAIRAT_plan_routes_20250831.kmz");
  CHECK(ranking[1].at("input") == "SOMEONE_finished_points_20250830.kmz");
}

TEST_CASE("run_multi_match: invalid targets throw", "[cli][match]") {
  auto bad = unit_target();
  bad.fuzzy_threshold = 2.0;
  CHECK_THROWS_AS(run_multi_match({bad}, {"x"}, 0.0), std::invalid_argument);
}

// ── history ─────────────────────────────────────────────────────────────────

TEST_CASE("run_history_lookup: found and missing answers", "[cli][history]") {
  TempDir dir("cli_history");
  const auto resolver = make_resolver();
  const history::FolderLayout layout(dir.path(), {".kmz"});
  touch(layout.category_folder(kPeriod, domain::FileCategory::kFinishedObservations) /
        "MAHROUS_finished_points_and_tracks_20250830.kmz");
  const history::HistoricalSearch search(resolver, layout);

  const auto found = run_history_lookup(search, core::WorkUnitId{"MAHROUS"},
                                        domain::FileCategory::kFinishedObservations, kPeriod);
  CHECK(found.at("found") == true);
  CHECK(found.at("strategy") == "exact");
  CHECK(found.at("effective_date") == "2025-08-30");
  CHECK(found.at("unit") == "MAHROUS");
  CHECK(found.at("category") == "finished_observations");
  CHECK(found.at("period_date") == "2025-08-30");

  const auto missing = run_history_lookup(search, core::WorkUnitId{"ALTAIRAT"},
                                          domain::FileCategory::kPlannedRoutes, kPeriod);
  CHECK(missing.at("found") == false);
  CHECK(missing.at("strategy") == "none");
  CHECK(missing.at("path").is_null());
  CHECK_FALSE(missing.at("reason").get<std::string>().empty());
  CHECK(missing.at("scan_errors").empty());
}

// ── snapshot ────────────────────────────────────────────────────────────────

TEST_CASE("read_snapshot: stored, missing and malformed periods", "[cli][snapshot]") {
  storage::InMemorySnapshotStore store;
  store.save("2025-08-30",
             R"({"snapshot_format_version":1,"period_date":"2025-08-30",)"
             R"("finished_at":"2025-08-30T20:30:00Z","end_reason":"deadline","units":[]})",
             "2025-08-30T20:30:00Z");
  store.save("2025-08-29", "{broken", "2025-08-29T20:30:00Z");

  const auto stored = read_snapshot(store, kPeriod);
  REQUIRE(stored.has_value());
  const auto parsed = nlohmann::json::parse(stored.value());
  CHECK(parsed.at("end_reason") == "deadline");
  CHECK(stored.value().find('\n') != std::string::npos);

  const auto missing = read_snapshot(store, ymd(2025, 8, 28));
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error() == "no snapshot stored for period 2025-08-28");

  const auto malformed = read_snapshot(store, ymd(2025, 8, 29));
  REQUIRE_FALSE(malformed.has_value());
  CHECK(malformed.error().rfind("stored snapshot for 2025-08-29 is malformed", 0) == 0);
}
