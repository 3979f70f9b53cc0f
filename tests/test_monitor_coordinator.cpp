#include "dcm/history/historical_search.h"
#include "dcm/monitor/monitor_coordinator.h"
#include "dcm/report/audit_log_report_sink.h"
#include "dcm/report/report_sink.h"
#include "dcm/storage/audit_log.h"
#include "dcm/storage/snapshot_store.h"

#include "test_support.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <stdexcept>
#include <thread>

using namespace dcm;
using namespace std::chrono_literals;
using dcm::testing::at_utc;
using dcm::testing::TempDir;
using dcm::testing::touch;
using dcm::testing::ymd;

namespace {

const core::Date kPeriod = ymd(2025, 8, 30);

std::vector<domain::WorkUnitIdentity> roster() {
  domain::WorkUnitIdentity a;
  a.id = core::WorkUnitId{"MAHROUS"};
  a.team_number = "317";
  a.leaders = {"Ahmed"};
  domain::WorkUnitIdentity b;
  b.id = core::WorkUnitId{"ALTAIRAT"};
  b.team_number = "318";
  return {a, b};
}

resolve::IdentityResolver make_resolver() {
  resolve::ResolverConfig config;
  config.date_ranges = resolve::AcceptedDateRanges::for_period(kPeriod, 5);
  return resolve::IdentityResolver(roster(), config);
}

monitor::MonitorSettings settings() {
  monitor::MonitorSettings s;
  s.period_date = kPeriod;
  s.deadline = at_utc(kPeriod, 20, 30);
  return s;
}

// Creates the file in the watch directory and queues its event.
void drop(monitor::MonitorCoordinator& coordinator, const std::filesystem::path& dir,
          const std::string& name, core::Timestamp at) {
  coordinator.channel().push(monitor::FileEvent{touch(dir / name), at});
}

class ThrowingSink final : public report::IReportSink {
 public:
  void on_resolved(const report::ResolvedFileReport&) override {
    throw std::runtime_error("disk full");
  }
  void on_rejected(const report::RejectionReport&) override {}
  void on_backfill(const report::BackfillReport&) override {}
  void on_filesystem_error(const report::FilesystemErrorReport&) override {}
  void on_status(const report::StatusReport&) override {}
  void on_period_end(const domain::PeriodSnapshot&) override { ++period_ends; }

  int period_ends{0};  // NOLINT(readability-identifier-naming)
};

}  // namespace

TEST_CASE("MonitorCoordinator: ends as soon as every unit is satisfied", "[monitor]") {
  TempDir watch("monitor_complete");
  const auto resolver = make_resolver();
  report::RecordingReportSink sink;
  core::FixedClock clock(at_utc(kPeriod, 12));
  monitor::MonitorCoordinator coordinator(resolver, nullptr, sink, clock, settings());

  const auto now = clock.now();
  drop(coordinator, watch.path(), "MAHROUS_finished_points_and_tracks_20250830.kmz", now);
  drop(coordinator, watch.path(), "MAHROUS_plan_routes_20250831.kmz", now);
  drop(coordinator, watch.path(), "mahros_finished_points_20250830.kmz", now);
  drop(coordinator, watch.path(), "ALTAIRAT_finished_points_20250830.kmz", now);
  drop(coordinator, watch.path(), "ALTAIRAT_plan_routes_20250902.kmz", now);

  const auto summary = coordinator.run();

  CHECK(summary.end_reason == monitor::EndReason::kCompleted);
  CHECK(summary.events_processed == 5);
  CHECK(summary.resolved == 5);
  CHECK(summary.rejected == 0);
  CHECK(summary.satisfied_units == 2);
  CHECK(summary.total_units == 2);

  // The third file hit an already-satisfied category: details refresh only.
  REQUIRE(sink.resolved.size() == 5);
  CHECK(sink.resolved[0].update == domain::SlotUpdate::kNewlySatisfied);
  CHECK(sink.resolved[2].update == domain::SlotUpdate::kRefreshed);
  CHECK(sink.resolved[2].strategy == matching::MatchSource::kFuzzy);
  CHECK(coordinator.tracker().transition_index(core::WorkUnitId{"MAHROUS"}) == 2);

  const auto* mahrous = coordinator.tracker().find(core::WorkUnitId{"MAHROUS"});
  REQUIRE(mahrous != nullptr);
  CHECK(mahrous->slot(domain::FileCategory::kFinishedObservations).last_filename ==
        "mahros_finished_points_20250830.kmz");

  REQUIRE(sink.snapshots.size() == 1);
  const auto& snapshot = sink.snapshots[0];
  CHECK(snapshot.end_reason == "completed");
  CHECK(snapshot.period_date == "2025-08-30");
  REQUIRE(snapshot.units.size() == 2);
  CHECK(snapshot.units[0].status == "satisfied");
  CHECK(snapshot.units[0].categories[0].detail ==
        (watch.path() / "mahros_finished_points_20250830.kmz").string());

  // Initial and final status reports only; no tick was due.
  CHECK(sink.statuses.size() == 2);
  CHECK(sink.statuses.back().outstanding.empty());
}

TEST_CASE("MonitorCoordinator: rejections and vanished files are reported", "[monitor]") {
  TempDir watch("monitor_reject");
  const auto resolver = make_resolver();
  report::RecordingReportSink sink;
  core::FixedClock clock(at_utc(kPeriod, 12));
  monitor::MonitorCoordinator coordinator(resolver, nullptr, sink, clock, settings());

  const auto now = clock.now();
  drop(coordinator, watch.path(), "field_photo.jpg", now);
  drop(coordinator, watch.path(), "MAHROUS_finished_points_20260830.kmz", now);
  coordinator.channel().push(monitor::FileEvent{watch.path() / "gone.kmz", now});
  drop(coordinator, watch.path(), "ALTAIRAT_plan_routes_20250831.kmz", now);
  coordinator.request_stop();

  const auto summary = coordinator.run();

  CHECK(summary.end_reason == monitor::EndReason::kStopped);
  CHECK(summary.events_processed == 4);
  CHECK(summary.rejected == 2);
  CHECK(summary.resolved == 1);

  REQUIRE(sink.rejected.size() == 2);
  CHECK(sink.rejected[0].rejection.reason == resolve::RejectionReason::kUnsupportedExtension);
  CHECK(sink.rejected[1].rejection.reason == resolve::RejectionReason::kDateOutOfRange);

  REQUIRE(sink.filesystem_errors.size() == 1);
  CHECK(sink.filesystem_errors[0].path == (watch.path() / "gone.kmz").string());

  REQUIRE(sink.snapshots.size() == 1);
  CHECK(sink.snapshots[0].end_reason == "stopped");
  const auto& altairat = sink.snapshots[0].units[1];
  CHECK(altairat.status == "partially_satisfied");
  CHECK(altairat.categories[0].detail == "unsatisfied");
  CHECK(sink.backfills.empty());
}

TEST_CASE("MonitorCoordinator: deadline backfills outstanding categories from history",
          "[monitor][history]") {
  TempDir archive("monitor_archive");
  const auto resolver = make_resolver();
  history::FolderLayout layout(archive.path());
  history::HistoricalSearch search(resolver, layout);

  touch(layout.category_folder(kPeriod, domain::FileCategory::kFinishedObservations) /
        "MAHROUS_finished_points_and_tracks_20250830.kmz");
  touch(layout.category_folder(kPeriod, domain::FileCategory::kPlannedRoutes) /
        "MAHROUS_plan_routes_20250831.kmz");

  report::RecordingReportSink sink;
  core::FixedClock clock(at_utc(kPeriod, 21));
  monitor::MonitorCoordinator coordinator(resolver, &search, sink, clock, settings());

  const auto summary = coordinator.run();

  CHECK(summary.end_reason == monitor::EndReason::kDeadline);
  CHECK(summary.backfilled == 2);
  CHECK(summary.satisfied_units == 1);

  REQUIRE(sink.backfills.size() == 4);
  CHECK(sink.backfills[0].unit.value == "MAHROUS");
  CHECK(sink.backfills[0].result.found());
  CHECK(sink.backfills[0].result.strategy == history::LookupStrategy::kExact);
  CHECK(sink.backfills[2].unit.value == "ALTAIRAT");
  CHECK_FALSE(sink.backfills[2].result.found());
  CHECK_FALSE(sink.backfills[3].result.found());

  REQUIRE(sink.snapshots.size() == 1);
  const auto& snapshot = sink.snapshots[0];
  CHECK(snapshot.end_reason == "deadline");
  const auto& mahrous = snapshot.units[0];
  CHECK(mahrous.status == "satisfied");
  CHECK(mahrous.categories[0].source == "backfill");
  CHECK(mahrous.categories[0].detail == "backfilled from historical search on 2025-08-30");
  CHECK(mahrous.categories[1].detail == "backfilled from historical search on 2025-08-31");
  const auto& altairat = snapshot.units[1];
  CHECK(altairat.status == "pending");
  CHECK(altairat.categories[0].detail == "unsatisfied");
  CHECK(altairat.categories[1].detail == "unsatisfied");
}

TEST_CASE("MonitorCoordinator: no backfill without history or when disabled", "[monitor]") {
  TempDir archive("monitor_no_backfill");
  const auto resolver = make_resolver();
  history::FolderLayout layout(archive.path());
  history::HistoricalSearch search(resolver, layout);
  touch(layout.category_folder(kPeriod, domain::FileCategory::kFinishedObservations) /
        "MAHROUS_finished_points_and_tracks_20250830.kmz");

  report::RecordingReportSink sink;
  core::FixedClock clock(at_utc(kPeriod, 21));

  SECTION("no history") {
    monitor::MonitorCoordinator coordinator(resolver, nullptr, sink, clock, settings());
    CHECK(coordinator.run().end_reason == monitor::EndReason::kDeadline);
  }
  SECTION("disabled") {
    auto s = settings();
    s.backfill_on_deadline = false;
    monitor::MonitorCoordinator coordinator(resolver, &search, sink, clock, s);
    CHECK(coordinator.run().backfilled == 0);
  }
  CHECK(sink.backfills.empty());
}

TEST_CASE("MonitorCoordinator: stop from another thread ends a blocked run", "[monitor]") {
  TempDir watch("monitor_stop");
  const auto resolver = make_resolver();
  report::RecordingReportSink sink;
  core::FixedClock clock(at_utc(kPeriod, 12));
  monitor::MonitorCoordinator coordinator(resolver, nullptr, sink, clock, settings());

  const auto file = touch(watch.path() / "ALTAIRAT_finished_points_20250830.kmz");
  std::thread producer([&] {
    std::this_thread::sleep_for(30ms);
    coordinator.channel().push(monitor::FileEvent{file, clock.now()});
    std::this_thread::sleep_for(30ms);
    coordinator.request_stop();
  });

  const auto summary = coordinator.run();
  producer.join();

  CHECK(summary.end_reason == monitor::EndReason::kStopped);
  CHECK(summary.resolved == 1);
  REQUIRE(sink.resolved.size() == 1);
  CHECK(sink.resolved[0].unit.value == "ALTAIRAT");
}

TEST_CASE("MonitorCoordinator: a throwing sink does not stop dispatch", "[monitor]") {
  TempDir watch("monitor_throw");
  const auto resolver = make_resolver();
  ThrowingSink sink;
  core::FixedClock clock(at_utc(kPeriod, 12));
  monitor::MonitorCoordinator coordinator(resolver, nullptr, sink, clock, settings());

  const auto now = clock.now();
  drop(coordinator, watch.path(), "MAHROUS_finished_points_20250830.kmz", now);
  drop(coordinator, watch.path(), "MAHROUS_plan_routes_20250831.kmz", now);
  coordinator.request_stop();

  const auto summary = coordinator.run();
  CHECK(summary.resolved == 2);
  CHECK(summary.satisfied_units == 1);
  CHECK(sink.period_ends == 1);
}

TEST_CASE("MonitorCoordinator: a filename that is not UTF-8 is audited and the snapshot saved",
          "[monitor][audit]") {
  TempDir watch("monitor_bad_utf8");
  const auto resolver = make_resolver();
  storage::InMemoryAuditLog audit_log;
  storage::InMemorySnapshotStore snapshots;
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock(at_utc(kPeriod, 12));
  report::AuditLogReportSink audit_sink(audit_log, id_gen, clock, core::TraceId{"trace-s"},
                                        &snapshots);
  report::RecordingReportSink recording;
  report::CompositeReportSink sink;
  sink.add(audit_sink);
  sink.add(recording);
  monitor::MonitorCoordinator coordinator(resolver, nullptr, sink, clock, settings());

  const auto now = clock.now();
  drop(coordinator, watch.path(), "MAHROUS_finished_points_20250830_\xC7.kmz", now);
  coordinator.request_stop();

  const auto summary = coordinator.run();
  CHECK(summary.resolved == 1);
  CHECK(recording.resolved.size() == 1);

  const auto events = audit_log.query("trace-s");
  const auto resolved = std::find_if(events.begin(), events.end(), [](const auto& event) {
    return event.event_type == "FileResolved";
  });
  REQUIRE(resolved != events.end());
  const auto payload = nlohmann::json::parse(resolved->payload);
  CHECK(payload.at("source_path").get<std::string>().find("\xEF\xBF\xBD") != std::string::npos);
  CHECK(events.back().event_type == "PeriodCompleted");

  const auto stored = snapshots.get_snapshot_json("2025-08-30");
  REQUIRE(stored.has_value());
  const auto snapshot = domain::period_snapshot_from_json(*stored);
  CHECK(snapshot.end_reason == "stopped");
  REQUIRE(snapshot.units.size() == 2);
  CHECK(snapshot.units[0].categories[0].satisfied);
}

TEST_CASE("MonitorCoordinator: status urgency", "[monitor][status]") {
  const auto resolver = make_resolver();
  report::RecordingReportSink sink;
  core::FixedClock clock(at_utc(kPeriod, 12));

  SECTION("many units outstanding before the reminder hour") {
    auto s = settings();
    s.urgent_remaining_threshold = 1;
    s.urgent_after = at_utc(kPeriod, 19);
    monitor::MonitorCoordinator coordinator(resolver, nullptr, sink, clock, s);

    const auto status = coordinator.status_report();
    CHECK_FALSE(status.urgent);
    CHECK(status.total_units == 2);
    CHECK(status.satisfied_units == 0);
    REQUIRE(status.outstanding.size() == 4);
    CHECK(status.outstanding[0].unit.value == "MAHROUS");
    CHECK(status.outstanding[0].leaders == std::vector<std::string>{"Ahmed"});
  }
  SECTION("past the reminder hour") {
    auto s = settings();
    s.urgent_remaining_threshold = 1;
    s.urgent_after = at_utc(kPeriod, 11);
    monitor::MonitorCoordinator coordinator(resolver, nullptr, sink, clock, s);
    CHECK(coordinator.status_report().urgent);
  }
  SECTION("only a handful of units left") {
    auto s = settings();
    s.urgent_remaining_threshold = 2;
    monitor::MonitorCoordinator coordinator(resolver, nullptr, sink, clock, s);
    CHECK(coordinator.status_report().urgent);
  }
}

TEST_CASE("validate_monitor_settings: rejects unusable settings", "[monitor][config]") {
  const auto start = at_utc(kPeriod, 12);
  CHECK(monitor::validate_monitor_settings(settings(), start).empty());

  auto late = settings();
  late.deadline = start;
  CHECK_FALSE(monitor::validate_monitor_settings(late, start).empty());

  auto no_interval = settings();
  no_interval.status_interval = std::chrono::seconds(0);
  CHECK_FALSE(monitor::validate_monitor_settings(no_interval, start).empty());

  auto nothing_required = settings();
  nothing_required.required_categories.clear();
  CHECK_FALSE(monitor::validate_monitor_settings(nothing_required, start).empty());
}
