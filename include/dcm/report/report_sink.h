#pragma once

#include "dcm/core/clock.h"
#include "dcm/core/date.h"
#include "dcm/core/ids.h"
#include "dcm/domain/file_category.h"
#include "dcm/domain/period_snapshot.h"
#include "dcm/domain/work_unit_state.h"
#include "dcm/history/historical_search.h"
#include "dcm/matching/match_strategy.h"
#include "dcm/resolve/resolution.h"

#include <cstddef>
#include <string>
#include <vector>

namespace dcm::report {

struct ResolvedFileReport {
  core::WorkUnitId unit;
  domain::FileCategory category{domain::FileCategory::kFinishedObservations};
  core::Date resolved_date;
  std::string source_path;
  matching::MatchSource strategy{matching::MatchSource::kNone};
  double score{0.0};
  domain::SlotUpdate update{domain::SlotUpdate::kNewlySatisfied};
  core::Timestamp at;
};

struct RejectionReport {
  std::string source_path;
  resolve::Rejection rejection;
  core::Timestamp at;
};

struct BackfillReport {
  core::WorkUnitId unit;
  domain::FileCategory category{domain::FileCategory::kFinishedObservations};
  history::HistoricalLookupResult result;
  core::Timestamp at;
};

struct FilesystemErrorReport {
  std::string path;
  std::string message;
  core::Timestamp at;
};

struct OutstandingItem {
  core::WorkUnitId unit;
  std::string team_number;
  std::vector<std::string> leaders;
  domain::FileCategory category{domain::FileCategory::kFinishedObservations};
};

// StatusReport is the periodic progress emission. urgent is set once the
// configured reminder hour has passed or only a handful of units remain.
struct StatusReport {
  core::Timestamp at;
  std::size_t satisfied_units{0};
  std::size_t total_units{0};
  std::vector<OutstandingItem> outstanding;
  bool urgent{false};
};

// IReportSink is the boundary to report-generation and display collaborators.
// The monitor calls it from its dispatch thread only.
//
// Implementations may throw (e.g. a storage failure); the monitor logs the
// failure and keeps dispatching.
class IReportSink {
 public:
  virtual ~IReportSink() = default;

  virtual void on_resolved(const ResolvedFileReport& report) = 0;
  virtual void on_rejected(const RejectionReport& report) = 0;
  virtual void on_backfill(const BackfillReport& report) = 0;
  virtual void on_filesystem_error(const FilesystemErrorReport& report) = 0;
  virtual void on_status(const StatusReport& report) = 0;
  virtual void on_period_end(const domain::PeriodSnapshot& snapshot) = 0;

 protected:
  IReportSink() = default;
  IReportSink(const IReportSink&) = default;
  IReportSink& operator=(const IReportSink&) = default;
  IReportSink(IReportSink&&) = default;
  IReportSink& operator=(IReportSink&&) = default;
};

// CompositeReportSink forwards every call to each registered sink in order.
// A sink that throws does not keep the call from the sinks after it; once all
// have run, the first failure is rethrown to the caller.
// Sinks are borrowed and must outlive the composite.
class CompositeReportSink final : public IReportSink {
 public:
  CompositeReportSink() = default;

  void add(IReportSink& sink) { sinks_.push_back(&sink); }

  void on_resolved(const ResolvedFileReport& report) override;
  void on_rejected(const RejectionReport& report) override;
  void on_backfill(const BackfillReport& report) override;
  void on_filesystem_error(const FilesystemErrorReport& report) override;
  void on_status(const StatusReport& report) override;
  void on_period_end(const domain::PeriodSnapshot& snapshot) override;

 private:
  template <typename Fn>
  void fan_out(Fn&& fn);

  std::vector<IReportSink*> sinks_;
};

// RecordingReportSink keeps every report in memory, in arrival order.
class RecordingReportSink final : public IReportSink {
 public:
  void on_resolved(const ResolvedFileReport& report) override { resolved.push_back(report); }
  void on_rejected(const RejectionReport& report) override { rejected.push_back(report); }
  void on_backfill(const BackfillReport& report) override { backfills.push_back(report); }
  void on_filesystem_error(const FilesystemErrorReport& report) override {
    filesystem_errors.push_back(report);
  }
  void on_status(const StatusReport& report) override { statuses.push_back(report); }
  void on_period_end(const domain::PeriodSnapshot& snapshot) override {
    snapshots.push_back(snapshot);
  }

  std::vector<ResolvedFileReport> resolved;               // NOLINT(readability-identifier-naming)
  std::vector<RejectionReport> rejected;                  // NOLINT(readability-identifier-naming)
  std::vector<BackfillReport> backfills;                  // NOLINT(readability-identifier-naming)
  std::vector<FilesystemErrorReport> filesystem_errors;   // NOLINT(readability-identifier-naming)
  std::vector<StatusReport> statuses;                     // NOLINT(readability-identifier-naming)
  std::vector<domain::PeriodSnapshot> snapshots;          // NOLINT(readability-identifier-naming)
};

}  // namespace dcm::report
