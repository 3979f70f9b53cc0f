#pragma once

#include "dcm/core/clock.h"
#include "dcm/core/date.h"
#include "dcm/domain/file_category.h"
#include "dcm/domain/period_snapshot.h"
#include "dcm/history/historical_search.h"
#include "dcm/monitor/completion_tracker.h"
#include "dcm/monitor/event_channel.h"
#include "dcm/monitor/file_event.h"
#include "dcm/report/report_sink.h"
#include "dcm/resolve/identity_resolver.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dcm::monitor {

struct MonitorSettings {
  core::Date period_date;
  core::Timestamp deadline;
  std::chrono::seconds status_interval{std::chrono::minutes(5)};
  // Status reports are flagged urgent from this instant on.
  std::optional<core::Timestamp> urgent_after;
  // ...or whenever this few units (but at least one) are still outstanding.
  std::size_t urgent_remaining_threshold{5};
  std::vector<domain::FileCategory> required_categories{domain::kAllFileCategories.begin(),
                                                        domain::kAllFileCategories.end()};
  // Upper bound on one blocking wait, so a clock change is noticed promptly.
  std::chrono::milliseconds max_wait{std::chrono::seconds(1)};
  bool backfill_on_deadline{true};
};

// Returns an empty string when settings are usable, else the first problem.
[[nodiscard]] std::string validate_monitor_settings(const MonitorSettings& settings,
                                                    core::Timestamp start);

enum class EndReason {
  kCompleted,  // every unit satisfied every required category
  kDeadline,   // deadline reached with units outstanding
  kStopped,    // request_stop() was called
};

[[nodiscard]] std::string_view to_string(EndReason reason);

struct SessionSummary {
  EndReason end_reason{EndReason::kStopped};
  std::size_t events_processed{0};
  std::size_t resolved{0};
  std::size_t rejected{0};
  std::size_t backfilled{0};
  std::size_t satisfied_units{0};
  std::size_t total_units{0};
  domain::PeriodSnapshot snapshot;
};

// MonitorCoordinator runs one collection period.
//
// Event sources push FileEvents into channel() from any thread; all state
// mutation and every report-sink call happens on the thread inside run().
//
// Each loop iteration drains the queued events, then checks, in order:
// completion, stop request, deadline. It then waits on the channel until the
// next status tick or the deadline, whichever is earlier.
//
// At the deadline every outstanding (unit, category) pair is looked up through
// HistoricalSearch (when one is supplied) before the snapshot is taken.
//
// A throwing sink is logged to std::cerr and dispatch continues.
// resolver, history, sink and clock are borrowed and must outlive run().
class MonitorCoordinator {
 public:
  MonitorCoordinator(const resolve::IdentityResolver& resolver,
                     const history::HistoricalSearch* history, report::IReportSink& sink,
                     const core::IClock& clock, MonitorSettings settings);

  MonitorCoordinator(const MonitorCoordinator&) = delete;
  MonitorCoordinator& operator=(const MonitorCoordinator&) = delete;
  MonitorCoordinator(MonitorCoordinator&&) = delete;
  MonitorCoordinator& operator=(MonitorCoordinator&&) = delete;
  ~MonitorCoordinator() = default;

  [[nodiscard]] EventChannel<FileEvent>& channel() { return channel_; }

  // Safe from any thread, including a signal-watching one.
  void request_stop();

  // Blocks until the period ends. Call at most once.
  SessionSummary run();

  [[nodiscard]] report::StatusReport status_report() const;
  [[nodiscard]] const CompletionTracker& tracker() const { return tracker_; }
  [[nodiscard]] const MonitorSettings& settings() const { return settings_; }

 private:
  void handle(const FileEvent& event);
  void backfill_outstanding();
  void report_filesystem_error(const std::string& path, const std::string& message);

  template <typename Fn>
  void notify_sink(const char* what, Fn&& fn);

  const resolve::IdentityResolver& resolver_;
  const history::HistoricalSearch* history_;
  report::IReportSink& sink_;
  const core::IClock& clock_;
  MonitorSettings settings_;
  CompletionTracker tracker_;
  EventChannel<FileEvent> channel_;
  std::atomic<bool> stop_requested_{false};
  SessionSummary summary_;
};

}  // namespace dcm::monitor
