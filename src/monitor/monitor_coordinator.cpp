#include "dcm/monitor/monitor_coordinator.h"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace dcm::monitor {

namespace fs = std::filesystem;

std::string validate_monitor_settings(const MonitorSettings& settings, core::Timestamp start) {
  if (settings.status_interval <= std::chrono::seconds::zero()) {
    return "status interval must be positive";
  }
  if (settings.max_wait <= std::chrono::milliseconds::zero()) {
    return "max wait must be positive";
  }
  if (settings.required_categories.empty()) {
    return "at least one category must be required";
  }
  if (settings.deadline <= start) {
    return "deadline " + core::format_iso8601(settings.deadline) + " is not after start " +
           core::format_iso8601(start);
  }
  return {};
}

std::string_view to_string(EndReason reason) {
  switch (reason) {
    case EndReason::kCompleted:
      return "completed";
    case EndReason::kDeadline:
      return "deadline";
    case EndReason::kStopped:
      break;
  }
  return "stopped";
}

MonitorCoordinator::MonitorCoordinator(const resolve::IdentityResolver& resolver,
                                       const history::HistoricalSearch* history,
                                       report::IReportSink& sink, const core::IClock& clock,
                                       MonitorSettings settings)
    : resolver_(resolver),
      history_(history),
      sink_(sink),
      clock_(clock),
      settings_(std::move(settings)),
      tracker_(resolver.roster(), settings_.required_categories) {}

template <typename Fn>
void MonitorCoordinator::notify_sink(const char* what, Fn&& fn) {
  try {
    fn();
  } catch (const std::exception& e) {
    std::cerr << "WARNING: report sink failed in " << what << ": " << e.what() << "\n";
  }
}

void MonitorCoordinator::request_stop() {
  stop_requested_ = true;
  channel_.notify();
}

report::StatusReport MonitorCoordinator::status_report() const {
  report::StatusReport status;
  status.at = clock_.now();
  status.total_units = tracker_.states().size();
  status.satisfied_units = tracker_.satisfied_count();

  for (const auto& state : tracker_.states()) {
    for (const auto category : state.outstanding()) {
      status.outstanding.push_back(report::OutstandingItem{
          .unit = state.identity().id,
          .team_number = state.identity().team_number,
          .leaders = state.identity().leaders,
          .category = category,
      });
    }
  }

  const std::size_t remaining = status.total_units - status.satisfied_units;
  const bool late = settings_.urgent_after.has_value() && status.at >= *settings_.urgent_after;
  const bool few_left = remaining > 0 && remaining <= settings_.urgent_remaining_threshold;
  status.urgent = late || few_left;
  return status;
}

void MonitorCoordinator::report_filesystem_error(const std::string& path,
                                                 const std::string& message) {
  notify_sink("on_filesystem_error", [&] {
    sink_.on_filesystem_error(report::FilesystemErrorReport{path, message, clock_.now()});
  });
}

void MonitorCoordinator::handle(const FileEvent& event) {
  ++summary_.events_processed;
  const std::string path = event.path.string();

  std::error_code ec;
  const bool present = fs::is_regular_file(event.path, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    report_filesystem_error(path, ec.message());
    return;
  }
  if (!present) {
    report_filesystem_error(path, "file is gone or not a regular file");
    return;
  }

  auto resolution = resolver_.resolve(event.path.filename().string());
  if (!resolution.has_value()) {
    ++summary_.rejected;
    notify_sink("on_rejected", [&] {
      sink_.on_rejected(report::RejectionReport{path, resolution.error(), clock_.now()});
    });
    return;
  }

  const auto& resolved = resolution.value();
  const auto now = clock_.now();
  const auto transition = tracker_.apply(resolved, path, now);
  if (transition.outcome == TransitionOutcome::kUnknownUnit) {
    std::cerr << "WARNING: " << transition.error_message << "\n";
    return;
  }

  ++summary_.resolved;
  notify_sink("on_resolved", [&] {
    sink_.on_resolved(report::ResolvedFileReport{
        .unit = resolved.unit,
        .category = resolved.category,
        .resolved_date = resolved.file_date,
        .source_path = path,
        .strategy = resolved.identifier_strategy,
        .score = resolved.identifier_score,
        .update = transition.outcome == TransitionOutcome::kApplied
                      ? domain::SlotUpdate::kNewlySatisfied
                      : domain::SlotUpdate::kRefreshed,
        .at = now,
    });
  });
}

void MonitorCoordinator::backfill_outstanding() {
  // Collect first: applying a backfill changes what outstanding() returns.
  std::vector<std::pair<core::WorkUnitId, domain::FileCategory>> pending;
  for (const auto& state : tracker_.states()) {
    for (const auto category : state.outstanding()) {
      pending.emplace_back(state.identity().id, category);
    }
  }

  for (const auto& [unit, category] : pending) {
    const auto result = history_->find_for_period(unit, category, settings_.period_date);

    for (const auto& error : result.scan_errors) {
      report_filesystem_error(history_->layout().root().string(), error);
    }

    const auto now = clock_.now();
    if (result.found() && result.effective_date.has_value()) {
      const auto transition = tracker_.apply_backfill(unit, category, result.path->string(),
                                                      *result.effective_date, now);
      if (transition.outcome == TransitionOutcome::kApplied) {
        ++summary_.backfilled;
      }
    }

    notify_sink("on_backfill", [&] {
      sink_.on_backfill(report::BackfillReport{unit, category, result, now});
    });
  }
}

SessionSummary MonitorCoordinator::run() {
  const auto start = clock_.now();
  auto next_tick = start + settings_.status_interval;

  notify_sink("on_status", [&] { sink_.on_status(status_report()); });

  EndReason reason = EndReason::kStopped;
  for (;;) {
    while (auto event = channel_.try_pop()) {
      handle(*event);
    }

    if (tracker_.all_satisfied()) {
      reason = EndReason::kCompleted;
      break;
    }
    if (stop_requested_) {
      reason = EndReason::kStopped;
      break;
    }
    auto now = clock_.now();
    if (now >= settings_.deadline) {
      reason = EndReason::kDeadline;
      break;
    }

    if (now >= next_tick) {
      notify_sink("on_status", [&] { sink_.on_status(status_report()); });
      while (next_tick <= now) {
        next_tick += settings_.status_interval;
      }
    }

    const auto until = std::min(next_tick, settings_.deadline);
    const auto wait = std::clamp(
        std::chrono::duration_cast<std::chrono::milliseconds>(until - now),
        std::chrono::milliseconds(1), settings_.max_wait);
    if (auto event = channel_.pop_for(wait)) {
      handle(*event);
    }
  }

  if (reason == EndReason::kDeadline && settings_.backfill_on_deadline && history_ != nullptr) {
    backfill_outstanding();
  }

  const auto finished_at = clock_.now();
  summary_.end_reason = reason;
  summary_.total_units = tracker_.states().size();
  summary_.satisfied_units = tracker_.satisfied_count();
  summary_.snapshot = domain::make_period_snapshot(tracker_.states(), settings_.period_date,
                                                   finished_at, std::string(to_string(reason)));

  notify_sink("on_status", [&] { sink_.on_status(status_report()); });
  notify_sink("on_period_end", [&] { sink_.on_period_end(summary_.snapshot); });
  return summary_;
}

}  // namespace dcm::monitor
