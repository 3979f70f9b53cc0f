#include "dcm/core/clock.h"
#include "dcm/core/date.h"
#include "dcm/core/id_generator.h"
#include "dcm/core/ids.h"
#include "dcm/history/folder_layout.h"
#include "dcm/history/historical_search.h"
#include "dcm/monitor/file_event_source.h"
#include "dcm/monitor/monitor_coordinator.h"
#include "dcm/report/audit_log_report_sink.h"
#include "dcm/report/console_report_sink.h"
#include "dcm/report/report_sink.h"
#include "dcm/resolve/identity_resolver.h"
#include "dcm/storage/audit_log.h"
#include "dcm/storage/snapshot_store.h"
#include "dcm/storage/sqlite/sqlite_audit_log.h"
#include "dcm/storage/sqlite/sqlite_db.h"
#include "dcm/storage/sqlite/sqlite_snapshot_store.h"

#include "config.h"
#include "shared/reference_config.h"
#include "startup_guard.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace dcm;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void signal_handler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_interrupted = 1;
  }
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Main
// ────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
  const auto parsed = monitor_app::parse_args(argc, argv);
  const auto& config = parsed.config;
  if (config.help) {
    apps::print_usage(std::cout, "dcm_monitor --config <json> --watch <dir> [options]",
                      monitor_app::build_option_registry());
    return 0;
  }
  if (!parsed.ok) {
    return 1;
  }

  // Validate everything before emitting any startup output so no partial messages appear on error.
  if (const auto error = monitor_app::validate_monitor_flags(config); !error.empty()) {
    std::cerr << error << "\n";
    return 1;
  }

  const auto reference_result = apps::load_reference_config(config.config_path.value());
  if (!reference_result.has_value()) {
    std::cerr << "Error: " << reference_result.error() << "\n";
    return 1;
  }
  const auto& reference = reference_result.value();

  core::SystemClock clock;
  const auto start = clock.now();
  const core::Date period_date = config.period_date.value_or(core::local_date_of(start));
  const auto settings = monitor_app::make_monitor_settings(config, reference, period_date);

  if (const auto error = monitor_app::validate_monitor_config(reference, settings, start);
      !error.empty()) {
    std::cerr << error << "\n";
    return 1;
  }

  // ── Startup diagnostic block ──────────────────────────────────────────────
  std::cerr << "daily-collection-monitor v0.1\n";
  std::cerr << "Period:      " << core::format_iso(period_date) << " (deadline "
            << core::format_iso8601(settings.deadline) << ")\n";
  std::cerr << "Work units:  " << reference.work_units.size() << "\n";
  std::cerr << "Watching:    " << config.watch_dir.value() << "\n";

  if (config.archive_root.has_value() && config.backfill) {
    std::cerr << "Backfill:    " << config.archive_root.value() << " (lookback "
              << reference.lookback_days << " days)\n";
  } else {
    std::cerr << "WARNING: No deadline backfill. Units still outstanding at the deadline will be\n"
                 "         reported unsatisfied. Pass --archive-root <dir> to search history.\n";
  }

  if (config.db_path.has_value()) {
    std::cerr << "Storage:     SQLite -- " << config.db_path.value() << "\n";
  } else {
    std::cerr << "WARNING: No --db path specified. Running with EPHEMERAL in-memory storage.\n"
                 "         The audit trail and period snapshot will be LOST on process exit.\n";
  }
  // ─────────────────────────────────────────────────────────────────────────

  std::unique_ptr<storage::IAuditLog> audit_log;
  std::unique_ptr<storage::ISnapshotStore> snapshots;
  if (config.db_path.has_value()) {
    auto db_result = storage::sqlite::SqliteDb::open(config.db_path.value());
    if (!db_result.has_value()) {
      std::cerr << "Failed to open database: " << db_result.error() << "\n";
      return 1;
    }
    auto db = db_result.value();
    auto schema_result = db->ensure_schema_v1();
    if (!schema_result.has_value()) {
      std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
      return 1;
    }
    audit_log = std::make_unique<storage::sqlite::SqliteAuditLog>(db);
    snapshots = std::make_unique<storage::sqlite::SqliteSnapshotStore>(db);
  } else {
    audit_log = std::make_unique<storage::InMemoryAuditLog>();
    snapshots = std::make_unique<storage::InMemorySnapshotStore>();
  }

  try {
    const resolve::IdentityResolver resolver(reference.work_units,
                                             apps::make_resolver_config(reference, period_date));

    std::optional<history::HistoricalSearch> history;
    if (config.archive_root.has_value()) {
      history.emplace(resolver, history::FolderLayout(config.archive_root.value(), reference.extensions),
                      apps::make_history_options(reference));
    }

    core::SystemIdGenerator id_gen(core::format_compact(period_date));
    const auto trace_id = core::new_trace_id(id_gen);
    report::AuditLogReportSink audit_sink(*audit_log, id_gen, clock, trace_id, snapshots.get());
    report::ConsoleReportSink console_sink(std::cout, !config.quiet);
    // The audit sink is registered before the console sink.
    report::CompositeReportSink sink;
    sink.add(audit_sink);
    sink.add(console_sink);

    monitor::MonitorCoordinator coordinator(resolver, history ? &*history : nullptr, sink, clock,
                                            settings);

    monitor::PollingFileEventSource source(
        config.watch_dir.value(), std::chrono::milliseconds(config.poll_interval_ms), clock,
        [](const std::string& path, const std::string& message) {
          std::cerr << "WARNING: cannot list " << path << ": " << message << "\n";
        });

    source.start(coordinator.channel());

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Signal handlers may only set a flag; this thread turns it into a stop request.
    std::atomic<bool> finished{false};
    std::thread interrupt_watcher([&] {
      while (!finished) {
        if (g_interrupted != 0) {
          std::cerr << "\nReceived interrupt signal. Finishing the period...\n";
          coordinator.request_stop();
          return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
    });

    std::optional<monitor::SessionSummary> summary;
    std::string failure;
    try {
      summary = coordinator.run();
    } catch (const std::exception& e) {
      failure = e.what();
    }
    source.stop();
    finished = true;
    interrupt_watcher.join();

    if (!summary.has_value()) {
      std::cerr << "Error: monitoring session failed: " << failure << "\n";
      return 1;
    }

    std::cerr << "Session " << trace_id.value << " ended ("
              << monitor::to_string(summary->end_reason) << "): " << summary->satisfied_units
              << "/" << summary->total_units << " units complete, " << summary->resolved
              << " files accepted, " << summary->rejected << " rejected, "
              << summary->backfilled << " backfilled\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
