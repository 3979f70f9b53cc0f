#include "config.h"

#include <iostream>

namespace dcm::monitor_app {

namespace {

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

bool handle_config(MonitorConfig& config, const std::string& value) {
  config.config_path = value;
  return true;
}

bool handle_watch(MonitorConfig& config, const std::string& value) {
  config.watch_dir = value;
  return true;
}

bool handle_archive_root(MonitorConfig& config, const std::string& value) {
  config.archive_root = value;
  return true;
}

bool handle_db(MonitorConfig& config, const std::string& value) {
  config.db_path = value;
  return true;
}

bool handle_date(MonitorConfig& config, const std::string& value) {
  const auto date = core::parse_date_token(value);
  if (!date.has_value()) {
    std::cerr << "Invalid --date: " << value << " (expected YYYY-MM-DD or YYYYMMDD)\n";
    return false;
  }
  config.period_date = date;
  return true;
}

bool handle_deadline(MonitorConfig& config, const std::string& value) {
  if (!apps::parse_clock_time(value).has_value()) {
    std::cerr << "Invalid --deadline: " << value << " (expected HH:MM)\n";
    return false;
  }
  config.deadline = value;
  return true;
}

bool handle_poll_ms(MonitorConfig& config, const std::string& value) {
  try {
    config.poll_interval_ms = std::stoi(value);
  } catch (const std::exception&) {
    std::cerr << "Invalid --poll-ms: " << value << "\n";
    return false;
  }
  return true;
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<MonitorConfig>> build_option_registry() {
  return {
      {"--config", true, "Reference config JSON (work units, keywords, policy)", handle_config},
      {"--watch", true, "Directory to watch for incoming files (created if missing)",
       handle_watch},
      {"--archive-root", true, "Root of the dated workspace tree used for deadline backfill",
       handle_archive_root},
      {"--db", true, "SQLite database for the audit trail and period snapshots", handle_db},
      {"--date", true, "Collection period day (default: today)", handle_date},
      {"--deadline", true, "Stop accepting files at HH:MM (overrides config)", handle_deadline},
      {"--poll-ms", true, "Watch directory polling interval in milliseconds", handle_poll_ms},
      {"--no-backfill", false, "Skip historical backfill at the deadline",
       [](MonitorConfig& c, const std::string&) {
         c.backfill = false;
         return true;
       }},
      {"--quiet", false, "Do not print rejections of unaccepted file types",
       [](MonitorConfig& c, const std::string&) {
         c.quiet = true;
         return true;
       }},
      {"--help", false, "Show this help",
       [](MonitorConfig& c, const std::string&) {
         c.help = true;
         return true;
       }},
  };
}

// ────────────────────────────────────────────────────────────────
// Parser
// ────────────────────────────────────────────────────────────────

apps::ParsedOptions<MonitorConfig> parse_args(int argc, char* argv[]) {
  return apps::parse_options(argc, argv, build_option_registry());
}

monitor::MonitorSettings make_monitor_settings(const MonitorConfig& config,
                                               const apps::ReferenceConfig& reference,
                                               const core::Date& period_date) {
  int hour = reference.deadline_hour;
  int minute = reference.deadline_minute;
  if (config.deadline.has_value()) {
    if (const auto hm = apps::parse_clock_time(*config.deadline)) {
      hour = hm->first;
      minute = hm->second;
    }
  }

  monitor::MonitorSettings settings;
  settings.period_date = period_date;
  settings.deadline = core::local_time_on(period_date, hour, minute);
  settings.status_interval = std::chrono::seconds(reference.status_interval_seconds);
  if (reference.urgent_hour.has_value()) {
    settings.urgent_after = core::local_time_on(period_date, *reference.urgent_hour, 0);
  }
  settings.urgent_remaining_threshold = reference.urgent_remaining_threshold;
  settings.backfill_on_deadline = config.backfill;
  return settings;
}

}  // namespace dcm::monitor_app
