#pragma once

#include "dcm/core/date.h"
#include "dcm/monitor/monitor_coordinator.h"

#include "shared/arg_parser.h"
#include "shared/reference_config.h"

#include <optional>
#include <string>
#include <vector>

namespace dcm::monitor_app {

// MonitorConfig holds all parsed startup flags for the monitor.
// Every field has an explicit default; optional fields mean "not configured".
struct MonitorConfig {
  std::optional<std::string> config_path;   // NOLINT(readability-identifier-naming)
  std::optional<std::string> watch_dir;     // NOLINT(readability-identifier-naming)
  // Root of the dated workspace tree; enables deadline backfill.
  std::optional<std::string> archive_root;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> db_path;       // NOLINT(readability-identifier-naming)
  std::optional<core::Date> period_date;    // NOLINT(readability-identifier-naming)
  // Overrides the reference config's deadline.
  std::optional<std::string> deadline;      // NOLINT(readability-identifier-naming)
  int poll_interval_ms{1000};               // NOLINT(readability-identifier-naming)
  bool backfill{true};                      // NOLINT(readability-identifier-naming)
  bool quiet{false};                        // NOLINT(readability-identifier-naming)
  bool help{false};                         // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::vector<apps::Option<MonitorConfig>> build_option_registry();

apps::ParsedOptions<MonitorConfig> parse_args(int argc,
                                              char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// Builds the coordinator settings for period_date from flags and reference data.
// Deadline and urgent hour are wall-clock times on the period day.
[[nodiscard]] monitor::MonitorSettings make_monitor_settings(const MonitorConfig& config,
                                                             const apps::ReferenceConfig& reference,
                                                             const core::Date& period_date);

}  // namespace dcm::monitor_app
