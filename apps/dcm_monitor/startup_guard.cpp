#include "startup_guard.h"

namespace dcm::monitor_app {

std::string validate_monitor_flags(const MonitorConfig& config) {
  if (!config.config_path.has_value()) {
    return "Error: --config <path> is required.\n"
           "       The monitor needs the work-unit listing to recognise submissions.";
  }
  if (!config.watch_dir.has_value()) {
    return "Error: --watch <dir> is required.";
  }
  if (config.poll_interval_ms <= 0) {
    return "Error: --poll-ms must be positive, got " + std::to_string(config.poll_interval_ms);
  }
  return "";
}

std::string validate_monitor_config(const apps::ReferenceConfig& reference,
                                    const monitor::MonitorSettings& settings,
                                    core::Timestamp start) {
  if (const auto error = apps::validate_reference_config(reference); !error.empty()) {
    return "Error: " + error;
  }
  if (const auto error = monitor::validate_monitor_settings(settings, start); !error.empty()) {
    return "Error: " + error;
  }
  return "";
}

}  // namespace dcm::monitor_app
