#pragma once

#include "config.h"

#include "dcm/core/clock.h"
#include "dcm/monitor/monitor_coordinator.h"

#include <string>

namespace dcm::monitor_app {

// validate_monitor_flags checks the command line alone, before any file is read.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - --config and --watch are present
// - --poll-ms is positive
[[nodiscard]] std::string validate_monitor_flags(const MonitorConfig& config);

// validate_monitor_config checks that the loaded reference data and the derived
// period settings can run a monitoring session starting at `start`:
// - the reference data is usable (see apps::validate_reference_config)
// - the status interval is positive
// - the deadline falls after start
[[nodiscard]] std::string validate_monitor_config(const apps::ReferenceConfig& reference,
                                                  const monitor::MonitorSettings& settings,
                                                  core::Timestamp start);

}  // namespace dcm::monitor_app
