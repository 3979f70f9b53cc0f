#pragma once

#include "dcm/core/clock.h"

#include <filesystem>

namespace dcm::monitor {

// FileEvent announces that a file appeared in the watch directory.
struct FileEvent {
  std::filesystem::path path;
  core::Timestamp observed_at;
};

}  // namespace dcm::monitor
