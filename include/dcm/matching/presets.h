#pragma once

#include "dcm/core/date.h"
#include "dcm/core/normalization.h"
#include "dcm/matching/target.h"

#include <string>
#include <vector>

namespace dcm::matching {

// Year-first or year-last eight-digit dates with optional '-' or '/' separators.
constexpr const char* kDefaultDatePattern =
    R"((\d{4}[-/]?\d{2}[-/]?\d{2}|\d{2}[-/]?\d{2}[-/]?\d{4}))";


// date_target extracts the first token that parses as a real calendar date.
inline TargetConfig date_target(std::string name, bool required = true) {
  TargetConfig config;
  config.name = std::move(name);
  config.kind = TargetKind::kDate;
  config.patterns = {kDefaultDatePattern};
  config.required = required;
  config.validator = [](std::string_view text) {
    return core::parse_date_token(text).has_value();
  };
  return config;
}

// normalize_extension lowercases and ensures a leading dot: "KMZ" -> ".kmz".
inline std::string normalize_extension(const std::string& extension) {
  std::string ext = core::normalize_ascii_lower(core::trim(extension));
  if (!ext.empty() && ext.front() != '.') {
    ext.insert(ext.begin(), '.');
  }
  return ext;
}

// extension_target accepts inputs ending with one of `extensions`.
inline TargetConfig extension_target(std::string name, const std::vector<std::string>& extensions,
                                     bool required = true) {
  TargetConfig config;
  config.name = std::move(name);
  config.kind = TargetKind::kExtension;
  config.strategy = StrategyKind::kExact;
  config.exact_mode = ExactMode::kSuffix;
  config.required = required;
  for (const auto& ext : extensions) {
    config.candidates.push_back(normalize_extension(ext));
  }
  return config;
}

}  // namespace dcm::matching
