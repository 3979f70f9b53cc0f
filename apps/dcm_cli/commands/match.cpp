#include "match.h"

#include "dcm/core/json_text.h"
#include "dcm/matching/presets.h"
#include "dcm/matching/target.h"

#include "match_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct MatchCliConfig {
  std::vector<std::string> candidates;
  dcm::matching::StrategyKind strategy{dcm::matching::StrategyKind::kHybrid};
  dcm::matching::ExactMode exact_mode{dcm::matching::ExactMode::kContains};
  dcm::matching::FuzzyMode fuzzy_mode{dcm::matching::FuzzyMode::kWhole};
  double threshold{dcm::matching::kDefaultFuzzyThreshold};
  double min_score{0.0};
  bool with_date{false};
};

std::vector<std::string> split_list(const std::string& text) {
  std::vector<std::string> out;
  std::string current;
  for (const char c : text) {
    if (c == ',') {
      out.push_back(current);
      current.clear();
    } else {
      current += c;
    }
  }
  out.push_back(current);
  return out;
}

bool parse_unit_interval(const std::string& flag, const std::string& value, double& out) {
  try {
    out = std::stod(value);
  } catch (const std::exception&) {
    std::cerr << "Invalid " << flag << ": " << value << "\n";
    return false;
  }
  if (out < 0.0 || out > 1.0) {
    std::cerr << "Invalid " << flag << ": " << value << " (must be in [0, 1])\n";
    return false;
  }
  return true;
}

std::vector<dcm::apps::Option<MatchCliConfig>> match_options() {
  using dcm::matching::ExactMode;
  using dcm::matching::FuzzyMode;
  return {
      {"--candidates", true, "Comma-separated candidate list",
       [](MatchCliConfig& c, const std::string& v) {
         c.candidates = split_list(v);
         return true;
       }},
      {"--strategy", true, "Matching strategy (exact|fuzzy|hybrid)",
       [](MatchCliConfig& c, const std::string& v) {
         const auto kind = dcm::matching::parse_strategy_kind(v);
         if (!kind.has_value()) {
           std::cerr << "Invalid --strategy: " << v << " (valid: exact, fuzzy, hybrid)\n";
           return false;
         }
         c.strategy = *kind;
         return true;
       }},
      {"--exact-mode", true, "Exact comparison (contains|equals|suffix)",
       [](MatchCliConfig& c, const std::string& v) {
         if (v == "contains") {
           c.exact_mode = ExactMode::kContains;
         } else if (v == "equals") {
           c.exact_mode = ExactMode::kEquals;
         } else if (v == "suffix") {
           c.exact_mode = ExactMode::kSuffix;
         } else {
           std::cerr << "Invalid --exact-mode: " << v << " (valid: contains, equals, suffix)\n";
           return false;
         }
         return true;
       }},
      {"--fuzzy-mode", true, "Fuzzy comparison (whole|prefix|token)",
       [](MatchCliConfig& c, const std::string& v) {
         if (v == "whole") {
           c.fuzzy_mode = FuzzyMode::kWhole;
         } else if (v == "prefix") {
           c.fuzzy_mode = FuzzyMode::kPrefixBiased;
         } else if (v == "token") {
           c.fuzzy_mode = FuzzyMode::kTokenAware;
         } else {
           std::cerr << "Invalid --fuzzy-mode: " << v << " (valid: whole, prefix, token)\n";
           return false;
         }
         return true;
       }},
      {"--threshold", true, "Fuzzy acceptance threshold in [0, 1]",
       [](MatchCliConfig& c, const std::string& v) {
         return parse_unit_interval("--threshold", v, c.threshold);
       }},
      {"--min-score", true, "Minimum overall score for the ranking",
       [](MatchCliConfig& c, const std::string& v) {
         return parse_unit_interval("--min-score", v, c.min_score);
       }},
      {"--with-date", false, "Also require a calendar date in each input",
       [](MatchCliConfig& c, const std::string&) {
         c.with_date = true;
         return true;
       }},
  };
}

}  // namespace

int cmd_match(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = match_options();
  const auto parsed = dcm::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    return 1;
  }
  const auto& config = parsed.config;
  if (config.candidates.empty() || parsed.positional.empty()) {
    dcm::apps::print_usage(std::cerr, "dcm_cli match --candidates <a,b,...> [options] <input>...",
                           options);
    return 1;
  }

  dcm::matching::TargetConfig candidates;
  candidates.name = "candidates";
  candidates.kind = dcm::matching::TargetKind::kIdentifier;
  candidates.candidates = config.candidates;
  candidates.strategy = config.strategy;
  candidates.exact_mode = config.exact_mode;
  candidates.fuzzy_mode = config.fuzzy_mode;
  candidates.fuzzy_threshold = config.threshold;
  candidates.required = true;

  std::vector<dcm::matching::TargetConfig> targets{candidates};
  if (config.with_date) {
    targets.push_back(dcm::matching::date_target("date"));
  }

  try {
    const auto out = run_multi_match(targets, parsed.positional, config.min_score);
    std::cout << dcm::core::dump_json(out, 2) << "\n";
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
