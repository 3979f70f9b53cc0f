#pragma once

#include "dcm/matching/match_outcome.h"
#include "dcm/matching/match_strategy.h"

#include <functional>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace dcm::matching {

constexpr double kDefaultFuzzyThreshold = 0.65;
constexpr double kDefaultPrefixWeight = 0.7;
constexpr double kPatternConfidence = 0.9;

enum class TargetKind {
  kIdentifier,
  kDate,
  kFileCategory,
  kExtension,
  kFreePattern,
};

[[nodiscard]] std::string_view to_string(TargetKind kind);

// TargetConfig is the complete, immutable description of one matching goal.
// A target is either candidate-based (candidates + strategy) or pattern-based
// (patterns, tried in order); a non-empty `patterns` list selects the latter.
//
// validator, when set, receives the matched candidate or extracted text and may
// veto the match (e.g. an eight-digit run that is not a real calendar date).
struct TargetConfig {
  std::string name;
  TargetKind kind{TargetKind::kFreePattern};
  std::vector<std::string> candidates;
  std::vector<std::string> patterns;
  StrategyKind strategy{StrategyKind::kHybrid};
  ExactMode exact_mode{ExactMode::kContains};
  FuzzyMode fuzzy_mode{FuzzyMode::kWhole};
  double fuzzy_threshold{kDefaultFuzzyThreshold};
  double prefix_weight{kDefaultPrefixWeight};
  bool case_sensitive{false};
  bool required{false};
  double weight{1.0};
  std::function<bool(std::string_view)> validator;

  [[nodiscard]] bool uses_patterns() const { return !patterns.empty(); }
  [[nodiscard]] StrategyOptions strategy_options() const {
    return StrategyOptions{exact_mode, fuzzy_mode, fuzzy_threshold, prefix_weight,
                           case_sensitive};
  }
};

// Target binds a TargetConfig to its compiled regexes and strategy instance.
// Construction validates the configuration and throws std::invalid_argument on:
// empty name, threshold or prefix weight outside [0, 1], non-positive weight,
// or a pattern that does not compile.
class Target {
 public:
  explicit Target(TargetConfig config);

  [[nodiscard]] const TargetConfig& config() const { return config_; }
  [[nodiscard]] const std::string& name() const { return config_.name; }

  [[nodiscard]] MatchOutcome evaluate(std::string_view input) const;

 private:
  [[nodiscard]] MatchOutcome evaluate_patterns(const std::string& input) const;
  [[nodiscard]] MatchOutcome evaluate_candidates(std::string_view input) const;

  TargetConfig config_;
  std::vector<std::regex> compiled_;
  std::shared_ptr<const IMatchStrategy> strategy_;
};

}  // namespace dcm::matching
