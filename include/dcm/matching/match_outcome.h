#pragma once

#include "dcm/matching/match_strategy.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dcm::matching {

// MatchOutcome is the result of attempting one Target against one input string.
//
// Invariant: when `matched` is empty, score and confidence are 0.0 and span is
// empty. Use no_match() to build misses so the invariant cannot drift;
// best_score is diagnostic only and may be non-zero on a miss.
struct MatchOutcome {
  std::optional<std::string> matched;  // candidate text, or extracted text for pattern targets
  std::optional<std::size_t> candidate_index;
  double score{0.0};
  double confidence{0.0};
  std::optional<MatchSpan> span;
  MatchSource strategy_used{MatchSource::kNone};
  double best_score{0.0};

  [[nodiscard]] bool is_match() const { return matched.has_value(); }

  [[nodiscard]] static MatchOutcome no_match(double best_score = 0.0) {
    MatchOutcome outcome;
    outcome.best_score = best_score;
    return outcome;
  }
};

// AggregateMatch is one input evaluated against every configured Target.
// Completeness is derived from unmatched_required rather than stored, so the two
// can never disagree.
struct AggregateMatch {
  std::string input;
  std::map<std::string, MatchOutcome> outcomes;  // keyed by target name
  double overall_score{0.0};                     // sum(weight * score) / sum(weight)
  std::vector<std::string> unmatched_required;   // in target order

  [[nodiscard]] bool is_complete() const { return unmatched_required.empty(); }

  // Returns nullptr when no target with that name was configured.
  [[nodiscard]] const MatchOutcome* outcome(std::string_view target_name) const {
    const auto it = outcomes.find(std::string{target_name});
    return it == outcomes.end() ? nullptr : &it->second;
  }
};

}  // namespace dcm::matching
