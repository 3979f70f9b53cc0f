#pragma once

#include "dcm/matching/match_outcome.h"
#include "dcm/matching/target.h"

#include <string>
#include <string_view>
#include <vector>

namespace dcm::matching {

// MultiTargetMatcher evaluates one input against an ordered set of named targets.
//
// It is a class (not a struct) because it holds an invariant: target names are
// unique and every target configuration was validated at construction. After
// construction it is immutable, so match() is const and may run concurrently.
//
// Every target is always attempted; a missing required target never stops the
// evaluation of later ones, so the AggregateMatch carries full diagnostics.
class MultiTargetMatcher {
 public:
  // Throws std::invalid_argument on duplicate names or an invalid TargetConfig.
  explicit MultiTargetMatcher(std::vector<TargetConfig> targets);

  [[nodiscard]] AggregateMatch match(std::string_view input) const;

  // Preserves input order.
  [[nodiscard]] std::vector<AggregateMatch> match_all(const std::vector<std::string>& inputs) const;

  // Aggregates with overall_score >= min_score, highest first. Equal scores keep
  // input order.
  [[nodiscard]] std::vector<AggregateMatch> best_matches(const std::vector<std::string>& inputs,
                                                         double min_score) const;

  [[nodiscard]] const std::vector<Target>& targets() const { return targets_; }

 private:
  std::vector<Target> targets_;
  double total_weight_{0.0};
};

}  // namespace dcm::matching
