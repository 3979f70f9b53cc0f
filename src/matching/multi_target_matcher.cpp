#include "dcm/matching/multi_target_matcher.h"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace dcm::matching {

MultiTargetMatcher::MultiTargetMatcher(std::vector<TargetConfig> targets) {
  std::set<std::string> seen;
  targets_.reserve(targets.size());
  for (auto& config : targets) {
    if (!seen.insert(config.name).second) {
      throw std::invalid_argument("Duplicate target name: " + config.name);
    }
    total_weight_ += config.weight;
    targets_.emplace_back(std::move(config));
  }
}

AggregateMatch MultiTargetMatcher::match(std::string_view input) const {
  AggregateMatch aggregate;
  aggregate.input = std::string{input};

  double weighted = 0.0;
  for (const auto& target : targets_) {
    MatchOutcome outcome = target.evaluate(input);
    weighted += target.config().weight * outcome.score;
    if (target.config().required && !outcome.is_match()) {
      aggregate.unmatched_required.push_back(target.name());
    }
    aggregate.outcomes.emplace(target.name(), std::move(outcome));
  }

  aggregate.overall_score = total_weight_ > 0.0 ? weighted / total_weight_ : 0.0;
  return aggregate;
}

std::vector<AggregateMatch> MultiTargetMatcher::match_all(
    const std::vector<std::string>& inputs) const {
  std::vector<AggregateMatch> results;
  results.reserve(inputs.size());
  for (const auto& input : inputs) {
    results.push_back(match(input));
  }
  return results;
}

std::vector<AggregateMatch> MultiTargetMatcher::best_matches(
    const std::vector<std::string>& inputs, double min_score) const {
  std::vector<AggregateMatch> results;
  for (auto& aggregate : match_all(inputs)) {
    if (aggregate.overall_score >= min_score) {
      results.push_back(std::move(aggregate));
    }
  }

  std::stable_sort(results.begin(), results.end(), [](const auto& a, const auto& b) {
    return a.overall_score > b.overall_score;
  });
  return results;
}

}  // namespace dcm::matching
