#include "dcm/matching/target.h"

#include <stdexcept>

namespace dcm::matching {

std::string_view to_string(TargetKind kind) {
  switch (kind) {
    case TargetKind::kIdentifier:
      return "identifier";
    case TargetKind::kDate:
      return "date";
    case TargetKind::kFileCategory:
      return "file_category";
    case TargetKind::kExtension:
      return "extension";
    case TargetKind::kFreePattern:
      break;
  }
  return "free_pattern";
}

Target::Target(TargetConfig config) : config_(std::move(config)) {
  if (config_.name.empty()) {
    throw std::invalid_argument("Target name must not be empty");
  }
  if (config_.fuzzy_threshold < 0.0 || config_.fuzzy_threshold > 1.0) {
    throw std::invalid_argument("Target '" + config_.name + "': fuzzy_threshold must be in [0, 1]");
  }
  if (config_.prefix_weight < 0.0 || config_.prefix_weight > 1.0) {
    throw std::invalid_argument("Target '" + config_.name + "': prefix_weight must be in [0, 1]");
  }
  if (!(config_.weight > 0.0)) {
    throw std::invalid_argument("Target '" + config_.name + "': weight must be positive");
  }

  auto flags = std::regex::ECMAScript;
  if (!config_.case_sensitive) {
    flags |= std::regex::icase;
  }
  compiled_.reserve(config_.patterns.size());
  for (const auto& pattern : config_.patterns) {
    try {
      compiled_.emplace_back(pattern, flags);
    } catch (const std::regex_error& e) {
      throw std::invalid_argument("Target '" + config_.name + "': invalid pattern '" + pattern +
                                  "': " + e.what());
    }
  }

  if (!config_.uses_patterns()) {
    strategy_ = make_strategy(config_.strategy, config_.strategy_options());
  }
}

MatchOutcome Target::evaluate(std::string_view input) const {
  if (config_.uses_patterns()) {
    return evaluate_patterns(std::string{input});
  }
  return evaluate_candidates(input);
}

// First pattern (in configured order) with an acceptable hit wins. Within one
// pattern every occurrence is tried so a leading non-date digit run does not
// hide a valid date further along the name.
MatchOutcome Target::evaluate_patterns(const std::string& input) const {
  for (const auto& re : compiled_) {
    const auto end = std::sregex_iterator();
    for (auto it = std::sregex_iterator(input.begin(), input.end(), re); it != end; ++it) {
      const std::smatch& m = *it;
      const std::size_t group = (m.size() > 1 && m[1].matched) ? 1 : 0;
      std::string text = m.str(group);
      if (config_.validator && !config_.validator(text)) {
        continue;
      }

      MatchOutcome outcome;
      outcome.span = MatchSpan{static_cast<std::size_t>(m.position(group)),
                               static_cast<std::size_t>(m.length(group))};
      outcome.matched = std::move(text);
      outcome.score = 1.0;
      outcome.confidence = kPatternConfidence;
      outcome.strategy_used = MatchSource::kPattern;
      outcome.best_score = 1.0;
      return outcome;
    }
  }
  return MatchOutcome::no_match();
}

MatchOutcome Target::evaluate_candidates(std::string_view input) const {
  const CandidateMatch hit = strategy_->match(input, config_.candidates);
  if (!hit.matched()) {
    return MatchOutcome::no_match(hit.best_score);
  }

  const std::string& candidate = config_.candidates[*hit.candidate_index];
  if (config_.validator && !config_.validator(candidate)) {
    return MatchOutcome::no_match(hit.best_score);
  }

  MatchOutcome outcome;
  outcome.matched = candidate;
  outcome.candidate_index = hit.candidate_index;
  outcome.score = hit.score;
  outcome.confidence = hit.confidence;
  outcome.span = hit.span;
  outcome.strategy_used = hit.source;
  outcome.best_score = hit.best_score;
  return outcome;
}

}  // namespace dcm::matching
