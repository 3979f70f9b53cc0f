#include "dcm/matching/match_strategy.h"

#include "dcm/core/normalization.h"

#include <algorithm>

namespace dcm::matching {

namespace {

constexpr double kFuzzyConfidenceScale = 0.8;
constexpr double kFuzzyConfidenceFloor = 0.2;
constexpr double kTokenWholeWeight = 0.4;
constexpr double kTokenWordWeight = 0.6;
constexpr double kTokenWordHit = 0.7;

std::string fold_for_matching(std::string_view text, bool case_sensitive, char separator) {
  std::string folded = case_sensitive ? std::string{text} : core::normalize_ascii_lower(text);
  return core::fold_separators(folded, separator);
}

bool ends_with(std::string_view text, std::string_view suffix) {
  return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

}  // namespace

std::string_view to_string(MatchSource source) {
  switch (source) {
    case MatchSource::kExact:
      return "exact";
    case MatchSource::kFuzzy:
      return "fuzzy";
    case MatchSource::kPattern:
      return "pattern";
    case MatchSource::kNone:
      break;
  }
  return "none";
}

std::string_view to_string(StrategyKind kind) {
  switch (kind) {
    case StrategyKind::kExact:
      return "exact";
    case StrategyKind::kFuzzy:
      return "fuzzy";
    case StrategyKind::kHybrid:
      break;
  }
  return "hybrid";
}

std::optional<StrategyKind> parse_strategy_kind(std::string_view text) {
  if (text == "exact") {
    return StrategyKind::kExact;
  }
  if (text == "fuzzy") {
    return StrategyKind::kFuzzy;
  }
  if (text == "hybrid") {
    return StrategyKind::kHybrid;
  }
  return std::nullopt;
}

// ── ExactStrategy ────────────────────────────────────────────────────────────

ExactStrategy::ExactStrategy(ExactMode mode, bool case_sensitive)
    : mode_(mode), case_sensitive_(case_sensitive) {}

CandidateMatch ExactStrategy::match(std::string_view input,
                                    const std::vector<std::string>& candidates) const {
  const std::string folded_input = fold_for_matching(input, case_sensitive_, '_');

  for (std::size_t i = 0; i < candidates.size(); ++i) {
    if (candidates[i].empty()) {
      continue;
    }
    const std::string folded = fold_for_matching(candidates[i], case_sensitive_, '_');

    std::optional<MatchSpan> span;
    switch (mode_) {
      case ExactMode::kContains: {
        const auto pos = folded_input.find(folded);
        if (pos != std::string::npos) {
          span = MatchSpan{pos, folded.size()};
        }
        break;
      }
      case ExactMode::kEquals:
        if (folded_input == folded) {
          span = MatchSpan{0, folded.size()};
        }
        break;
      case ExactMode::kSuffix:
        if (ends_with(folded_input, folded)) {
          span = MatchSpan{folded_input.size() - folded.size(), folded.size()};
        }
        break;
    }

    if (span.has_value()) {
      return CandidateMatch{
          .candidate_index = i,
          .score = 1.0,
          .confidence = 1.0,
          .span = span,
          .source = MatchSource::kExact,
          .best_score = 1.0,
      };
    }
  }

  return CandidateMatch{};
}

// ── FuzzyStrategy ────────────────────────────────────────────────────────────

FuzzyStrategy::FuzzyStrategy(FuzzyMode mode, double threshold, double prefix_weight,
                             bool case_sensitive, SimilarityScorer scorer)
    : mode_(mode),
      threshold_(threshold),
      prefix_weight_(prefix_weight),
      case_sensitive_(case_sensitive),
      scorer_(scorer) {}

double FuzzyStrategy::token_aware_score(std::string_view input, std::string_view candidate) const {
  const std::string cand = core::trim(candidate);
  const std::string in = core::trim(input);
  const double whole = scorer_.score(in, cand);

  const auto input_words = core::split_words(in);
  const auto candidate_words = core::split_words(cand);
  if (candidate_words.empty()) {
    return kTokenWholeWeight * whole;
  }

  std::size_t hits = 0;
  for (const auto& word : candidate_words) {
    const bool hit = std::any_of(input_words.begin(), input_words.end(), [&](const auto& w) {
      return scorer_.score(word, w) > kTokenWordHit;
    });
    if (hit) {
      ++hits;
    }
  }
  const double word_ratio =
      static_cast<double>(hits) / static_cast<double>(candidate_words.size());
  return kTokenWholeWeight * whole + kTokenWordWeight * word_ratio;
}

double FuzzyStrategy::score_pair(std::string_view input, std::string_view candidate) const {
  switch (mode_) {
    case FuzzyMode::kPrefixBiased:
      return scorer_.prefix_biased(input, candidate, prefix_weight_);
    case FuzzyMode::kTokenAware:
      return token_aware_score(input, candidate);
    case FuzzyMode::kWhole:
      break;
  }
  return scorer_.score(input, candidate);
}

// The span anchors on the longest common run and covers as much of the
// candidate as the input can hold from there. Prefix-biased matches always
// anchor at the start of the input.
MatchSpan FuzzyStrategy::span_for(std::string_view input, std::string_view candidate) const {
  if (mode_ == FuzzyMode::kPrefixBiased) {
    return MatchSpan{0, std::min(input.size(), candidate.size())};
  }
  const MatchingBlock block =
      longest_common_block(input, candidate, 0, input.size(), 0, candidate.size());
  const std::size_t start = block.a_pos > block.b_pos ? block.a_pos - block.b_pos : 0;
  return MatchSpan{start, std::min(candidate.size(), input.size() - start)};
}

CandidateMatch FuzzyStrategy::match(std::string_view input,
                                    const std::vector<std::string>& candidates) const {
  const char separator = mode_ == FuzzyMode::kTokenAware ? ' ' : '_';
  const std::string folded_input = fold_for_matching(input, case_sensitive_, separator);

  CandidateMatch result;
  std::optional<std::size_t> best_index;
  std::string best_folded;
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    if (candidates[i].empty()) {
      continue;
    }
    std::string folded = fold_for_matching(candidates[i], case_sensitive_, separator);
    const double s = score_pair(folded_input, folded);
    // Strictly greater: the first candidate wins ties.
    if (!best_index.has_value() || s > result.best_score) {
      result.best_score = s;
      best_index = i;
      best_folded = std::move(folded);
    }
  }

  if (!best_index.has_value() || result.best_score < threshold_) {
    return result;
  }

  result.candidate_index = best_index;
  result.score = result.best_score;
  result.confidence = result.score * kFuzzyConfidenceScale + kFuzzyConfidenceFloor;
  result.span = span_for(folded_input, best_folded);
  result.source = MatchSource::kFuzzy;
  return result;
}

// ── HybridStrategy ───────────────────────────────────────────────────────────

HybridStrategy::HybridStrategy(ExactStrategy exact, FuzzyStrategy fuzzy)
    : exact_(exact), fuzzy_(std::move(fuzzy)) {}

CandidateMatch HybridStrategy::match(std::string_view input,
                                     const std::vector<std::string>& candidates) const {
  auto exact = exact_.match(input, candidates);
  if (exact.matched()) {
    return exact;
  }
  return fuzzy_.match(input, candidates);
}

std::shared_ptr<const IMatchStrategy> make_strategy(StrategyKind kind,
                                                    const StrategyOptions& options) {
  ExactStrategy exact(options.exact_mode, options.case_sensitive);
  FuzzyStrategy fuzzy(options.fuzzy_mode, options.fuzzy_threshold, options.prefix_weight,
                      options.case_sensitive);

  switch (kind) {
    case StrategyKind::kExact:
      return std::make_shared<ExactStrategy>(exact);
    case StrategyKind::kFuzzy:
      return std::make_shared<FuzzyStrategy>(std::move(fuzzy));
    case StrategyKind::kHybrid:
      break;
  }
  return std::make_shared<HybridStrategy>(exact, std::move(fuzzy));
}

}  // namespace dcm::matching
