#pragma once

#include "dcm/matching/similarity_scorer.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dcm::matching {

enum class StrategyKind {
  kExact,
  kFuzzy,
  kHybrid,
};

enum class ExactMode {
  kContains,  // candidate appears anywhere in the input
  kEquals,    // whole input equals the candidate
  kSuffix,    // input ends with the candidate (extensions)
};

enum class FuzzyMode {
  kWhole,         // plain SimilarityScorer::score
  kPrefixBiased,  // prefix-aligned portion weighted by prefix_weight
  kTokenAware,    // blend of whole-string score and per-word hit ratio (keyword vocabularies)
};

// MatchSource records which mechanism produced a result.
enum class MatchSource {
  kNone,
  kExact,
  kFuzzy,
  kPattern,
};

[[nodiscard]] std::string_view to_string(MatchSource source);
[[nodiscard]] std::string_view to_string(StrategyKind kind);
[[nodiscard]] std::optional<StrategyKind> parse_strategy_kind(std::string_view text);

struct MatchSpan {
  std::size_t start{0};
  std::size_t length{0};
  auto operator<=>(const MatchSpan&) const = default;
};

// CandidateMatch is the raw answer of a strategy over one candidate list.
// best_score carries the highest score seen even when nothing cleared the
// threshold, so a miss can still be explained.
struct CandidateMatch {
  std::optional<std::size_t> candidate_index;
  double score{0.0};
  double confidence{0.0};
  std::optional<MatchSpan> span;
  MatchSource source{MatchSource::kNone};
  double best_score{0.0};

  [[nodiscard]] bool matched() const { return candidate_index.has_value(); }
};

struct StrategyOptions {
  ExactMode exact_mode{ExactMode::kContains};
  FuzzyMode fuzzy_mode{FuzzyMode::kWhole};
  double fuzzy_threshold{0.65};
  double prefix_weight{0.7};
  bool case_sensitive{false};
};

// IMatchStrategy answers "which candidate, if any, does this input identify".
// Implementations are immutable after construction and safe to share across threads.
//
// Contract for every implementation:
// - Empty candidate list -> no match.
// - Empty candidate strings are never matched.
// - Ties resolve to the earliest candidate in the supplied order.
class IMatchStrategy {
 public:
  virtual ~IMatchStrategy() = default;

  [[nodiscard]] virtual CandidateMatch match(std::string_view input,
                                             const std::vector<std::string>& candidates) const = 0;
  [[nodiscard]] virtual StrategyKind kind() const = 0;

 protected:
  IMatchStrategy() = default;
  IMatchStrategy(const IMatchStrategy&) = default;
  IMatchStrategy& operator=(const IMatchStrategy&) = default;
  IMatchStrategy(IMatchStrategy&&) = default;
  IMatchStrategy& operator=(IMatchStrategy&&) = default;
};

// ExactStrategy scores 1.0 on a hit and 0.0 otherwise, never anything in between.
// Name separators (space, hyphen, underscore) are folded before comparison.
class ExactStrategy final : public IMatchStrategy {
 public:
  ExactStrategy(ExactMode mode, bool case_sensitive);

  [[nodiscard]] CandidateMatch match(std::string_view input,
                                     const std::vector<std::string>& candidates) const override;
  [[nodiscard]] StrategyKind kind() const override { return StrategyKind::kExact; }

 private:
  ExactMode mode_;
  bool case_sensitive_;
};

// FuzzyStrategy keeps the best-scoring candidate at or above the threshold.
// Confidence is score * 0.8 + 0.2.
class FuzzyStrategy final : public IMatchStrategy {
 public:
  FuzzyStrategy(FuzzyMode mode, double threshold, double prefix_weight, bool case_sensitive,
                SimilarityScorer scorer = SimilarityScorer{});

  [[nodiscard]] CandidateMatch match(std::string_view input,
                                     const std::vector<std::string>& candidates) const override;
  [[nodiscard]] StrategyKind kind() const override { return StrategyKind::kFuzzy; }

  // Score of a single (already folded) input/candidate pair under this strategy's mode.
  [[nodiscard]] double score_pair(std::string_view input, std::string_view candidate) const;

 private:
  [[nodiscard]] double token_aware_score(std::string_view input, std::string_view candidate) const;
  [[nodiscard]] MatchSpan span_for(std::string_view input, std::string_view candidate) const;

  FuzzyMode mode_;
  double threshold_;
  double prefix_weight_;
  bool case_sensitive_;
  SimilarityScorer scorer_;
};

// HybridStrategy tries exact first and falls back to fuzzy. The result's source
// field reports which one answered.
class HybridStrategy final : public IMatchStrategy {
 public:
  HybridStrategy(ExactStrategy exact, FuzzyStrategy fuzzy);

  [[nodiscard]] CandidateMatch match(std::string_view input,
                                     const std::vector<std::string>& candidates) const override;
  [[nodiscard]] StrategyKind kind() const override { return StrategyKind::kHybrid; }

 private:
  ExactStrategy exact_;
  FuzzyStrategy fuzzy_;
};

[[nodiscard]] std::shared_ptr<const IMatchStrategy> make_strategy(StrategyKind kind,
                                                                  const StrategyOptions& options);

}  // namespace dcm::matching
