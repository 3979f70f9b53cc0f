#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace dcm::matching {

// Blend weights for SimilarityScorer. Alignment dominates; the three weights
// sum to 1.0 so identical strings score exactly 1.0.
struct SimilarityWeights {
  double alignment{0.60};
  double char_overlap{0.25};
  double length{0.15};
};

// MatchingBlock is one maximal common run: a[a_pos, a_pos+size) == b[b_pos, b_pos+size).
struct MatchingBlock {
  std::size_t a_pos{0};
  std::size_t b_pos{0};
  std::size_t size{0};
  auto operator<=>(const MatchingBlock&) const = default;
};

struct PrefixSimilarity {
  double prefix{0.0};   // score over the first min(len(a), len(b)) bytes
  double overall{0.0};  // score over the full strings
};

// SimilarityScorer computes a normalized similarity in [0, 1] between two byte strings.
//
//   score = w_align * ratio + w_overlap * jaccard(chars) + w_len * (1 - |la - lb| / max(la, lb))
//
// ratio is the Ratcliff/Obershelp measure 2M / (la + lb), where M is the total
// size of the matching blocks found by recursively taking the longest common
// run (earliest in a, then earliest in b, on ties).
//
// The scorer is stateless apart from its weights: score() is const, has no side
// effects and returns the same value for the same inputs on every call, so one
// instance may be shared across threads.
class SimilarityScorer {
 public:
  explicit SimilarityScorer(SimilarityWeights weights = SimilarityWeights{});

  // Identical inputs (including two empty strings) score 1.0; otherwise an
  // empty side scores 0.0.
  [[nodiscard]] double score(std::string_view a, std::string_view b) const;

  [[nodiscard]] PrefixSimilarity prefix_similarity(std::string_view a, std::string_view b) const;

  // prefix_weight * prefix + (1 - prefix_weight) * overall.
  // Filenames put the identifying token first, so the prefix-aligned portion is
  // weighted more heavily than trailing dates and category words.
  [[nodiscard]] double prefix_biased(std::string_view a, std::string_view b,
                                     double prefix_weight) const;

  [[nodiscard]] const SimilarityWeights& weights() const { return weights_; }

  [[nodiscard]] static double alignment_ratio(std::string_view a, std::string_view b);
  [[nodiscard]] static double char_set_overlap(std::string_view a, std::string_view b);
  [[nodiscard]] static double length_agreement(std::string_view a, std::string_view b);

 private:
  SimilarityWeights weights_;
};

// matching_blocks returns the non-overlapping common runs of a and b ordered by
// position, using the same recursive longest-run decomposition as alignment_ratio.
[[nodiscard]] std::vector<MatchingBlock> matching_blocks(std::string_view a, std::string_view b);

// longest_common_block returns the longest common run of a[alo, ahi) and
// b[blo, bhi). size == 0 when the ranges share no byte.
[[nodiscard]] MatchingBlock longest_common_block(std::string_view a, std::string_view b,
                                                 std::size_t alo, std::size_t ahi,
                                                 std::size_t blo, std::size_t bhi);

}  // namespace dcm::matching
