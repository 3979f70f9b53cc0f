#include "dcm/matching/similarity_scorer.h"

#include <algorithm>
#include <array>
#include <cstdlib>

namespace dcm::matching {

namespace {

struct BlockRange {
  std::size_t alo;
  std::size_t ahi;
  std::size_t blo;
  std::size_t bhi;
};

}  // namespace

MatchingBlock longest_common_block(std::string_view a, std::string_view b, std::size_t alo,
                                   std::size_t ahi, std::size_t blo, std::size_t bhi) {
  MatchingBlock best{alo, blo, 0};
  if (alo >= ahi || blo >= bhi) {
    return best;
  }

  // run[j - blo + 1] holds the length of the common run ending at (i, j).
  const std::size_t width = bhi - blo + 1;
  std::vector<std::size_t> prev(width, 0);
  std::vector<std::size_t> cur(width, 0);

  for (std::size_t i = alo; i < ahi; ++i) {
    for (std::size_t j = blo; j < bhi; ++j) {
      const std::size_t slot = j - blo + 1;
      if (a[i] == b[j]) {
        const std::size_t k = prev[slot - 1] + 1;
        cur[slot] = k;
        // Strictly greater keeps the earliest run on ties.
        if (k > best.size) {
          best = MatchingBlock{i + 1 - k, j + 1 - k, k};
        }
      } else {
        cur[slot] = 0;
      }
    }
    std::swap(prev, cur);
  }

  return best;
}

std::vector<MatchingBlock> matching_blocks(std::string_view a, std::string_view b) {
  std::vector<MatchingBlock> blocks;
  std::vector<BlockRange> pending{{0, a.size(), 0, b.size()}};

  while (!pending.empty()) {
    const BlockRange r = pending.back();
    pending.pop_back();

    const MatchingBlock block = longest_common_block(a, b, r.alo, r.ahi, r.blo, r.bhi);
    if (block.size == 0) {
      continue;
    }
    blocks.push_back(block);

    if (r.alo < block.a_pos && r.blo < block.b_pos) {
      pending.push_back({r.alo, block.a_pos, r.blo, block.b_pos});
    }
    if (block.a_pos + block.size < r.ahi && block.b_pos + block.size < r.bhi) {
      pending.push_back({block.a_pos + block.size, r.ahi, block.b_pos + block.size, r.bhi});
    }
  }

  std::sort(blocks.begin(), blocks.end());
  return blocks;
}

SimilarityScorer::SimilarityScorer(SimilarityWeights weights) : weights_(weights) {}

double SimilarityScorer::alignment_ratio(std::string_view a, std::string_view b) {
  const std::size_t total = a.size() + b.size();
  if (total == 0) {
    return 1.0;
  }

  std::size_t matched = 0;
  for (const auto& block : matching_blocks(a, b)) {
    matched += block.size;
  }
  return 2.0 * static_cast<double>(matched) / static_cast<double>(total);
}

double SimilarityScorer::char_set_overlap(std::string_view a, std::string_view b) {
  std::array<bool, 256> in_a{};
  std::array<bool, 256> in_b{};
  for (const char ch : a) {
    in_a[static_cast<unsigned char>(ch)] = true;
  }
  for (const char ch : b) {
    in_b[static_cast<unsigned char>(ch)] = true;
  }

  std::size_t intersection = 0;
  std::size_t uni = 0;
  for (std::size_t i = 0; i < in_a.size(); ++i) {
    if (in_a[i] && in_b[i]) {
      ++intersection;
    }
    if (in_a[i] || in_b[i]) {
      ++uni;
    }
  }
  if (uni == 0) {
    return 1.0;
  }
  return static_cast<double>(intersection) / static_cast<double>(uni);
}

double SimilarityScorer::length_agreement(std::string_view a, std::string_view b) {
  const std::size_t longest = std::max(a.size(), b.size());
  if (longest == 0) {
    return 1.0;
  }
  const std::size_t diff = a.size() > b.size() ? a.size() - b.size() : b.size() - a.size();
  return 1.0 - static_cast<double>(diff) / static_cast<double>(longest);
}

double SimilarityScorer::score(std::string_view a, std::string_view b) const {
  if (a == b) {
    return 1.0;
  }
  if (a.empty() || b.empty()) {
    return 0.0;
  }

  const double blended = weights_.alignment * alignment_ratio(a, b) +
                         weights_.char_overlap * char_set_overlap(a, b) +
                         weights_.length * length_agreement(a, b);
  return std::clamp(blended, 0.0, 1.0);
}

PrefixSimilarity SimilarityScorer::prefix_similarity(std::string_view a,
                                                     std::string_view b) const {
  const std::size_t n = std::min(a.size(), b.size());
  if (n == 0) {
    return PrefixSimilarity{0.0, score(a, b)};
  }
  return PrefixSimilarity{score(a.substr(0, n), b.substr(0, n)), score(a, b)};
}

double SimilarityScorer::prefix_biased(std::string_view a, std::string_view b,
                                       double prefix_weight) const {
  const auto sim = prefix_similarity(a, b);
  return std::clamp(prefix_weight * sim.prefix + (1.0 - prefix_weight) * sim.overall, 0.0, 1.0);
}

}  // namespace dcm::matching
