#pragma once

#include "dcm/core/result.h"
#include "dcm/domain/file_category.h"
#include "dcm/domain/work_unit.h"
#include "dcm/matching/match_outcome.h"
#include "dcm/matching/multi_target_matcher.h"
#include "dcm/matching/target.h"
#include "dcm/resolve/resolution.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dcm::resolve {

constexpr const char* kIdentifierTarget = "identifier";
constexpr const char* kCategoryTarget = "category";
constexpr const char* kDateTarget = "date";
constexpr const char* kExtensionTarget = "extension";

struct ResolverConfig {
  std::vector<std::string> extensions{".kmz"};
  domain::CategoryVocabulary vocabulary{domain::CategoryVocabulary::defaults()};
  double fuzzy_threshold{matching::kDefaultFuzzyThreshold};
  double prefix_weight{matching::kDefaultPrefixWeight};
  AcceptedDateRanges date_ranges;
};

// Identification is the unvalidated reading of a filename: whatever the four
// targets found, before any date-range policy is applied.
struct Identification {
  std::string filename;
  matching::AggregateMatch aggregate;
  std::optional<core::WorkUnitId> unit;
  std::optional<domain::FileCategory> category;
  std::optional<core::Date> file_date;
  bool extension_accepted{false};
};

// IdentityResolver (the file validator) maps a dropped filename to the work
// unit and category it belongs to.
//
// Targets, all required:
//   extension   exact suffix over accepted extensions
//   identifier  hybrid over every unit's accepted names, fuzzy side prefix-biased
//   category    hybrid over the category keyword lists, fuzzy side token-aware
//   date        first real calendar date found in the name
//
// Immutable after construction; resolve() and identify() are const and safe to
// call from several threads.
class IdentityResolver {
 public:
  // Throws std::invalid_argument if the derived target configuration is invalid
  // (e.g. threshold outside [0, 1]).
  IdentityResolver(std::vector<domain::WorkUnitIdentity> roster, ResolverConfig config);

  // Only the final path component of `filename` is considered.
  [[nodiscard]] core::Result<ResolvedFile, Rejection> resolve(std::string_view filename) const;

  [[nodiscard]] Identification identify(std::string_view filename) const;

  [[nodiscard]] const std::vector<domain::WorkUnitIdentity>& roster() const { return roster_; }
  [[nodiscard]] const ResolverConfig& config() const { return config_; }
  [[nodiscard]] const domain::WorkUnitIdentity* find_unit(const core::WorkUnitId& id) const;

 private:
  [[nodiscard]] std::vector<matching::TargetConfig> build_targets();

  std::vector<domain::WorkUnitIdentity> roster_;
  ResolverConfig config_;
  std::vector<std::size_t> name_owner_;             // identifier candidate -> roster index
  std::vector<domain::FileCategory> keyword_owner_;  // category candidate -> category
  matching::MultiTargetMatcher matcher_;
};

}  // namespace dcm::resolve
