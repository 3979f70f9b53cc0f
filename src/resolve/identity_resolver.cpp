#include "dcm/resolve/identity_resolver.h"

#include "dcm/matching/presets.h"

#include <filesystem>
#include <iomanip>
#include <sstream>

namespace dcm::resolve {

namespace {

std::string format_score(double score) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(3) << score;
  return oss.str();
}

std::string basename_of(std::string_view path) {
  return std::filesystem::path(std::string{path}).filename().string();
}

Rejection reject(RejectionReason reason, const std::string& filename, std::string detail,
                 double best_score = 0.0) {
  return Rejection{
      .reason = reason,
      .filename = filename,
      .detail = std::move(detail),
      .best_score = best_score,
  };
}

}  // namespace

std::string_view to_string(RejectionReason reason) {
  switch (reason) {
    case RejectionReason::kUnsupportedExtension:
      return "UnsupportedExtension";
    case RejectionReason::kNoIdentifierMatch:
      return "NoIdentifierMatch";
    case RejectionReason::kNoCategoryMatch:
      return "NoCategoryMatch";
    case RejectionReason::kNoDateFound:
      return "NoDateFound";
    case RejectionReason::kDateOutOfRange:
      return "DateOutOfRange";
  }
  return "Unknown";
}

AcceptedDateRanges AcceptedDateRanges::for_period(const core::Date& period_day,
                                                  int planned_lookahead_days) {
  AcceptedDateRanges ranges;
  ranges.by_category[domain::FileCategory::kFinishedObservations] = DateRange{period_day, period_day};
  ranges.by_category[domain::FileCategory::kPlannedRoutes] =
      DateRange{core::add_days(period_day, 1), core::add_days(period_day, planned_lookahead_days)};
  return ranges;
}

std::optional<DateRange> AcceptedDateRanges::range_for(domain::FileCategory category) const {
  const auto it = by_category.find(category);
  if (it == by_category.end()) {
    return std::nullopt;
  }
  return it->second;
}

IdentityResolver::IdentityResolver(std::vector<domain::WorkUnitIdentity> roster,
                                   ResolverConfig config)
    : roster_(std::move(roster)), config_(std::move(config)), matcher_(build_targets()) {}

std::vector<matching::TargetConfig> IdentityResolver::build_targets() {
  using matching::TargetConfig;

  TargetConfig identifier;
  identifier.name = kIdentifierTarget;
  identifier.kind = matching::TargetKind::kIdentifier;
  identifier.strategy = matching::StrategyKind::kHybrid;
  identifier.exact_mode = matching::ExactMode::kContains;
  identifier.fuzzy_mode = matching::FuzzyMode::kPrefixBiased;
  identifier.fuzzy_threshold = config_.fuzzy_threshold;
  identifier.prefix_weight = config_.prefix_weight;
  identifier.required = true;
  for (std::size_t i = 0; i < roster_.size(); ++i) {
    for (auto& name : roster_[i].accepted_names()) {
      identifier.candidates.push_back(std::move(name));
      name_owner_.push_back(i);
    }
  }

  TargetConfig category;
  category.name = kCategoryTarget;
  category.kind = matching::TargetKind::kFileCategory;
  category.strategy = matching::StrategyKind::kHybrid;
  category.exact_mode = matching::ExactMode::kContains;
  category.fuzzy_mode = matching::FuzzyMode::kTokenAware;
  category.fuzzy_threshold = config_.fuzzy_threshold;
  category.required = true;
  for (const auto cat : domain::kAllFileCategories) {
    for (const auto& keyword : config_.vocabulary.keywords_for(cat)) {
      category.candidates.push_back(keyword);
      keyword_owner_.push_back(cat);
    }
  }

  std::vector<TargetConfig> targets;
  targets.push_back(matching::extension_target(kExtensionTarget, config_.extensions));
  targets.back().weight = 0.5;
  targets.push_back(std::move(identifier));
  targets.push_back(std::move(category));
  targets.push_back(matching::date_target(kDateTarget));
  return targets;
}

const domain::WorkUnitIdentity* IdentityResolver::find_unit(const core::WorkUnitId& id) const {
  for (const auto& unit : roster_) {
    if (unit.id == id) {
      return &unit;
    }
  }
  return nullptr;
}

Identification IdentityResolver::identify(std::string_view filename) const {
  Identification id;
  id.filename = basename_of(filename);
  id.aggregate = matcher_.match(id.filename);

  if (const auto* ext = id.aggregate.outcome(kExtensionTarget)) {
    id.extension_accepted = ext->is_match();
  }
  if (const auto* unit = id.aggregate.outcome(kIdentifierTarget);
      unit != nullptr && unit->candidate_index.has_value()) {
    id.unit = roster_[name_owner_[*unit->candidate_index]].id;
  }
  if (const auto* cat = id.aggregate.outcome(kCategoryTarget);
      cat != nullptr && cat->candidate_index.has_value()) {
    id.category = keyword_owner_[*cat->candidate_index];
  }
  if (const auto* date = id.aggregate.outcome(kDateTarget);
      date != nullptr && date->matched.has_value()) {
    id.file_date = core::parse_date_token(*date->matched);
  }
  return id;
}

core::Result<ResolvedFile, Rejection> IdentityResolver::resolve(std::string_view filename) const {
  using ResultT = core::Result<ResolvedFile, Rejection>;

  const Identification id = identify(filename);
  const auto& agg = id.aggregate;

  if (!id.extension_accepted) {
    return ResultT::err(reject(RejectionReason::kUnsupportedExtension, id.filename,
                               "extension of '" + id.filename + "' is not an accepted archive type"));
  }

  const auto* identifier = agg.outcome(kIdentifierTarget);
  if (!id.unit.has_value()) {
    const double best = identifier != nullptr ? identifier->best_score : 0.0;
    return ResultT::err(reject(RejectionReason::kNoIdentifierMatch, id.filename,
                               "no known work unit name in '" + id.filename +
                                   "' (best score " + format_score(best) + ", threshold " +
                                   format_score(config_.fuzzy_threshold) + ")",
                               best));
  }

  if (!id.category.has_value()) {
    const auto* cat = agg.outcome(kCategoryTarget);
    const double best = cat != nullptr ? cat->best_score : 0.0;
    return ResultT::err(reject(RejectionReason::kNoCategoryMatch, id.filename,
                               "no category keyword in '" + id.filename + "' (best score " +
                                   format_score(best) + ")",
                               best));
  }

  if (!id.file_date.has_value()) {
    return ResultT::err(reject(RejectionReason::kNoDateFound, id.filename,
                               "no valid calendar date in '" + id.filename + "'"));
  }

  if (const auto range = config_.date_ranges.range_for(*id.category);
      range.has_value() && !range->contains(*id.file_date)) {
    return ResultT::err(reject(RejectionReason::kDateOutOfRange, id.filename,
                               "date " + core::format_iso(*id.file_date) + " outside accepted " +
                                   std::string(domain::to_string(*id.category)) + " range " +
                                   core::format_iso(range->first) + ".." +
                                   core::format_iso(range->last),
                               identifier->score));
  }

  return ResultT::ok(ResolvedFile{
      .unit = *id.unit,
      .category = *id.category,
      .file_date = *id.file_date,
      .filename = id.filename,
      .identifier_strategy = identifier->strategy_used,
      .identifier_score = identifier->score,
      .overall_score = agg.overall_score,
  });
}

}  // namespace dcm::resolve
