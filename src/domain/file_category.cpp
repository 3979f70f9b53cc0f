#include "dcm/domain/file_category.h"

namespace dcm::domain {

std::string_view to_string(FileCategory category) {
  switch (category) {
    case FileCategory::kFinishedObservations:
      return "finished_observations";
    case FileCategory::kPlannedRoutes:
      return "planned_routes";
  }
  return "unknown";
}

std::optional<FileCategory> parse_file_category(std::string_view text) {
  if (text == "finished_observations" || text == "finished") {
    return FileCategory::kFinishedObservations;
  }
  if (text == "planned_routes" || text == "planned") {
    return FileCategory::kPlannedRoutes;
  }
  return std::nullopt;
}

std::string_view canonical_token(FileCategory category) {
  switch (category) {
    case FileCategory::kFinishedObservations:
      return "finished_points_and_tracks";
    case FileCategory::kPlannedRoutes:
      return "plan_routes";
  }
  return "";
}

std::string_view folder_name(FileCategory category) {
  switch (category) {
    case FileCategory::kFinishedObservations:
      return "Finished points";
    case FileCategory::kPlannedRoutes:
      return "Planned routes";
  }
  return "";
}

CategoryVocabulary CategoryVocabulary::defaults() {
  CategoryVocabulary vocabulary;
  vocabulary.keywords[FileCategory::kFinishedObservations] = {
      "_finished_points_and_tracks_", "finished points and tracks", "finished_points",
      "points_tracks",                "completed_points",
  };
  vocabulary.keywords[FileCategory::kPlannedRoutes] = {
      "_plan_routes_", "plan routes", "planned_routes", "route_plan", "plan_route",
      "routes_planned",
  };
  return vocabulary;
}

const std::vector<std::string>& CategoryVocabulary::keywords_for(FileCategory category) const {
  static const std::vector<std::string> kEmpty;
  const auto it = keywords.find(category);
  return it == keywords.end() ? kEmpty : it->second;
}

}  // namespace dcm::domain
