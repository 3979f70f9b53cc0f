#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dcm::domain {

enum class FileCategory {
  kFinishedObservations,
  kPlannedRoutes,
};

constexpr std::array<FileCategory, 2> kAllFileCategories = {
    FileCategory::kFinishedObservations,
    FileCategory::kPlannedRoutes,
};

// Stable machine name ("finished_observations" / "planned_routes").
[[nodiscard]] std::string_view to_string(FileCategory category);

// Accepts the machine name or the short forms "finished" / "planned".
[[nodiscard]] std::optional<FileCategory> parse_file_category(std::string_view text);

// Token placed between identifier and date in the canonical filename.
[[nodiscard]] std::string_view canonical_token(FileCategory category);

// Sub-folder of a day folder that holds this category.
[[nodiscard]] std::string_view folder_name(FileCategory category);

// CategoryVocabulary holds the keyword lists used to recognise each category in
// a filename. Keywords are data: new spellings are added in configuration, not
// in code. Order within a list matters for tie-breaking (earlier wins).
struct CategoryVocabulary {
  std::map<FileCategory, std::vector<std::string>> keywords;

  // The vocabulary observed in field submissions.
  [[nodiscard]] static CategoryVocabulary defaults();

  [[nodiscard]] const std::vector<std::string>& keywords_for(FileCategory category) const;
};

}  // namespace dcm::domain
