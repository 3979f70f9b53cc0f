#include "dcm/history/folder_layout.h"

#include "dcm/matching/presets.h"

namespace dcm::history {

FolderLayout::FolderLayout(std::filesystem::path root, std::vector<std::string> extensions)
    : root_(std::move(root)) {
  for (const auto& ext : extensions) {
    auto normalized = matching::normalize_extension(ext);
    if (!normalized.empty()) {
      extensions_.push_back(std::move(normalized));
    }
  }
  if (extensions_.empty()) {
    extensions_.emplace_back(".kmz");
  }
}

std::filesystem::path FolderLayout::day_folder(const core::Date& day) const {
  return root_ / core::format_month(day) / core::format_compact(day);
}

std::filesystem::path FolderLayout::category_folder(const core::Date& day,
                                                    domain::FileCategory category) const {
  return day_folder(day) / std::string(domain::folder_name(category));
}

std::string FolderLayout::expected_filename(const core::WorkUnitId& unit,
                                            domain::FileCategory category,
                                            const core::Date& file_date,
                                            const std::string& extension) const {
  return unit.value + "_" + std::string(domain::canonical_token(category)) + "_" +
         core::format_compact(file_date) + extension;
}

std::vector<std::string> FolderLayout::expected_filenames(const core::WorkUnitId& unit,
                                                          domain::FileCategory category,
                                                          const core::Date& file_date) const {
  std::vector<std::string> names;
  names.reserve(extensions_.size());
  for (const auto& ext : extensions_) {
    names.push_back(expected_filename(unit, category, file_date, ext));
  }
  return names;
}

}  // namespace dcm::history
