#pragma once

#include "dcm/core/date.h"
#include "dcm/core/ids.h"
#include "dcm/domain/file_category.h"

#include <filesystem>
#include <string>
#include <vector>

namespace dcm::history {

// FolderLayout encodes the workspace convention used by field teams:
//
//   <root>/<YYYYMM>/<YYYYMMDD>/<category folder>/<identifier>_<category token>_<YYYYMMDD><ext>
//
// e.g. root/202508/20250830/Finished points/MAHROUS_finished_points_and_tracks_20250830.kmz
class FolderLayout {
 public:
  // The first extension is the primary one used when building expected names.
  explicit FolderLayout(std::filesystem::path root,
                        std::vector<std::string> extensions = {".kmz"});

  [[nodiscard]] const std::filesystem::path& root() const { return root_; }
  [[nodiscard]] const std::vector<std::string>& extensions() const { return extensions_; }

  [[nodiscard]] std::filesystem::path day_folder(const core::Date& day) const;
  [[nodiscard]] std::filesystem::path category_folder(const core::Date& day,
                                                      domain::FileCategory category) const;

  [[nodiscard]] std::string expected_filename(const core::WorkUnitId& unit,
                                              domain::FileCategory category,
                                              const core::Date& file_date,
                                              const std::string& extension) const;

  // One expected name per accepted extension, primary extension first.
  [[nodiscard]] std::vector<std::string> expected_filenames(const core::WorkUnitId& unit,
                                                            domain::FileCategory category,
                                                            const core::Date& file_date) const;

 private:
  std::filesystem::path root_;
  std::vector<std::string> extensions_;
};

}  // namespace dcm::history
