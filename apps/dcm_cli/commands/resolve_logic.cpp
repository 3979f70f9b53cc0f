#include "resolve_logic.h"

using json = nlohmann::json;

json resolve_files_json(const dcm::resolve::IdentityResolver& resolver,
                        const std::vector<std::string>& filenames) {
  json out = json::array();
  for (const auto& filename : filenames) {
    const auto result = resolver.resolve(filename);
    json entry;
    entry["input"] = filename;
    entry["accepted"] = result.has_value();
    if (result.has_value()) {
      const auto& resolved = result.value();
      entry["filename"] = resolved.filename;
      entry["unit"] = resolved.unit.value;
      entry["category"] = dcm::domain::to_string(resolved.category);
      entry["file_date"] = dcm::core::format_iso(resolved.file_date);
      entry["strategy"] = dcm::matching::to_string(resolved.identifier_strategy);
      entry["score"] = resolved.identifier_score;
      entry["overall_score"] = resolved.overall_score;
    } else {
      const auto& rejection = result.error();
      entry["filename"] = rejection.filename;
      entry["reason"] = dcm::resolve::to_string(rejection.reason);
      entry["detail"] = rejection.detail;
      entry["best_score"] = rejection.best_score;
    }
    out.push_back(std::move(entry));
  }
  return out;
}
