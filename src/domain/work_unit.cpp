#include "dcm/domain/work_unit.h"

#include <algorithm>

namespace dcm::domain {

std::vector<std::string> WorkUnitIdentity::accepted_names() const {
  std::vector<std::string> names;
  names.reserve(aliases.size() + 1);
  const auto add = [&names](const std::string& name) {
    if (!name.empty() && std::find(names.begin(), names.end(), name) == names.end()) {
      names.push_back(name);
    }
  };
  add(id.value);
  for (const auto& alias : aliases) {
    add(alias);
  }
  return names;
}

}  // namespace dcm::domain
