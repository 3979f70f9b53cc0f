#pragma once

#include "dcm/core/ids.h"

#include <optional>
#include <string>
#include <vector>

namespace dcm::domain {

// WorkUnitIdentity is one entry of the period's reference listing.
// Immutable once the listing is loaded.
//
// `id` is the canonical token used in expected filenames (e.g. "MAHROUS");
// aliases are the other spellings contributors are known to type.
struct WorkUnitIdentity {
  core::WorkUnitId id;
  std::string team_number;
  std::vector<std::string> aliases;
  std::vector<std::string> leaders;
  std::optional<std::string> sheet_id;

  // Identifier first, then aliases in listing order, without duplicates or empties.
  [[nodiscard]] std::vector<std::string> accepted_names() const;
};

}  // namespace dcm::domain
