#pragma once

#include "dcm/resolve/identity_resolver.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

// resolve_files_json resolves each filename and returns one JSON object per
// input, in order. Accepted files carry unit/category/date and the identifier
// strategy; rejected ones carry the rejection reason and detail.
nlohmann::json resolve_files_json(const dcm::resolve::IdentityResolver& resolver,
                                  const std::vector<std::string>& filenames);
