#pragma once

#include "dcm/matching/match_outcome.h"
#include "dcm/matching/multi_target_matcher.h"
#include "dcm/matching/target.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

// aggregate_to_json renders one AggregateMatch with every per-target outcome.
nlohmann::json aggregate_to_json(const dcm::matching::AggregateMatch& aggregate);

// run_multi_match evaluates every input against the targets and returns
// {"results": [...input order...], "ranking": [...best first, >= min_score...]}.
// Throws std::invalid_argument when a target configuration is invalid.
nlohmann::json run_multi_match(const std::vector<dcm::matching::TargetConfig>& targets,
                               const std::vector<std::string>& inputs, double min_score);
