#pragma once

#include "dcm/core/date.h"
#include "dcm/core/ids.h"
#include "dcm/domain/file_category.h"
#include "dcm/history/historical_search.h"

#include <nlohmann/json.hpp>

// history_result_to_json renders a lookup result, including "none" results and
// any directories that could not be read.
nlohmann::json history_result_to_json(const dcm::history::HistoricalLookupResult& result);

// run_history_lookup answers "what last satisfied (unit, category) as of
// period_date?" the way the monitor does at the deadline: the search runs up to
// the last day the category's accepted range allows for that period.
nlohmann::json run_history_lookup(const dcm::history::HistoricalSearch& search,
                                  const dcm::core::WorkUnitId& unit,
                                  dcm::domain::FileCategory category,
                                  const dcm::core::Date& period_date);
