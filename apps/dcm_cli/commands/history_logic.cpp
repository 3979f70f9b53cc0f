#include "history_logic.h"

using json = nlohmann::json;

json history_result_to_json(const dcm::history::HistoricalLookupResult& result) {
  json out;
  out["found"] = result.found();
  out["strategy"] = dcm::history::to_string(result.strategy);
  out["path"] = result.path.has_value() ? json(result.path->string()) : json(nullptr);
  out["effective_date"] = result.effective_date.has_value()
                              ? json(dcm::core::format_iso(*result.effective_date))
                              : json(nullptr);
  out["folder_date"] = result.folder_date.has_value()
                           ? json(dcm::core::format_iso(*result.folder_date))
                           : json(nullptr);
  out["score"] = result.score;
  out["reason"] = result.reason;
  out["scan_errors"] = result.scan_errors;
  return out;
}

json run_history_lookup(const dcm::history::HistoricalSearch& search,
                        const dcm::core::WorkUnitId& unit, dcm::domain::FileCategory category,
                        const dcm::core::Date& period_date) {
  json out = history_result_to_json(search.find_for_period(unit, category, period_date));
  out["unit"] = unit.value;
  out["category"] = dcm::domain::to_string(category);
  out["period_date"] = dcm::core::format_iso(period_date);
  return out;
}
