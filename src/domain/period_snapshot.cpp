#include "dcm/domain/period_snapshot.h"

#include "dcm/core/json_text.h"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace dcm::domain {

std::string describe_slot(const CategorySlot& slot) {
  if (!slot.satisfied) {
    return kUnsatisfiedDetail;
  }
  if (slot.source == SatisfactionSource::kBackfill) {
    const std::string on = slot.resolved_date.has_value() ? core::format_iso(*slot.resolved_date)
                                                          : std::string{"unknown date"};
    return "backfilled from historical search on " + on;
  }
  return slot.last_path;
}

PeriodSnapshot make_period_snapshot(const std::vector<WorkUnitState>& states,
                                    const core::Date& period_date, core::Timestamp finished_at,
                                    const std::string& end_reason) {
  PeriodSnapshot snapshot;
  snapshot.period_date = core::format_iso(period_date);
  snapshot.finished_at = core::format_iso8601(finished_at);
  snapshot.end_reason = end_reason;

  for (const auto& state : states) {
    UnitEntry unit;
    unit.unit = state.identity().id.value;
    unit.team_number = state.identity().team_number;
    unit.status = std::string(to_string(state.status()));

    const auto& required = state.required_categories();
    for (const auto category : kAllFileCategories) {
      if (std::find(required.begin(), required.end(), category) == required.end()) {
        continue;
      }
      const auto& slot = state.slot(category);
      CategoryEntry entry;
      entry.category = std::string(to_string(category));
      entry.satisfied = slot.satisfied;
      entry.source = slot.satisfied ? std::string(to_string(slot.source)) : std::string{};
      entry.detail = describe_slot(slot);
      if (slot.satisfied) {
        entry.path = slot.last_path;
      }
      if (slot.resolved_date.has_value()) {
        entry.file_date = core::format_iso(*slot.resolved_date);
      }
      unit.categories.push_back(std::move(entry));
    }
    snapshot.units.push_back(std::move(unit));
  }

  return snapshot;
}

std::string to_json(const PeriodSnapshot& snapshot) {
  using json = nlohmann::json;

  json units = json::array();
  for (const auto& unit : snapshot.units) {
    json categories = json::array();
    for (const auto& entry : unit.categories) {
      json c;
      c["category"] = entry.category;
      c["satisfied"] = entry.satisfied;
      c["source"] = entry.source;
      c["detail"] = entry.detail;
      c["path"] = entry.path.has_value() ? json(*entry.path) : json(nullptr);
      c["file_date"] = entry.file_date.has_value() ? json(*entry.file_date) : json(nullptr);
      categories.push_back(std::move(c));
    }
    units.push_back({
        {"unit", unit.unit},
        {"team_number", unit.team_number},
        {"status", unit.status},
        {"categories", std::move(categories)},
    });
  }

  json j;
  j["snapshot_format_version"] = snapshot.snapshot_format_version;
  j["period_date"] = snapshot.period_date;
  j["finished_at"] = snapshot.finished_at;
  j["end_reason"] = snapshot.end_reason;
  j["units"] = std::move(units);
  return core::dump_json(j);
}

PeriodSnapshot period_snapshot_from_json(const std::string& json_str) {
  using json = nlohmann::json;

  const json j = json::parse(json_str);

  PeriodSnapshot snapshot;
  snapshot.snapshot_format_version = j.value("snapshot_format_version", 1);
  snapshot.period_date = j.at("period_date").get<std::string>();
  snapshot.finished_at = j.at("finished_at").get<std::string>();
  snapshot.end_reason = j.at("end_reason").get<std::string>();

  for (const auto& u : j.at("units")) {
    UnitEntry unit;
    unit.unit = u.at("unit").get<std::string>();
    unit.team_number = u.value("team_number", std::string{});
    unit.status = u.at("status").get<std::string>();
    for (const auto& c : u.at("categories")) {
      CategoryEntry entry;
      entry.category = c.at("category").get<std::string>();
      entry.satisfied = c.at("satisfied").get<bool>();
      entry.source = c.value("source", std::string{});
      entry.detail = c.at("detail").get<std::string>();
      if (c.contains("path") && !c.at("path").is_null()) {
        entry.path = c.at("path").get<std::string>();
      }
      if (c.contains("file_date") && !c.at("file_date").is_null()) {
        entry.file_date = c.at("file_date").get<std::string>();
      }
      unit.categories.push_back(std::move(entry));
    }
    snapshot.units.push_back(std::move(unit));
  }

  return snapshot;
}

}  // namespace dcm::domain
