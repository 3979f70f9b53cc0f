#include "reference_config.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <set>
#include <sstream>

namespace dcm::apps {

namespace {

using json = nlohmann::json;

std::vector<std::string> string_list(const json& j, const char* key) {
  std::vector<std::string> out;
  if (!j.contains(key) || j.at(key).is_null()) {
    return out;
  }
  for (const auto& item : j.at(key)) {
    out.push_back(item.get<std::string>());
  }
  return out;
}

domain::WorkUnitIdentity parse_work_unit(const json& j) {
  domain::WorkUnitIdentity unit;
  unit.id = core::WorkUnitId{j.at("identifier").get<std::string>()};
  unit.team_number = j.value("team_number", std::string{});
  unit.aliases = string_list(j, "aliases");
  unit.leaders = string_list(j, "leaders");
  if (j.contains("sheet_id") && !j.at("sheet_id").is_null()) {
    unit.sheet_id = j.at("sheet_id").get<std::string>();
  }
  return unit;
}

}  // namespace

std::optional<std::pair<int, int>> parse_clock_time(const std::string& text) {
  if (text.size() != 5 || text[2] != ':') {
    return std::nullopt;
  }
  for (const std::size_t i : {0U, 1U, 3U, 4U}) {
    if (text[i] < '0' || text[i] > '9') {
      return std::nullopt;
    }
  }
  const int hour = (text[0] - '0') * 10 + (text[1] - '0');
  const int minute = (text[3] - '0') * 10 + (text[4] - '0');
  if (hour > 23 || minute > 59) {
    return std::nullopt;
  }
  return std::make_pair(hour, minute);
}

core::Result<ReferenceConfig, std::string> parse_reference_config(const std::string& json_text) {
  using ResultT = core::Result<ReferenceConfig, std::string>;

  ReferenceConfig config;
  try {
    const json j = json::parse(json_text);
    if (!j.is_object()) {
      return ResultT::err("reference config must be a JSON object");
    }
    if (!j.contains("work_units") || !j.at("work_units").is_array()) {
      return ResultT::err("reference config: 'work_units' array is required");
    }
    for (const auto& unit : j.at("work_units")) {
      config.work_units.push_back(parse_work_unit(unit));
    }

    if (j.contains("extensions")) {
      config.extensions = string_list(j, "extensions");
    }

    if (j.contains("categories")) {
      const auto& categories = j.at("categories");
      for (const auto& [key, value] : categories.items()) {
        const auto category = domain::parse_file_category(key);
        if (!category.has_value()) {
          return ResultT::err("reference config: unknown category '" + key + "'");
        }
        config.vocabulary.keywords[*category] = string_list(value, "keywords");
      }
    }

    config.fuzzy_threshold = j.value("fuzzy_threshold", config.fuzzy_threshold);
    config.lookback_days = j.value("lookback_days", config.lookback_days);
    config.planned_lookahead_days = j.value("planned_lookahead_days", config.planned_lookahead_days);
    config.status_interval_seconds =
        j.value("status_interval_seconds", config.status_interval_seconds);
    config.urgent_remaining_threshold =
        j.value("urgent_remaining_threshold", config.urgent_remaining_threshold);
    config.historical_workers = j.value("historical_workers", config.historical_workers);

    if (j.contains("deadline")) {
      const auto text = j.at("deadline").get<std::string>();
      const auto hm = parse_clock_time(text);
      if (!hm.has_value()) {
        return ResultT::err("reference config: 'deadline' must be HH:MM, got '" + text + "'");
      }
      config.deadline_hour = hm->first;
      config.deadline_minute = hm->second;
    }

    if (j.contains("urgent_hour")) {
      if (j.at("urgent_hour").is_null()) {
        config.urgent_hour.reset();
      } else {
        config.urgent_hour = j.at("urgent_hour").get<int>();
      }
    }
  } catch (const json::exception& e) {
    return ResultT::err(std::string("reference config: ") + e.what());
  }

  return ResultT::ok(std::move(config));
}

core::Result<ReferenceConfig, std::string> load_reference_config(
    const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    return core::Result<ReferenceConfig, std::string>::err("cannot open reference config " +
                                                           path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return parse_reference_config(buffer.str());
}

std::string validate_reference_config(const ReferenceConfig& config) {
  if (config.work_units.empty()) {
    return "reference config lists no work units";
  }
  std::set<std::string> seen;
  for (const auto& unit : config.work_units) {
    if (unit.id.value.empty()) {
      return "work unit with empty identifier";
    }
    if (!seen.insert(unit.id.value).second) {
      return "duplicate work unit identifier '" + unit.id.value + "'";
    }
  }
  if (config.extensions.empty()) {
    return "at least one accepted extension is required";
  }
  for (const auto& ext : config.extensions) {
    if (ext.empty()) {
      return "accepted extensions must not be empty";
    }
  }
  for (const auto category : domain::kAllFileCategories) {
    if (config.vocabulary.keywords_for(category).empty()) {
      return "no keywords configured for category " + std::string(domain::to_string(category));
    }
  }
  if (config.fuzzy_threshold < 0.0 || config.fuzzy_threshold > 1.0) {
    return "fuzzy_threshold must be in [0, 1]";
  }
  if (config.lookback_days < 0) {
    return "lookback_days must not be negative";
  }
  if (config.planned_lookahead_days < 1) {
    return "planned_lookahead_days must be at least 1";
  }
  if (config.status_interval_seconds <= 0) {
    return "status_interval_seconds must be positive";
  }
  if (config.urgent_hour.has_value() && (*config.urgent_hour < 0 || *config.urgent_hour > 23)) {
    return "urgent_hour must be in [0, 23]";
  }
  if (config.historical_workers == 0) {
    return "historical_workers must be at least 1";
  }
  return "";
}

resolve::ResolverConfig make_resolver_config(const ReferenceConfig& config,
                                             const core::Date& period_date) {
  resolve::ResolverConfig resolver;
  resolver.extensions = config.extensions;
  resolver.vocabulary = config.vocabulary;
  resolver.fuzzy_threshold = config.fuzzy_threshold;
  resolver.date_ranges =
      resolve::AcceptedDateRanges::for_period(period_date, config.planned_lookahead_days);
  return resolver;
}

history::HistoricalSearchOptions make_history_options(const ReferenceConfig& config) {
  return history::HistoricalSearchOptions{config.lookback_days, config.historical_workers};
}

}  // namespace dcm::apps
