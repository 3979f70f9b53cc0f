#include "history.h"

#include "dcm/core/clock.h"
#include "dcm/core/date.h"
#include "dcm/core/json_text.h"
#include "dcm/domain/file_category.h"
#include "dcm/history/folder_layout.h"
#include "dcm/history/historical_search.h"
#include "dcm/resolve/identity_resolver.h"

#include "history_logic.h"
#include "shared/arg_parser.h"
#include "shared/reference_config.h"
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct HistoryCliConfig {
  std::optional<std::string> config_path;
  std::optional<std::string> root;
  std::optional<std::string> unit;
  std::optional<dcm::domain::FileCategory> category;
  std::optional<dcm::core::Date> period_date;
};

std::vector<dcm::apps::Option<HistoryCliConfig>> history_options() {
  return {
      {"--config", true, "Reference config JSON",
       [](HistoryCliConfig& c, const std::string& v) {
         c.config_path = v;
         return true;
       }},
      {"--root", true, "Root of the dated workspace tree",
       [](HistoryCliConfig& c, const std::string& v) {
         c.root = v;
         return true;
       }},
      {"--unit", true, "Work unit identifier",
       [](HistoryCliConfig& c, const std::string& v) {
         c.unit = v;
         return true;
       }},
      {"--category", true, "File category (finished|planned)",
       [](HistoryCliConfig& c, const std::string& v) {
         c.category = dcm::domain::parse_file_category(v);
         if (!c.category.has_value()) {
           std::cerr << "Invalid --category: " << v << " (valid: finished, planned)\n";
           return false;
         }
         return true;
       }},
      {"--date", true, "Collection period day (default: today)",
       [](HistoryCliConfig& c, const std::string& v) {
         c.period_date = dcm::core::parse_date_token(v);
         if (!c.period_date.has_value()) {
           std::cerr << "Invalid --date: " << v << "\n";
           return false;
         }
         return true;
       }},
  };
}

}  // namespace

int cmd_history(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = history_options();
  const auto parsed = dcm::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    return 1;
  }
  const auto& config = parsed.config;
  if (!config.config_path || !config.root || !config.unit || !config.category) {
    dcm::apps::print_usage(
        std::cerr, "dcm_cli history --config <json> --root <dir> --unit <id> --category <c>",
        options);
    return 1;
  }

  const auto reference = dcm::apps::load_reference_config(*config.config_path);
  if (!reference.has_value()) {
    std::cerr << "Error: " << reference.error() << "\n";
    return 1;
  }
  if (const auto error = dcm::apps::validate_reference_config(reference.value()); !error.empty()) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  const dcm::core::SystemClock clock;
  const auto period = config.period_date.value_or(dcm::core::local_date_of(clock.now()));

  try {
    const dcm::resolve::IdentityResolver resolver(
        reference.value().work_units, dcm::apps::make_resolver_config(reference.value(), period));
    const dcm::core::WorkUnitId unit{*config.unit};
    if (resolver.find_unit(unit) == nullptr) {
      std::cerr << "Error: unknown work unit '" << unit.value << "'\n";
      return 1;
    }

    const dcm::history::HistoricalSearch search(
        resolver, dcm::history::FolderLayout(*config.root, reference.value().extensions),
        dcm::apps::make_history_options(reference.value()));
    std::cout << dcm::core::dump_json(run_history_lookup(search, unit, *config.category, period), 2)
              << "\n";
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
