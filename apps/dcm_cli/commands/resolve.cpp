#include "resolve.h"

#include "dcm/core/clock.h"
#include "dcm/core/date.h"
#include "dcm/core/json_text.h"
#include "dcm/resolve/identity_resolver.h"

#include "resolve_logic.h"
#include "shared/arg_parser.h"
#include "shared/reference_config.h"
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct ResolveCliConfig {
  std::optional<std::string> config_path;
  std::optional<dcm::core::Date> period_date;
};

std::vector<dcm::apps::Option<ResolveCliConfig>> resolve_options() {
  return {
      {"--config", true, "Reference config JSON",
       [](ResolveCliConfig& c, const std::string& v) {
         c.config_path = v;
         return true;
       }},
      {"--date", true, "Collection period day (default: today)",
       [](ResolveCliConfig& c, const std::string& v) {
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

int cmd_resolve(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = resolve_options();
  const auto parsed = dcm::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    return 1;
  }
  if (!parsed.config.config_path.has_value() || parsed.positional.empty()) {
    dcm::apps::print_usage(std::cerr, "dcm_cli resolve --config <json> [--date D] <filename>...",
                           options);
    return 1;
  }

  const auto reference = dcm::apps::load_reference_config(*parsed.config.config_path);
  if (!reference.has_value()) {
    std::cerr << "Error: " << reference.error() << "\n";
    return 1;
  }
  if (const auto error = dcm::apps::validate_reference_config(reference.value()); !error.empty()) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  const dcm::core::SystemClock clock;
  const auto period = parsed.config.period_date.value_or(dcm::core::local_date_of(clock.now()));

  try {
    const dcm::resolve::IdentityResolver resolver(
        reference.value().work_units, dcm::apps::make_resolver_config(reference.value(), period));
    std::cout << dcm::core::dump_json(resolve_files_json(resolver, parsed.positional), 2) << "\n";
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
