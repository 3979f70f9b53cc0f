#include "snapshot.h"

#include "dcm/core/date.h"
#include "dcm/storage/sqlite/sqlite_db.h"
#include "dcm/storage/sqlite/sqlite_snapshot_store.h"

#include "shared/arg_parser.h"
#include "snapshot_logic.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct SnapshotCliConfig {
  std::optional<std::string> db_path;
  std::optional<dcm::core::Date> period_date;
};

}  // namespace

int cmd_snapshot(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<dcm::apps::Option<SnapshotCliConfig>> options = {
      {"--db", true, "SQLite database written by dcm_monitor",
       [](SnapshotCliConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
      {"--date", true, "Collection period day",
       [](SnapshotCliConfig& c, const std::string& v) {
         c.period_date = dcm::core::parse_date_token(v);
         if (!c.period_date.has_value()) {
           std::cerr << "Invalid --date: " << v << "\n";
           return false;
         }
         return true;
       }},
  };
  const auto parsed = dcm::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    return 1;
  }
  if (!parsed.config.db_path || !parsed.config.period_date) {
    dcm::apps::print_usage(std::cerr, "dcm_cli snapshot --db <path> --date <YYYY-MM-DD>",
                           options);
    return 1;
  }

  auto db_result = dcm::storage::sqlite::SqliteDb::open(*parsed.config.db_path);
  if (!db_result.has_value()) {
    std::cerr << "Failed to open database: " << db_result.error() << "\n";
    return 1;
  }
  auto db = db_result.value();
  auto schema_result = db->ensure_schema_v1();
  if (!schema_result.has_value()) {
    std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
    return 1;
  }

  const dcm::storage::sqlite::SqliteSnapshotStore store(db);
  const auto snapshot = read_snapshot(store, *parsed.config.period_date);
  if (!snapshot.has_value()) {
    std::cerr << "Error: " << snapshot.error() << "\n";
    return 1;
  }
  std::cout << snapshot.value() << "\n";
  return 0;
}
