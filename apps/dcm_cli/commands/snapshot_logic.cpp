#include "snapshot_logic.h"

#include "dcm/core/json_text.h"
#include "dcm/domain/period_snapshot.h"

#include <nlohmann/json.hpp>

dcm::core::Result<std::string, std::string> read_snapshot(
    const dcm::storage::ISnapshotStore& store, const dcm::core::Date& period_date) {
  using ResultT = dcm::core::Result<std::string, std::string>;

  const std::string key = dcm::core::format_iso(period_date);
  const auto stored = store.get_snapshot_json(key);
  if (!stored.has_value()) {
    return ResultT::err("no snapshot stored for period " + key);
  }

  try {
    // Round-trip through the typed snapshot so malformed rows are reported.
    const auto snapshot = dcm::domain::period_snapshot_from_json(*stored);
    return ResultT::ok(
        dcm::core::dump_json(nlohmann::json::parse(dcm::domain::to_json(snapshot)), 2));
  } catch (const nlohmann::json::exception& e) {
    return ResultT::err("stored snapshot for " + key + " is malformed: " + e.what());
  }
}
