#include "dcm/storage/snapshot_store.h"

namespace dcm::storage {

void InMemorySnapshotStore::save(const std::string& period_date, const std::string& snapshot_json,
                                 const std::string& /*saved_at*/) {
  std::lock_guard<std::mutex> lock(mutex_);
  snapshots_[period_date] = snapshot_json;
}

std::optional<std::string> InMemorySnapshotStore::get_snapshot_json(
    const std::string& period_date) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = snapshots_.find(period_date);
  if (it == snapshots_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace dcm::storage
