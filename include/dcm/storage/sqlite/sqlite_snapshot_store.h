#pragma once

#include "dcm/storage/snapshot_store.h"
#include "dcm/storage/sqlite/sqlite_db.h"

#include <memory>

namespace dcm::storage::sqlite {

// SqliteSnapshotStore persists period snapshots in the period_snapshots table,
// one row per period date. save() upserts and throws std::runtime_error on failure.
class SqliteSnapshotStore final : public ISnapshotStore {
 public:
  explicit SqliteSnapshotStore(std::shared_ptr<SqliteDb> db);

  void save(const std::string& period_date, const std::string& snapshot_json,
            const std::string& saved_at) override;

  [[nodiscard]] std::optional<std::string> get_snapshot_json(
      const std::string& period_date) const override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace dcm::storage::sqlite
