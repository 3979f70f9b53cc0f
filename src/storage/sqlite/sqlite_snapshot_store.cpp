#include "dcm/storage/sqlite/sqlite_snapshot_store.h"

#include <sqlite3.h>
#include <stdexcept>
#include <string>

namespace dcm::storage::sqlite {

SqliteSnapshotStore::SqliteSnapshotStore(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

void SqliteSnapshotStore::save(const std::string& period_date, const std::string& snapshot_json,
                               const std::string& saved_at) {
  const char* sql = R"(
    INSERT INTO period_snapshots (period_date, snapshot_json, saved_at)
    VALUES (?, ?, ?)
    ON CONFLICT(period_date) DO UPDATE SET
      snapshot_json = excluded.snapshot_json,
      saved_at = excluded.saved_at
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("SqliteSnapshotStore::save failed to prepare: " + stmt.error());
  }

  stmt.bind_text(1, period_date);
  stmt.bind_text(2, snapshot_json);
  stmt.bind_text(3, saved_at);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    throw std::runtime_error("SqliteSnapshotStore::save failed: " +
                             std::string(sqlite3_errmsg(db_->connection())));
  }
}

std::optional<std::string> SqliteSnapshotStore::get_snapshot_json(
    const std::string& period_date) const {
  const char* sql = "SELECT snapshot_json FROM period_snapshots WHERE period_date = ?";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return std::nullopt;
  }

  stmt.bind_text(1, period_date);

  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return std::string{
        reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0))};  // NOLINT
  }

  return std::nullopt;
}

}  // namespace dcm::storage::sqlite
