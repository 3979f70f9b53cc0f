#include "dcm/storage/sqlite/sqlite_audit_log.h"

#include "dcm/core/json_text.h"

#include <nlohmann/json.hpp>

#include <sqlite3.h>
#include <stdexcept>

namespace dcm::storage::sqlite {

namespace {

std::string column_text(sqlite3_stmt* stmt, int col) {
  const auto* raw = sqlite3_column_text(stmt, col);
  return raw != nullptr ? std::string{reinterpret_cast<const char*>(raw)} : std::string{};  // NOLINT
}

}  // namespace

SqliteAuditLog::SqliteAuditLog(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

int SqliteAuditLog::next_index(const std::string& trace_id) {
  auto it = trace_indices_.find(trace_id);
  if (it != trace_indices_.end()) {
    return it->second++;
  }

  // New trace in this process: continue after whatever is already stored.
  int max_idx = -1;
  PreparedStatement stmt(db_->connection(),
                         "SELECT MAX(idx) FROM audit_events WHERE trace_id = ?");
  if (stmt.is_valid()) {
    stmt.bind_text(1, trace_id);
    if (sqlite3_step(stmt.get()) == SQLITE_ROW &&
        sqlite3_column_type(stmt.get(), 0) != SQLITE_NULL) {
      max_idx = sqlite3_column_int(stmt.get(), 0);
    }
  }
  trace_indices_[trace_id] = max_idx + 2;
  return max_idx + 1;
}

void SqliteAuditLog::append(const AuditEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  const int idx = next_index(event.trace_id);

  const nlohmann::json refs_json = event.refs;

  const char* sql = R"(
    INSERT INTO audit_events
      (event_id, trace_id, event_type, payload, created_at, refs_json, idx)
    VALUES (?, ?, ?, ?, ?, ?, ?)
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("SqliteAuditLog::append failed to prepare: " + stmt.error());
  }

  stmt.bind_text(1, event.event_id);
  stmt.bind_text(2, event.trace_id);
  stmt.bind_text(3, event.event_type);
  stmt.bind_text(4, event.payload);
  stmt.bind_text(5, event.created_at);
  stmt.bind_text(6, core::dump_json(refs_json));
  sqlite3_bind_int(stmt.get(), 7, idx);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    throw std::runtime_error("SqliteAuditLog::append failed: " +
                             std::string(sqlite3_errmsg(db_->connection())));
  }
}

std::vector<AuditEvent> SqliteAuditLog::query(const std::string& trace_id) const {
  std::lock_guard<std::mutex> lock(mutex_);

  const std::string sql =
      "SELECT event_id, trace_id, event_type, payload, created_at, refs_json"
      "  FROM audit_events" +
      std::string(trace_id.empty() ? " ORDER BY rowid" : " WHERE trace_id = ? ORDER BY idx");

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("SqliteAuditLog::query failed to prepare: " + stmt.error());
  }
  if (!trace_id.empty()) {
    stmt.bind_text(1, trace_id);
  }

  std::vector<AuditEvent> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    AuditEvent event;
    event.event_id = column_text(stmt.get(), 0);
    event.trace_id = column_text(stmt.get(), 1);
    event.event_type = column_text(stmt.get(), 2);
    event.payload = column_text(stmt.get(), 3);
    event.created_at = column_text(stmt.get(), 4);
    event.refs = nlohmann::json::parse(column_text(stmt.get(), 5)).get<std::vector<std::string>>();
    result.push_back(std::move(event));
  }

  return result;
}

}  // namespace dcm::storage::sqlite
