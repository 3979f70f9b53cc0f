#pragma once

#include "dcm/storage/audit_log.h"
#include "dcm/storage/sqlite/sqlite_db.h"

#include <map>
#include <memory>
#include <mutex>

namespace dcm::storage::sqlite {

// SqliteAuditLog implements IAuditLog on the audit_events table.
// Events of one trace are ordered by a per-trace idx column assigned under mutex_.
// append() throws std::runtime_error when the insert fails.
class SqliteAuditLog final : public IAuditLog {
 public:
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;

 private:
  [[nodiscard]] int next_index(const std::string& trace_id);

  std::shared_ptr<SqliteDb> db_;
  mutable std::mutex mutex_;
  std::map<std::string, int> trace_indices_;
};

}  // namespace dcm::storage::sqlite
