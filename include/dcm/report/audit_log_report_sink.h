#pragma once

#include "dcm/core/clock.h"
#include "dcm/core/id_generator.h"
#include "dcm/core/ids.h"
#include "dcm/report/report_sink.h"
#include "dcm/storage/audit_log.h"
#include "dcm/storage/snapshot_store.h"

namespace dcm::report {

// AuditLogReportSink records every monitor report as an AuditEvent with a JSON
// payload under one session trace. Event types:
//   FileResolved, FileRejected, BackfillResolved, BackfillMissed,
//   FilesystemError, StatusTick, PeriodCompleted
//
// When a snapshot store is supplied, on_period_end also persists the snapshot.
// All collaborators are borrowed and must outlive the sink.
class AuditLogReportSink final : public IReportSink {
 public:
  AuditLogReportSink(storage::IAuditLog& audit_log, core::IIdGenerator& id_gen,
                     const core::IClock& clock, core::TraceId trace_id,
                     storage::ISnapshotStore* snapshots = nullptr);

  void on_resolved(const ResolvedFileReport& report) override;
  void on_rejected(const RejectionReport& report) override;
  void on_backfill(const BackfillReport& report) override;
  void on_filesystem_error(const FilesystemErrorReport& report) override;
  void on_status(const StatusReport& report) override;
  void on_period_end(const domain::PeriodSnapshot& snapshot) override;

  [[nodiscard]] const core::TraceId& trace_id() const { return trace_id_; }

 private:
  void emit(const std::string& event_type, const std::string& payload,
            std::vector<std::string> refs);

  storage::IAuditLog& audit_log_;
  core::IIdGenerator& id_gen_;
  const core::IClock& clock_;
  core::TraceId trace_id_;
  storage::ISnapshotStore* snapshots_;
};

}  // namespace dcm::report
