#include "dcm/report/audit_log_report_sink.h"

#include "dcm/core/json_text.h"

#include <nlohmann/json.hpp>

namespace dcm::report {

using json = nlohmann::json;

AuditLogReportSink::AuditLogReportSink(storage::IAuditLog& audit_log, core::IIdGenerator& id_gen,
                                       const core::IClock& clock, core::TraceId trace_id,
                                       storage::ISnapshotStore* snapshots)
    : audit_log_(audit_log),
      id_gen_(id_gen),
      clock_(clock),
      trace_id_(std::move(trace_id)),
      snapshots_(snapshots) {}

void AuditLogReportSink::emit(const std::string& event_type, const std::string& payload,
                              std::vector<std::string> refs) {
  audit_log_.append({id_gen_.next("evt"), trace_id_.value, event_type, payload,
                     clock_.now_iso8601(), std::move(refs)});
}

void AuditLogReportSink::on_resolved(const ResolvedFileReport& report) {
  json j;
  j["unit"] = report.unit.value;
  j["category"] = domain::to_string(report.category);
  j["resolved_date"] = core::format_iso(report.resolved_date);
  j["source_path"] = report.source_path;
  j["strategy"] = matching::to_string(report.strategy);
  j["score"] = report.score;
  j["newly_satisfied"] = report.update == domain::SlotUpdate::kNewlySatisfied;
  emit("FileResolved", core::dump_json(j), {report.unit.value});
}

void AuditLogReportSink::on_rejected(const RejectionReport& report) {
  json j;
  j["source_path"] = report.source_path;
  j["reason"] = resolve::to_string(report.rejection.reason);
  j["detail"] = report.rejection.detail;
  j["best_score"] = report.rejection.best_score;
  emit("FileRejected", core::dump_json(j), {});
}

void AuditLogReportSink::on_backfill(const BackfillReport& report) {
  const auto& result = report.result;
  json j;
  j["unit"] = report.unit.value;
  j["category"] = domain::to_string(report.category);
  j["strategy"] = history::to_string(result.strategy);
  j["reason"] = result.reason;
  j["path"] = result.path.has_value() ? json(result.path->string()) : json(nullptr);
  j["effective_date"] =
      result.effective_date.has_value() ? json(core::format_iso(*result.effective_date)) : json(nullptr);
  emit(result.found() ? "BackfillResolved" : "BackfillMissed", core::dump_json(j),
       {report.unit.value});
}

void AuditLogReportSink::on_filesystem_error(const FilesystemErrorReport& report) {
  json j;
  j["path"] = report.path;
  j["message"] = report.message;
  emit("FilesystemError", core::dump_json(j), {});
}

void AuditLogReportSink::on_status(const StatusReport& report) {
  json outstanding = json::array();
  for (const auto& item : report.outstanding) {
    outstanding.push_back({
        {"unit", item.unit.value},
        {"team_number", item.team_number},
        {"category", domain::to_string(item.category)},
    });
  }

  json j;
  j["satisfied_units"] = report.satisfied_units;
  j["total_units"] = report.total_units;
  j["urgent"] = report.urgent;
  j["outstanding"] = std::move(outstanding);
  emit("StatusTick", core::dump_json(j), {});
}

void AuditLogReportSink::on_period_end(const domain::PeriodSnapshot& snapshot) {
  const std::string snapshot_json = domain::to_json(snapshot);

  json j;
  j["period_date"] = snapshot.period_date;
  j["end_reason"] = snapshot.end_reason;
  j["units"] = snapshot.units.size();
  emit("PeriodCompleted", core::dump_json(j), {});

  if (snapshots_ != nullptr) {
    snapshots_->save(snapshot.period_date, snapshot_json, clock_.now_iso8601());
  }
}

}  // namespace dcm::report
