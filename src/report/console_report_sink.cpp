#include "dcm/report/console_report_sink.h"

#include <iomanip>
#include <sstream>

namespace dcm::report {

namespace {

std::string join(const std::vector<std::string>& items, const char* sep) {
  std::string out;
  for (const auto& item : items) {
    if (!out.empty()) {
      out += sep;
    }
    out += item;
  }
  return out;
}

std::string format_score(double score) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(3) << score;
  return oss.str();
}

}  // namespace

void ConsoleReportSink::on_resolved(const ResolvedFileReport& report) {
  out_ << "[" << core::format_iso8601(report.at) << "] "
       << (report.update == domain::SlotUpdate::kNewlySatisfied ? "RECEIVED " : "UPDATED  ")
       << report.unit.value << " " << domain::to_string(report.category) << " dated "
       << core::format_iso(report.resolved_date) << " (" << matching::to_string(report.strategy)
       << ", score " << format_score(report.score) << ")\n"
       << "    " << report.source_path << "\n";
}

void ConsoleReportSink::on_rejected(const RejectionReport& report) {
  if (!verbose_ && report.rejection.reason == resolve::RejectionReason::kUnsupportedExtension) {
    return;
  }
  out_ << "[" << core::format_iso8601(report.at) << "] REJECTED "
       << resolve::to_string(report.rejection.reason) << ": " << report.rejection.detail << "\n";
}

void ConsoleReportSink::on_backfill(const BackfillReport& report) {
  out_ << "[" << core::format_iso8601(report.at) << "] "
       << (report.result.found() ? "BACKFILLED " : "NOT FOUND  ") << report.unit.value << " "
       << domain::to_string(report.category) << ": " << report.result.reason << "\n";
}

void ConsoleReportSink::on_filesystem_error(const FilesystemErrorReport& report) {
  out_ << "[" << core::format_iso8601(report.at) << "] FILESYSTEM ERROR " << report.path << ": "
       << report.message << "\n";
}

void ConsoleReportSink::on_status(const StatusReport& report) {
  out_ << "[" << core::format_iso8601(report.at) << "] "
       << (report.urgent ? "URGENT STATUS " : "STATUS ") << report.satisfied_units << "/"
       << report.total_units << " units complete\n";
  for (const auto& item : report.outstanding) {
    out_ << "    missing " << domain::to_string(item.category) << " for " << item.unit.value;
    if (!item.team_number.empty()) {
      out_ << " (team " << item.team_number << ")";
    }
    if (report.urgent && !item.leaders.empty()) {
      out_ << " leaders: " << join(item.leaders, ", ");
    }
    out_ << "\n";
  }
}

void ConsoleReportSink::on_period_end(const domain::PeriodSnapshot& snapshot) {
  out_ << "Period " << snapshot.period_date << " finished (" << snapshot.end_reason << ") at "
       << snapshot.finished_at << "\n";
  for (const auto& unit : snapshot.units) {
    out_ << "  " << unit.unit << " [" << unit.status << "]\n";
    for (const auto& entry : unit.categories) {
      out_ << "    " << entry.category << ": " << entry.detail << "\n";
    }
  }
}

}  // namespace dcm::report
