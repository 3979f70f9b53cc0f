#pragma once

#include "dcm/report/report_sink.h"

#include <ostream>

namespace dcm::report {

// ConsoleReportSink prints one human-readable line per report, plus the
// outstanding list on status ticks. verbose=false omits rejections of files
// with an unaccepted extension.
class ConsoleReportSink final : public IReportSink {
 public:
  explicit ConsoleReportSink(std::ostream& out, bool verbose = true)
      : out_(out), verbose_(verbose) {}

  void on_resolved(const ResolvedFileReport& report) override;
  void on_rejected(const RejectionReport& report) override;
  void on_backfill(const BackfillReport& report) override;
  void on_filesystem_error(const FilesystemErrorReport& report) override;
  void on_status(const StatusReport& report) override;
  void on_period_end(const domain::PeriodSnapshot& snapshot) override;

 private:
  std::ostream& out_;
  bool verbose_;
};

}  // namespace dcm::report
