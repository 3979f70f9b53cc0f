#include "dcm/report/report_sink.h"

#include <exception>

namespace dcm::report {

template <typename Fn>
void CompositeReportSink::fan_out(Fn&& fn) {
  std::exception_ptr first_failure;
  for (auto* sink : sinks_) {
    try {
      fn(*sink);
    } catch (const std::exception&) {
      if (!first_failure) {
        first_failure = std::current_exception();
      }
    }
  }
  if (first_failure) {
    std::rethrow_exception(first_failure);
  }
}

void CompositeReportSink::on_resolved(const ResolvedFileReport& report) {
  fan_out([&](IReportSink& sink) { sink.on_resolved(report); });
}

void CompositeReportSink::on_rejected(const RejectionReport& report) {
  fan_out([&](IReportSink& sink) { sink.on_rejected(report); });
}

void CompositeReportSink::on_backfill(const BackfillReport& report) {
  fan_out([&](IReportSink& sink) { sink.on_backfill(report); });
}

void CompositeReportSink::on_filesystem_error(const FilesystemErrorReport& report) {
  fan_out([&](IReportSink& sink) { sink.on_filesystem_error(report); });
}

void CompositeReportSink::on_status(const StatusReport& report) {
  fan_out([&](IReportSink& sink) { sink.on_status(report); });
}

void CompositeReportSink::on_period_end(const domain::PeriodSnapshot& snapshot) {
  fan_out([&](IReportSink& sink) { sink.on_period_end(snapshot); });
}

}  // namespace dcm::report
