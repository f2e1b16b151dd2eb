#pragma once

#include <filesystem>
#include <mutex>

#include "internal/report/report_sink.hpp"

namespace assetdiff::runtime::config {
class ReportConfig;
}

namespace assetdiff::report {

/*
  Writes one CheckReport JSON document per check:

      <report.root>/<repository_id>/<pull_request>/<report_handle>.json

  Documents are replaced atomically so readers never see a partial report.
*/
class DirectoryReportSink final : public ReportSink {
 public:
  explicit DirectoryReportSink(const assetdiff::runtime::config::ReportConfig& config);

  void Started(const ReportTarget& target) override;
  void Progress(const ReportTarget& target, const assetdiff::report::v1::ReportOutput& output) override;
  void Completed(const ReportTarget& target, const ReportOutputs& outputs) override;
  void Skipped(const ReportTarget& target, const assetdiff::report::v1::ReportOutput& output) override;
  void Failed(const ReportTarget& target, const assetdiff::report::v1::ReportOutput& output) override;

  std::filesystem::path PathFor(const ReportTarget& target) const;

  // Reads back a stored report; throws std::runtime_error if absent or malformed.
  assetdiff::report::v1::CheckReport Read(const ReportTarget& target) const;

 private:
  assetdiff::report::v1::CheckReport Current(const ReportTarget& target) const;
  void                               Write(const ReportTarget& target, const assetdiff::report::v1::CheckReport& report) const;

  std::filesystem::path root_;
  mutable std::mutex    mutex_;
};

} // namespace assetdiff::report
