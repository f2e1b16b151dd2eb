#pragma once

#include <cstdint>
#include <string>

#include "internal/report/report_section.hpp"

namespace assetdiff::report {

// Identifies the check a job reports to.
struct ReportTarget {
  uint64_t    repository_id = 0;
  uint64_t    pull_request  = 0;
  std::string report_handle;
};

/*
  Boundary to the code-review platform.

  A job calls Started once, Progress any number of times, then exactly one of
  Completed / Skipped / Failed.
*/
class ReportSink {
 public:
  virtual ~ReportSink() = default;

  virtual void Started(const ReportTarget& target)                                                     = 0;
  virtual void Progress(const ReportTarget& target, const assetdiff::report::v1::ReportOutput& output) = 0;
  virtual void Completed(const ReportTarget& target, const ReportOutputs& outputs)                     = 0;
  virtual void Skipped(const ReportTarget& target, const assetdiff::report::v1::ReportOutput& output)  = 0;
  virtual void Failed(const ReportTarget& target, const assetdiff::report::v1::ReportOutput& output)   = 0;
};

} // namespace assetdiff::report
