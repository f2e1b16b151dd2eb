#pragma once

#include <string>
#include <vector>

#include "assetdiff/report/v1/report.pb.h"

namespace assetdiff::report {

/*
  One source file's contribution to the report.

  `lines` are packed into detail tables in order; a line may span several
  text lines but is never split across tables.
*/
struct ReportSection {
  std::string              title;  // file name
  std::string              label;  // ADDED / DELETED / MODIFIED / ERROR
  std::string              header; // repeated at the top of every table
  std::vector<std::string> lines;
};

struct ReportOutputs {
  assetdiff::report::v1::ReportOutput              primary;
  std::vector<assetdiff::report::v1::ReportOutput> additional;

  std::size_t Count() const {
    return 1 + additional.size();
  }
};

} // namespace assetdiff::report
