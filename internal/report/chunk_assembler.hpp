#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/report/report_section.hpp"

namespace assetdiff::report {

struct ChunkLimits {
  std::size_t detail_ceiling = 55000;
  std::size_t report_ceiling = 60000;
};

/*
  Packs report sections into size-bounded outputs.

  Lines fill a detail table until the next line (with its newline) would push
  it past detail_ceiling; tables are wrapped into detail blocks and blocks fill
  a report body until the next one would exceed report_ceiling. A file spread
  over several tables is titled "file (1)", "file (2)", ...

  Deterministic: the same sections always produce the same boundaries.
*/
class ChunkAssembler {
 public:
  // Throws InvalidArgument unless detail_ceiling < report_ceiling.
  ChunkAssembler(ChunkLimits limits, std::string title, std::string summary);

  ReportOutputs Assemble(const std::vector<ReportSection>& sections) const;

  static std::string DetailBlock(const std::string& label, const std::string& title, const std::string& table);

  static constexpr const char* kTruncationMarker = " [truncated]";
  static constexpr const char* kNoChangesSummary = "No asset changes to render.";

 private:
  struct Table {
    std::string label;
    std::string title;
    std::string text;
  };

  void        SplitSection(const ReportSection& section, std::vector<Table>& tables) const;
  std::string FitLine(const std::string& line, std::size_t header_size) const;
  std::string FitBlock(const Table& table) const;

  assetdiff::report::v1::ReportOutput MakeOutput(std::string body, bool empty) const;

  ChunkLimits limits_;
  std::string title_;
  std::string summary_;
};

} // namespace assetdiff::report
