#pragma once

#include "internal/diff/map_diff.hpp"
#include "internal/diff/sprite_diff.hpp"
#include "internal/report/report_section.hpp"

namespace assetdiff::report {

// Markdown rendering of diff results, one section per source file.

ReportSection SpriteSection(const diff::SpriteFileDiff& diff);
ReportSection MapSection(const diff::MapFileDiff& diff);

// Single job-level failure, as shown to users instead of a report.
assetdiff::report::v1::ReportOutput FailureOutput(const std::string& title, const std::string& message);

} // namespace assetdiff::report
