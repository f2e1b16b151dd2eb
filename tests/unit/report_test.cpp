#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "config/config.pb.h"
#include "internal/report/directory_report_sink.hpp"
#include "internal/report/report_format.hpp"

namespace {

namespace fs = std::filesystem;

using assetdiff::report::ReportTarget;

void TestSpriteSectionRows() {
  assetdiff::diff::SpriteFileDiff diff;
  diff.path = "icons/mob.dmi";
  diff.kind = assetdiff::model::DiffKind::kModified;

  assetdiff::diff::SpriteLine created;
  created.identity   = {"walk", 0};
  created.change     = assetdiff::diff::SpriteChange::kCreated;
  created.after_link = "https://cdn/x.png";
  diff.lines.push_back(created);

  assetdiff::diff::SpriteLine failed;
  failed.identity = {"", 1};
  failed.change   = assetdiff::diff::SpriteChange::kModified;
  failed.error    = "exit 3: bad | pipe";
  diff.lines.push_back(failed);

  const auto section = assetdiff::report::SpriteSection(diff);
  assert(section.title == "icons/mob.dmi");
  assert(section.label == "MODIFIED");
  assert(section.header.rfind("| Name | Old | New | Change |\n", 0) == 0);
  assert(section.lines.size() == 2);
  assert(section.lines[0] == "| walk |  | ![walk](https://cdn/x.png) | Created |");
  assert(section.lines[1].find("{{DEFAULT}} (1)") != std::string::npos);
  assert(section.lines[1].find("bad \\| pipe") != std::string::npos);
}

void TestSpriteFileErrorBecomesErrorSection() {
  assetdiff::diff::SpriteFileDiff diff;
  diff.path  = "icons/mob.dmi";
  diff.error = "failed to decode head revision";

  const auto section = assetdiff::report::SpriteSection(diff);
  assert(section.label == "ERROR");
  assert(section.lines.size() == 1);
  assert(section.lines[0] == "```\nfailed to decode head revision\n```");
}

void TestMapSectionEntries() {
  assetdiff::diff::MapFileDiff diff;
  diff.path = "maps/station.dmm";
  diff.kind = assetdiff::model::DiffKind::kModified;

  assetdiff::diff::MapLevelDiff both;
  both.z           = 1;
  both.type        = assetdiff::diff::BoundType::kBoth;
  both.bounds      = {2, 2, 4, 4};
  both.before_link = "b.png";
  both.after_link  = "a.png";
  both.diff_link   = "d.png";
  diff.levels.push_back(both);

  assetdiff::diff::MapLevelDiff removed;
  removed.z      = 2;
  removed.type   = assetdiff::diff::BoundType::kOnlyBase;
  removed.width  = 5;
  removed.height = 5;
  diff.levels.push_back(removed);

  const auto section = assetdiff::report::MapSection(diff);
  assert(section.label == "MODIFIED");
  assert(section.lines.size() == 2);
  assert(section.lines[0].find("**maps/station.dmm (Z-level: 1)** (2, 2) - (4, 4)") == 0);
  assert(section.lines[0].find("[Diff](d.png)") != std::string::npos);
  assert(section.lines[1].find("Z-LEVEL DELETED") != std::string::npos);
  assert(section.lines[1].find("(5, 5, 2)") != std::string::npos);
}

void TestSinkLifecycle() {
  const auto root = fs::temp_directory_path() / "assetdiff_report_tests" / "lifecycle";
  fs::remove_all(root);

  assetdiff::runtime::config::ReportConfig config;
  config.set_root(root.string());
  assetdiff::report::DirectoryReportSink sink(config);

  const ReportTarget target{42, 7, "check/123"};
  assert(sink.PathFor(target) == root / "42" / "7" / "check_123.json");

  sink.Started(target);
  auto report = sink.Read(target);
  assert(report.status() == assetdiff::report::v1::CHECK_STATUS_IN_PROGRESS);
  assert(report.report_handle() == "check/123");
  assert(report.started_at_ms() > 0);

  assetdiff::report::v1::ReportOutput progress;
  progress.set_summary("Cloning repo...");
  sink.Progress(target, progress);
  assert(sink.Read(target).primary().summary() == "Cloning repo...");

  assetdiff::report::ReportOutputs outputs;
  outputs.primary.set_title("Asset difference rendering");
  outputs.primary.set_body("first");
  outputs.additional.resize(2);
  outputs.additional[0].set_body("second");
  outputs.additional[1].set_body("third");
  sink.Completed(target, outputs);

  report = sink.Read(target);
  assert(report.status() == assetdiff::report::v1::CHECK_STATUS_COMPLETED);
  assert(report.conclusion() == assetdiff::report::v1::CHECK_CONCLUSION_SUCCESS);
  assert(report.primary().body() == "first");
  assert(report.additional_size() == 2);
  assert(report.additional(1).body() == "third");
  assert(report.started_at_ms() > 0);

  sink.Failed(target, assetdiff::report::FailureOutput("Asset difference rendering", "boom"));
  report = sink.Read(target);
  assert(report.conclusion() == assetdiff::report::v1::CHECK_CONCLUSION_FAILURE);
  assert(report.additional_size() == 0);
  assert(report.primary().body().find("boom") != std::string::npos);
}

void TestSkippedReport() {
  const auto root = fs::temp_directory_path() / "assetdiff_report_tests" / "skipped";
  fs::remove_all(root);

  assetdiff::runtime::config::ReportConfig config;
  config.set_root(root.string());
  assetdiff::report::DirectoryReportSink sink(config);

  const ReportTarget                  target{1, 2, "h"};
  assetdiff::report::v1::ReportOutput output;
  output.set_summary("blocked");
  sink.Skipped(target, output);

  const auto report = sink.Read(target);
  assert(report.status() == assetdiff::report::v1::CHECK_STATUS_COMPLETED);
  assert(report.conclusion() == assetdiff::report::v1::CHECK_CONCLUSION_SKIPPED);
  assert(report.repository_id() == 1);
}

} // namespace

int main() {
  TestSpriteSectionRows();
  TestSpriteFileErrorBecomesErrorSection();
  TestMapSectionEntries();
  TestSinkLifecycle();
  TestSkippedReport();

  std::cout << "assetdiff_unit_report: pass\n";
  return 0;
}
