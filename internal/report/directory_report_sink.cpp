#include "internal/report/directory_report_sink.hpp"

#include <google/protobuf/util/json_util.h>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file.hpp"
#include "internal/util/time.hpp"

namespace assetdiff::report {

namespace {

std::string SafeComponent(const std::string& handle) {
  std::string out = handle;
  for (auto& c : out) {
    if (c == '/' || c == '\\' || c == '\0') c = '_';
  }
  if (out.empty() || out == "." || out == "..") out = "_" + out;
  return out;
}

} // namespace

DirectoryReportSink::DirectoryReportSink(const assetdiff::runtime::config::ReportConfig& config) : root_(config.root()) {
  if (root_.empty()) {
    throw util::InvalidArgument("report.root must not be empty");
  }
}

std::filesystem::path DirectoryReportSink::PathFor(const ReportTarget& target) const {
  return root_ / std::to_string(target.repository_id) / std::to_string(target.pull_request) /
         (SafeComponent(target.report_handle) + ".json");
}

v1::CheckReport DirectoryReportSink::Read(const ReportTarget& target) const {
  const std::string json = util::ReadFile(PathFor(target));

  v1::CheckReport report;
  auto            status = google::protobuf::util::JsonStringToMessage(json, &report);
  if (!status.ok()) {
    throw std::runtime_error("malformed report " + PathFor(target).string() + ": " + std::string(status.message()));
  }
  return report;
}

v1::CheckReport DirectoryReportSink::Current(const ReportTarget& target) const {
  if (std::filesystem::exists(PathFor(target))) {
    return Read(target);
  }

  v1::CheckReport report;
  report.set_report_handle(target.report_handle);
  report.set_repository_id(target.repository_id);
  report.set_pull_request(target.pull_request);
  report.set_status(v1::CHECK_STATUS_QUEUED);
  return report;
}

void DirectoryReportSink::Write(const ReportTarget& target, const v1::CheckReport& report) const {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(report, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to serialize report: " + std::string(status.message()));
  }

  const auto path = PathFor(target);
  std::filesystem::create_directories(path.parent_path());
  util::WriteFileAtomic(path, json);
}

void DirectoryReportSink::Started(const ReportTarget& target) {
  std::lock_guard lock(mutex_);
  auto            report = Current(target);
  report.set_status(v1::CHECK_STATUS_IN_PROGRESS);
  report.set_started_at_ms(util::ToUnixMillis(util::Now()));
  Write(target, report);
}

void DirectoryReportSink::Progress(const ReportTarget& target, const v1::ReportOutput& output) {
  std::lock_guard lock(mutex_);
  auto            report = Current(target);
  *report.mutable_primary() = output;
  Write(target, report);
}

void DirectoryReportSink::Completed(const ReportTarget& target, const ReportOutputs& outputs) {
  std::lock_guard lock(mutex_);
  auto            report = Current(target);
  report.set_status(v1::CHECK_STATUS_COMPLETED);
  report.set_conclusion(v1::CHECK_CONCLUSION_SUCCESS);
  report.set_completed_at_ms(util::ToUnixMillis(util::Now()));
  *report.mutable_primary() = outputs.primary;
  report.clear_additional();
  for (const auto& output : outputs.additional) {
    *report.add_additional() = output;
  }
  Write(target, report);

  ASSETDIFF_LOG_INFO("report completed",
                     {observability::UintField("repo", target.repository_id),
                      observability::UintField("pr", target.pull_request),
                      observability::UintField("outputs", outputs.Count())});
}

void DirectoryReportSink::Skipped(const ReportTarget& target, const v1::ReportOutput& output) {
  std::lock_guard lock(mutex_);
  auto            report = Current(target);
  report.set_status(v1::CHECK_STATUS_COMPLETED);
  report.set_conclusion(v1::CHECK_CONCLUSION_SKIPPED);
  report.set_completed_at_ms(util::ToUnixMillis(util::Now()));
  *report.mutable_primary() = output;
  report.clear_additional();
  Write(target, report);
}

void DirectoryReportSink::Failed(const ReportTarget& target, const v1::ReportOutput& output) {
  std::lock_guard lock(mutex_);
  auto            report = Current(target);
  report.set_status(v1::CHECK_STATUS_COMPLETED);
  report.set_conclusion(v1::CHECK_CONCLUSION_FAILURE);
  report.set_completed_at_ms(util::ToUnixMillis(util::Now()));
  *report.mutable_primary() = output;
  report.clear_additional();
  Write(target, report);
}

} // namespace assetdiff::report
