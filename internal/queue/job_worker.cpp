#include "internal/queue/job_worker.hpp"

#include <chrono>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace assetdiff::queue {

namespace {

using observability::StringField;
using observability::UintField;

const char* KindOf(const assetdiff::jobs::v1::DurableJob& job) {
  switch (job.job_case()) {
    case assetdiff::jobs::v1::DurableJob::kDiff:
      return "diff";
    case assetdiff::jobs::v1::DurableJob::kCleanup:
      return "cleanup";
    case assetdiff::jobs::v1::DurableJob::JOB_NOT_SET:
      break;
  }
  return "unknown";
}

} // namespace

JobWorker::JobWorker(std::shared_ptr<DurableQueue> queue, std::shared_ptr<JobHandler> handler)
    : queue_(std::move(queue)), handler_(std::move(handler)) {
}

JobWorker::~JobWorker() {
  Stop();
}

void JobWorker::Start() {
  running_ = true;
  thread_  = std::thread(&JobWorker::Run, this);
}

void JobWorker::Stop() {
  queue_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void JobWorker::Run() {
  while (running_) {
    if (!RunOnce()) break;
  }
}

bool JobWorker::RunOnce() {
  auto entry = queue_->Dequeue();
  if (!entry) return false;

  const bool ok = Dispatch(*entry);
  (ok ? completed_ : failed_)++;

  try {
    queue_->Commit(entry->sequence);
  } catch (const std::system_error& e) {
    // the entry stays uncommitted and is redelivered on the next start
    ASSETDIFF_LOG_ERROR("queue commit failed", {UintField("sequence", entry->sequence), StringField("error", e.what())});
  }
  return true;
}

bool JobWorker::Dispatch(const QueueEntry& entry) {
  const char* kind  = KindOf(entry.job);
  const auto  start = std::chrono::steady_clock::now();

  observability::SpanScope span("assetdiff.job");
  span.SetAttribute("job.kind", kind);
  span.SetAttribute("job.sequence", static_cast<std::int64_t>(entry.sequence));

  ASSETDIFF_LOG_INFO("job started", {StringField("kind", kind), UintField("sequence", entry.sequence)});

  bool ok = true;
  try {
    switch (entry.job.job_case()) {
      case assetdiff::jobs::v1::DurableJob::kDiff:
        handler_->HandleDiff(entry.job.diff());
        break;
      case assetdiff::jobs::v1::DurableJob::kCleanup:
        handler_->HandleCleanup();
        break;
      case assetdiff::jobs::v1::DurableJob::JOB_NOT_SET:
        ASSETDIFF_LOG_WARN("dropping empty job", {UintField("sequence", entry.sequence)});
        break;
    }
  } catch (const std::exception& e) {
    ok = false;
    span.RecordException(e.what());
    ASSETDIFF_LOG_ERROR("job failed", {StringField("kind", kind), UintField("sequence", entry.sequence), StringField("error", e.what())});
  }

  const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);
  auto&      metrics = observability::Metrics::Instance();
  metrics.RecordJob(kind, ok ? "success" : "failure");
  metrics.ObserveJobDurationMs(kind, elapsed.count());

  ASSETDIFF_LOG_INFO("job finished",
                     {StringField("kind", kind), UintField("sequence", entry.sequence), StringField("outcome", ok ? "success" : "failure")});
  return ok;
}

} // namespace assetdiff::queue
