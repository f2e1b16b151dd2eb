#include "intake_service.hpp"

#include <chrono>
#include <string_view>

#include "assetdiff/v1.hpp"
#include "internal/model/file_change.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/queue/durable_queue.hpp"
#include "internal/queue/job_worker.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace assetdiff::service {

using namespace assetdiff::v1;

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

// Runs one RPC body with the span, metrics and error logging every route shares.
template <typename Fn>
auto Instrumented(std::string_view route, Fn&& body) {
  assetdiff::observability::SpanScope span(route);
  const auto                          started_at = std::chrono::steady_clock::now();
  auto&                               metrics    = assetdiff::observability::Metrics::Instance();

  try {
    auto resp = body(span);
    metrics.RecordRequest(route, true);
    metrics.ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    return resp;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    ASSETDIFF_LOG_ERROR("RPC failed",
                        {assetdiff::observability::StringField("route", route), assetdiff::observability::StringField("error", ex.what())});
    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    throw;
  }
}

void ValidateDiffRequest(const DiffRequest& request) {
  if (request.repo().id() == 0 || request.repo().full_name().empty()) {
    throw util::InvalidArgument("repository id and full_name are required");
  }
  if (request.base().sha().empty() || request.head().sha().empty()) {
    throw util::InvalidArgument("base and head sha are required");
  }
  if (request.base().ref().empty()) {
    throw util::InvalidArgument("base ref is required");
  }
  if (request.head().ref().empty() && request.pull_request() == 0) {
    throw util::InvalidArgument("head ref or pull request number is required");
  }
  if (request.report_handle().empty()) {
    throw util::InvalidArgument("report_handle is required");
  }
  // Rejects unknown change kinds and nameless files up front.
  (void)assetdiff::model::FromProto(request.files());
}

} // namespace

IntakeService::IntakeService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.queue) throw util::InvalidArgument("intake service requires a queue");
}

EnqueueResponse IntakeService::Enqueue(const EnqueueRequest& req) {
  return Instrumented("IntakeService.Enqueue", [&](assetdiff::observability::SpanScope& span) {
    if (!req.has_request()) throw util::InvalidArgument("request is required");
    ValidateDiffRequest(req.request());
    span.SetAttribute("repository", req.request().repo().full_name());

    DurableJob job;
    *job.mutable_diff() = req.request();
    job.set_enqueued_at_ms(util::ToUnixMillis(util::Now()));

    const auto ack = ctx_.queue->Enqueue(job);
    ASSETDIFF_LOG_INFO("diff job enqueued",
                       {assetdiff::observability::UintField("sequence", ack.sequence),
                        assetdiff::observability::StringField("repository", req.request().repo().full_name()),
                        assetdiff::observability::UintField("pull_request", req.request().pull_request())});

    EnqueueResponse resp;
    resp.set_sequence(ack.sequence);
    return resp;
  });
}

RequestCleanupResponse IntakeService::RequestCleanup(const RequestCleanupRequest&) {
  return Instrumented("IntakeService.RequestCleanup", [&](assetdiff::observability::SpanScope&) {
    DurableJob job;
    job.mutable_cleanup();
    job.set_enqueued_at_ms(util::ToUnixMillis(util::Now()));

    RequestCleanupResponse resp;
    resp.set_sequence(ctx_.queue->Enqueue(job).sequence);
    return resp;
  });
}

QueueStatsResponse IntakeService::QueueStats(const QueueStatsRequest&) {
  return Instrumented("IntakeService.QueueStats", [&](assetdiff::observability::SpanScope&) {
    const auto stats = ctx_.queue->Stats();

    QueueStatsResponse resp;
    resp.set_pending(stats.pending);
    resp.set_next_sequence(stats.next_sequence);
    resp.set_segments(stats.segments);
    if (ctx_.worker) {
      resp.set_jobs_completed(ctx_.worker->Completed());
      resp.set_jobs_failed(ctx_.worker->Failed());
    }
    return resp;
  });
}

} // namespace assetdiff::service
