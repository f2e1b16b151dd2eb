#include "factory.hpp"

#include <memory>

#include "internal/assets/external_asset_tool.hpp"
#include "internal/core/diff_pipeline.hpp"
#include "internal/core/job_processor.hpp"
#include "internal/core/maintenance.hpp"
#include "internal/grpc/intake_server.hpp"
#include "internal/queue/durable_queue.hpp"
#include "internal/queue/job_worker.hpp"
#include "internal/queue/maintenance_scheduler.hpp"
#include "internal/report/directory_report_sink.hpp"
#include "internal/service/intake_service.hpp"
#include "internal/service/service_context.hpp"

namespace assetdiff::factory {

void Application::Stop() {
  if (scheduler) scheduler->Stop();
  if (worker) worker->Stop();
}

/*
    Build full application dependency graph
*/
Application Build(const assetdiff::runtime::config::RuntimeConfig& config) {
  Application app;
  app.config = std::make_shared<const assetdiff::runtime::config::RuntimeConfig>(config);
  const auto& cfg = *app.config;

  // ------------------------------------------------------------------
  // Durable queue
  // ------------------------------------------------------------------
  app.queue = std::make_shared<queue::DurableQueue>(cfg.queue());

  // ------------------------------------------------------------------
  // Diff pipeline
  // ------------------------------------------------------------------
  auto asset_tool = std::make_shared<assets::ExternalAssetTool>(cfg.asset_tool());
  auto sink       = std::make_shared<report::DirectoryReportSink>(cfg.report());

  core::DiffPipeline::Codecs codecs;
  codecs.sprites    = asset_tool;
  codecs.maps       = asset_tool;
  codecs.rasterizer = asset_tool;

  auto pipeline    = std::make_shared<core::DiffPipeline>(cfg, std::move(codecs), sink);
  auto maintenance = std::make_shared<core::Maintenance>(cfg);
  auto processor   = std::make_shared<core::JobProcessor>(pipeline, maintenance);

  // ------------------------------------------------------------------
  // Background workers
  // ------------------------------------------------------------------
  app.worker    = std::make_shared<queue::JobWorker>(app.queue, processor);
  app.scheduler = std::make_shared<queue::MaintenanceScheduler>(app.queue, cfg.maintenance());

  app.worker->Start();
  app.scheduler->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.queue  = app.queue;
  ctx.worker = app.worker;

  auto intake_service = std::make_shared<service::IntakeService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::IntakeServer>(intake_service));

  return app;
}

} // namespace assetdiff::factory
