#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace assetdiff::queue {
class DurableQueue;
class JobWorker;
class MaintenanceScheduler;
} // namespace assetdiff::queue

namespace assetdiff::factory {

/*
  Application

  Owns every long-lived component of the daemon. The config is held here
  because the pipeline and codecs keep references into it.
*/
struct Application {
  std::shared_ptr<const assetdiff::runtime::config::RuntimeConfig> config;

  std::shared_ptr<queue::DurableQueue>         queue;
  std::shared_ptr<queue::JobWorker>            worker;
  std::shared_ptr<queue::MaintenanceScheduler> scheduler;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  // Stops background threads; queued work stays on disk.
  void Stop();
};

/*
  Build

  Composition root: constructs the queue, the diff pipeline and its codecs,
  the worker and the maintenance scheduler, and the gRPC intake adapters.
  Background threads are started before returning.
*/
Application Build(const assetdiff::runtime::config::RuntimeConfig& config);

} // namespace assetdiff::factory
