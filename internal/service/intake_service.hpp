#pragma once

#include "assetdiff/services/v1/intake_service.pb.h"
#include "service_context.hpp"

namespace assetdiff::service {

/*
  Accepts diff requests from the webhook front end and puts them on the
  durable queue. Returns once the job is persisted; processing is asynchronous.
*/
class IntakeService {
 public:
  explicit IntakeService(ServiceContext ctx);

  assetdiff::services::v1::EnqueueResponse Enqueue(const assetdiff::services::v1::EnqueueRequest& req);

  assetdiff::services::v1::RequestCleanupResponse RequestCleanup(const assetdiff::services::v1::RequestCleanupRequest& req);

  assetdiff::services::v1::QueueStatsResponse QueueStats(const assetdiff::services::v1::QueueStatsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace assetdiff::service
