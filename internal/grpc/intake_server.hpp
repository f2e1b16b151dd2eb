#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "assetdiff/services/v1/intake_service.grpc.pb.h"
#include "internal/service/intake_service.hpp"

namespace assetdiff::grpc {

class IntakeServer final : public assetdiff::services::v1::DiffIntakeService::Service {
 public:
  explicit IntakeServer(std::shared_ptr<assetdiff::service::IntakeService> svc);

  ::grpc::Status Enqueue(::grpc::ServerContext*, const assetdiff::services::v1::EnqueueRequest*, assetdiff::services::v1::EnqueueResponse*) override;

  ::grpc::Status RequestCleanup(::grpc::ServerContext*,
                                const assetdiff::services::v1::RequestCleanupRequest*,
                                assetdiff::services::v1::RequestCleanupResponse*) override;

  ::grpc::Status QueueStats(::grpc::ServerContext*, const assetdiff::services::v1::QueueStatsRequest*, assetdiff::services::v1::QueueStatsResponse*) override;

 private:
  std::shared_ptr<assetdiff::service::IntakeService> service_;
};

} // namespace assetdiff::grpc
