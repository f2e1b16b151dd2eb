#include "intake_server.hpp"

#include "grpc_error.hpp"

namespace assetdiff::grpc {

using namespace assetdiff::services::v1;

IntakeServer::IntakeServer(std::shared_ptr<assetdiff::service::IntakeService> svc) : service_(std::move(svc)) {
}

::grpc::Status IntakeServer::Enqueue(::grpc::ServerContext*, const EnqueueRequest* req, EnqueueResponse* resp) {
  try {
    *resp = service_->Enqueue(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IntakeServer::RequestCleanup(::grpc::ServerContext*, const RequestCleanupRequest* req, RequestCleanupResponse* resp) {
  try {
    *resp = service_->RequestCleanup(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IntakeServer::QueueStats(::grpc::ServerContext*, const QueueStatsRequest* req, QueueStatsResponse* resp) {
  try {
    *resp = service_->QueueStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace assetdiff::grpc
