#pragma once

#include <memory>

namespace assetdiff::queue {
class DurableQueue;
class JobWorker;
} // namespace assetdiff::queue

namespace assetdiff::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<assetdiff::queue::DurableQueue> queue;
  std::shared_ptr<assetdiff::queue::JobWorker>    worker;
};

} // namespace assetdiff::service
