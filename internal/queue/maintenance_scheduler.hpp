#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/queue/durable_queue.hpp"
#include "internal/util/time.hpp"

namespace assetdiff::runtime::config {
class MaintenanceConfig;
}

namespace assetdiff::queue {

/*
  Enqueues a CleanupCommand every day at maintenance.daily_at (UTC).

  Cleanup runs through the queue so it is ordered with, and as durable as,
  regular jobs.
*/
class MaintenanceScheduler {
 public:
  MaintenanceScheduler(std::shared_ptr<DurableQueue> queue, const assetdiff::runtime::config::MaintenanceConfig& config);
  ~MaintenanceScheduler();

  void Start();
  void Stop();

  util::TimePoint NextTrigger(util::TimePoint now) const;

  // Enqueues one cleanup now; returns its queue sequence.
  uint64_t Fire();

 private:
  void Run();

  std::shared_ptr<DurableQueue> queue_;
  int                           hour_   = 0;
  int                           minute_ = 0;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stop_ = false;
  std::thread             thread_;
};

} // namespace assetdiff::queue
