#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>

#include "internal/queue/durable_queue.hpp"
#include "internal/queue/job_handler.hpp"

namespace assetdiff::queue {

/*
  Single consumer of the durable queue.

  Executes:
      dequeue -> dispatch -> commit

  Commit happens after success or terminal failure; a crash before it leaves
  the job for redelivery.
*/
class JobWorker {
 public:
  JobWorker(std::shared_ptr<DurableQueue> queue, std::shared_ptr<JobHandler> handler);
  ~JobWorker();

  void Start();
  void Stop();

  // Processes one entry on the calling thread; false once the queue shut down.
  bool RunOnce();

  uint64_t Completed() const {
    return completed_.load();
  }
  uint64_t Failed() const {
    return failed_.load();
  }

 private:
  void Run();
  bool Dispatch(const QueueEntry& entry);

  std::shared_ptr<DurableQueue> queue_;
  std::shared_ptr<JobHandler>   handler_;

  std::thread           thread_;
  std::atomic<bool>     running_{false};
  std::atomic<uint64_t> completed_{0};
  std::atomic<uint64_t> failed_{0};
};

} // namespace assetdiff::queue
