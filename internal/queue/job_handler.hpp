#pragma once

#include "assetdiff/jobs/v1/job.pb.h"

namespace assetdiff::queue {

/*
  What the worker does with each dequeued job. Throwing marks the job failed;
  it is committed either way.
*/
class JobHandler {
 public:
  virtual ~JobHandler() = default;

  virtual void HandleDiff(const assetdiff::jobs::v1::DiffRequest& request) = 0;
  virtual void HandleCleanup()                                             = 0;
};

} // namespace assetdiff::queue
