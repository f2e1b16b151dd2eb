#pragma once

#include <memory>

#include "internal/core/diff_pipeline.hpp"
#include "internal/core/maintenance.hpp"
#include "internal/queue/job_handler.hpp"

namespace assetdiff::core {

// Routes dequeued jobs to the diff pipeline or to maintenance.
class JobProcessor final : public queue::JobHandler {
 public:
  JobProcessor(std::shared_ptr<DiffPipeline> pipeline, std::shared_ptr<Maintenance> maintenance);

  void HandleDiff(const assetdiff::jobs::v1::DiffRequest& request) override;
  void HandleCleanup() override;

 private:
  std::shared_ptr<DiffPipeline> pipeline_;
  std::shared_ptr<Maintenance>  maintenance_;
};

} // namespace assetdiff::core
