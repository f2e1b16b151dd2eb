#include "internal/core/job_processor.hpp"

#include "internal/util/errors.hpp"

namespace assetdiff::core {

JobProcessor::JobProcessor(std::shared_ptr<DiffPipeline> pipeline, std::shared_ptr<Maintenance> maintenance)
    : pipeline_(std::move(pipeline)), maintenance_(std::move(maintenance)) {
  if (!pipeline_ || !maintenance_) throw util::InvalidArgument("job processor requires pipeline and maintenance");
}

void JobProcessor::HandleDiff(const assetdiff::jobs::v1::DiffRequest& request) {
  pipeline_->Run(request);
}

void JobProcessor::HandleCleanup() {
  maintenance_->Run();
}

} // namespace assetdiff::core
