#include "internal/queue/maintenance_scheduler.hpp"

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace assetdiff::queue {

MaintenanceScheduler::MaintenanceScheduler(std::shared_ptr<DurableQueue> queue, const assetdiff::runtime::config::MaintenanceConfig& config)
    : queue_(std::move(queue)) {
  const auto at = util::ParseDailyAt(config.daily_at());
  if (!at) {
    throw util::InvalidArgument("maintenance.daily_at must be HH:MM, got '" + config.daily_at() + "'");
  }
  hour_   = at->first;
  minute_ = at->second;
}

MaintenanceScheduler::~MaintenanceScheduler() {
  Stop();
}

util::TimePoint MaintenanceScheduler::NextTrigger(util::TimePoint now) const {
  return util::NextDailyTrigger(now, hour_, minute_);
}

uint64_t MaintenanceScheduler::Fire() {
  assetdiff::jobs::v1::DurableJob job;
  job.mutable_cleanup();
  job.set_enqueued_at_ms(util::ToUnixMillis(util::Now()));
  return queue_->Enqueue(job).sequence;
}

void MaintenanceScheduler::Start() {
  {
    std::lock_guard lock(mutex_);
    stop_ = false;
  }
  thread_ = std::thread(&MaintenanceScheduler::Run, this);
}

void MaintenanceScheduler::Stop() {
  {
    std::lock_guard lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void MaintenanceScheduler::Run() {
  std::unique_lock lock(mutex_);
  while (!stop_) {
    const auto next = NextTrigger(util::Now());
    ASSETDIFF_LOG_DEBUG("next maintenance scheduled", {observability::IntField("at_ms", util::ToUnixMillis(next))});

    if (cv_.wait_until(lock, next, [&] { return stop_; })) break;

    lock.unlock();
    try {
      const auto sequence = Fire();
      ASSETDIFF_LOG_INFO("maintenance enqueued", {observability::UintField("sequence", sequence)});
    } catch (const std::exception& e) {
      ASSETDIFF_LOG_ERROR("failed to enqueue maintenance", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace assetdiff::queue
