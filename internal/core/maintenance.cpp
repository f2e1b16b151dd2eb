#include "internal/core/maintenance.hpp"

#include <chrono>
#include <system_error>
#include <vector>

#include "internal/git/checkout_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace assetdiff::core {

namespace fs = std::filesystem;

namespace {

// Newest modification time of anything below `dir`, including itself.
fs::file_time_type NewestWrite(const fs::path& dir) {
  std::error_code    ec;
  fs::file_time_type newest = fs::last_write_time(dir, ec);
  if (ec) newest = fs::file_time_type::min();

  for (fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code entry_ec;
    const auto      written = it->last_write_time(entry_ec);
    if (!entry_ec && written > newest) newest = written;
  }
  return newest;
}

std::vector<fs::path> Subdirectories(const fs::path& dir) {
  std::vector<fs::path> out;
  std::error_code       ec;
  if (!fs::is_directory(dir, ec)) return out;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    std::error_code type_ec;
    if (entry.is_directory(type_ec)) out.push_back(entry.path());
  }
  return out;
}

bool IsClone(const fs::path& dir) {
  std::error_code ec;
  return fs::exists(dir / ".git", ec);
}

} // namespace

Maintenance::Maintenance(const assetdiff::runtime::config::RuntimeConfig& config) : config_(config) {
}

MaintenanceSummary Maintenance::Run() {
  MaintenanceSummary summary;

  const auto retention = std::chrono::hours(24) * config_.maintenance().retention_days();
  summary.artifact_dirs_removed = PruneArtifacts(fs::file_time_type::clock::now() - retention);
  PruneClones(summary);

  ASSETDIFF_LOG_INFO("maintenance finished",
                     {observability::UintField("artifact_dirs_removed", summary.artifact_dirs_removed),
                      observability::UintField("clones_pruned", summary.clones_pruned),
                      observability::UintField("clones_failed", summary.clones_failed)});
  return summary;
}

std::size_t Maintenance::PruneArtifacts(fs::file_time_type cutoff) {
  const fs::path root = config_.output().root();
  if (root.empty()) return 0;

  std::size_t removed = 0;
  // <root>/<owner>/<pull_request>
  for (const auto& owner : Subdirectories(root)) {
    for (const auto& job : Subdirectories(owner)) {
      if (NewestWrite(job) >= cutoff) continue;

      std::error_code ec;
      fs::remove_all(job, ec);
      if (ec) {
        ASSETDIFF_LOG_WARN("failed to remove expired artifacts",
                           {observability::StringField("path", job.string()), observability::StringField("error", ec.message())});
        continue;
      }
      ++removed;
    }

    std::error_code ec;
    if (fs::is_empty(owner, ec) && !ec) fs::remove(owner, ec);
  }
  return removed;
}

void Maintenance::PruneClones(MaintenanceSummary& summary) {
  const fs::path root = config_.repositories().clone_root();
  if (root.empty()) return;

  // <clone_root>/<owner>/<name>, next to <name>.worktrees
  for (const auto& owner : Subdirectories(root)) {
    for (const auto& clone : Subdirectories(owner)) {
      if (!IsClone(clone)) continue;

      try {
        git::CheckoutManager checkout(clone, config_.repositories());
        checkout.Open();
        checkout.PruneJobState();
        ++summary.clones_pruned;
      } catch (const util::GitError& e) {
        ++summary.clones_failed;
        ASSETDIFF_LOG_WARN("failed to prune clone", {observability::StringField("clone", clone.string()), observability::StringField("error", e.what())});
      }
    }
  }
}

} // namespace assetdiff::core
