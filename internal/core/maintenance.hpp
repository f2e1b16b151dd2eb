#pragma once

#include <cstddef>
#include <filesystem>

#include "config/config.pb.h"

namespace assetdiff::core {

struct MaintenanceSummary {
  std::size_t artifact_dirs_removed = 0;
  std::size_t clones_pruned         = 0;
  std::size_t clones_failed         = 0;
};

/*
  Daily housekeeping.

  Deletes rendered artifacts of pull requests untouched for longer than
  retention_days and removes leftover job branches/worktrees from every clone.
  Failures on one clone are logged and do not stop the others.
*/
class Maintenance {
 public:
  explicit Maintenance(const assetdiff::runtime::config::RuntimeConfig& config);

  MaintenanceSummary Run();

  std::size_t PruneArtifacts(std::filesystem::file_time_type cutoff);
  void        PruneClones(MaintenanceSummary& summary);

 private:
  const assetdiff::runtime::config::RuntimeConfig& config_;
};

} // namespace assetdiff::core
