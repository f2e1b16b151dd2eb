#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "assetdiff/jobs/v1/job.pb.h"
#include "config/config.pb.h"
#include "internal/assets/asset_codec.hpp"
#include "internal/diff/map_diff.hpp"
#include "internal/diff/sprite_diff.hpp"
#include "internal/report/chunk_assembler.hpp"
#include "internal/report/report_sink.hpp"

namespace assetdiff::git {
class CheckoutManager;
}

namespace assetdiff::core {

/*
  Turns one DiffRequest into a published report.

      blocklist -> clone -> revision pair -> base view -> head worktree
                -> diff engines -> chunk assembler -> report sink

  Transient refs and worktrees are cleaned up on every exit path. A render
  error is rethrown after cleanup; a cleanup failure after a successful render
  publishes the report and then throws CleanupFailed.
*/
class DiffPipeline {
 public:
  struct Codecs {
    std::shared_ptr<assets::SpriteCodec> sprites;
    std::shared_ptr<assets::MapCodec>    maps;
    std::shared_ptr<assets::Rasterizer>  rasterizer;
  };

  DiffPipeline(const assetdiff::runtime::config::RuntimeConfig& config, Codecs codecs, std::shared_ptr<report::ReportSink> sink);

  void Run(const assetdiff::jobs::v1::DiffRequest& request);

  std::filesystem::path ClonePathFor(const std::string& full_name) const;
  std::string           RemoteUrlFor(const std::string& full_name) const;
  std::string           HeadFetchRef(const assetdiff::jobs::v1::DiffRequest& request) const;

 private:
  struct Classified {
    std::vector<diff::SpriteFile> sprites;
    std::vector<diff::MapFile>    maps;
  };

  bool       Blocked(uint64_t repository_id) const;
  Classified Classify(const assetdiff::jobs::v1::DiffRequest& request) const;
  void       Process(const assetdiff::jobs::v1::DiffRequest& request, const report::ReportTarget& target);

  report::ReportOutputs Render(git::CheckoutManager& checkout, const assetdiff::jobs::v1::DiffRequest& request, Classified& files) const;

  const assetdiff::runtime::config::RuntimeConfig& config_;
  Codecs                                           codecs_;
  std::shared_ptr<report::ReportSink>              sink_;
  report::ChunkAssembler                           assembler_;
};

} // namespace assetdiff::core
