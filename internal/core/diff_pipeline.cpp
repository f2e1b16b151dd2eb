#include "internal/core/diff_pipeline.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <string_view>

#include "internal/diff/artifact_paths.hpp"
#include "internal/git/checkout_manager.hpp"
#include "internal/model/file_change.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/report/report_format.hpp"
#include "internal/util/errors.hpp"

namespace assetdiff::core {

namespace {

using assetdiff::jobs::v1::DiffRequest;
using assetdiff::report::v1::ReportOutput;

report::ChunkLimits LimitsFrom(const assetdiff::runtime::config::ReportConfig& config) {
  report::ChunkLimits limits;
  if (config.detail_ceiling() != 0) limits.detail_ceiling = config.detail_ceiling();
  if (config.report_ceiling() != 0) limits.report_ceiling = config.report_ceiling();
  return limits;
}

report::ReportTarget TargetFor(const DiffRequest& request) {
  return report::ReportTarget{request.repo().id(), request.pull_request(), request.report_handle()};
}

void Validate(const DiffRequest& request) {
  if (request.repo().full_name().empty()) throw util::InvalidArgument("diff request without repository name");
  if (request.base().sha().empty() || request.head().sha().empty()) throw util::InvalidArgument("diff request without base/head sha");
  if (request.base().ref().empty()) throw util::InvalidArgument("diff request without base branch");
  if (request.head().ref().empty() && request.pull_request() == 0) throw util::InvalidArgument("diff request without head ref");
  if (request.report_handle().empty()) throw util::InvalidArgument("diff request without report handle");
}

std::string OwnerFor(const DiffRequest& request) {
  return std::to_string(request.installation_id() != 0 ? request.installation_id() : request.repo().id());
}

} // namespace

DiffPipeline::DiffPipeline(const assetdiff::runtime::config::RuntimeConfig& config, Codecs codecs, std::shared_ptr<report::ReportSink> sink)
    : config_(config),
      codecs_(std::move(codecs)),
      sink_(std::move(sink)),
      assembler_(LimitsFrom(config.report()), config.report().title(), config.report().summary()) {
  if (!codecs_.sprites || !codecs_.maps || !codecs_.rasterizer) throw util::InvalidArgument("diff pipeline requires sprite, map and raster codecs");
  if (!sink_) throw util::InvalidArgument("diff pipeline requires a report sink");
}

std::filesystem::path DiffPipeline::ClonePathFor(const std::string& full_name) const {
  const std::filesystem::path relative = std::filesystem::path(full_name).lexically_normal();
  if (full_name.empty() || relative.is_absolute() || *relative.begin() == "..") {
    throw util::InvalidArgument("invalid repository name: " + full_name);
  }
  return std::filesystem::path(config_.repositories().clone_root()) / relative;
}

std::string DiffPipeline::RemoteUrlFor(const std::string& full_name) const {
  std::string url = config_.repositories().remote_url_template();
  static constexpr std::string_view kPlaceholder = "{repo}";
  for (auto pos = url.find(kPlaceholder); pos != std::string::npos; pos = url.find(kPlaceholder, pos + full_name.size())) {
    url.replace(pos, kPlaceholder.size(), full_name);
  }
  return url;
}

std::string DiffPipeline::HeadFetchRef(const DiffRequest& request) const {
  if (config_.repositories().fetch_pull_refs() && request.pull_request() != 0) {
    return "pull/" + std::to_string(request.pull_request()) + "/head";
  }
  return request.head().ref();
}

bool DiffPipeline::Blocked(uint64_t repository_id) const {
  const auto& ids = config_.blocklist().repository_ids();
  return std::find(ids.begin(), ids.end(), repository_id) != ids.end();
}

DiffPipeline::Classified DiffPipeline::Classify(const DiffRequest& request) const {
  Classified out;
  for (const auto& change : model::FromProto(request.files())) {
    const model::RevisionSides sides = model::SidesFor(change);
    if (!sides.base_path && !sides.head_path) continue;

    switch (model::ClassifyAsset(change.path, config_.asset_tool())) {
      case model::AssetKind::kSprite: {
        diff::SpriteFile file;
        file.path  = change.path;
        file.sides = sides;
        out.sprites.push_back(std::move(file));
        break;
      }
      case model::AssetKind::kMap: {
        diff::MapFile file;
        file.path  = change.path;
        file.sides = sides;
        out.maps.push_back(std::move(file));
        break;
      }
      case model::AssetKind::kOther:
        break;
    }
  }
  return out;
}

// ---------------------------------------------------------------------------

void DiffPipeline::Run(const DiffRequest& request) {
  const report::ReportTarget target = TargetFor(request);

  try {
    Process(request, target);
  } catch (const util::CleanupFailed&) {
    // The report is already published.
    throw;
  } catch (const std::exception& e) {
    ASSETDIFF_LOG_ERROR("diff job failed",
                        {observability::StringField("repository", request.repo().full_name()),
                         observability::UintField("pull_request", request.pull_request()),
                         observability::StringField("error", e.what())});
    if (!target.report_handle.empty()) {
      sink_->Failed(target, report::FailureOutput(config_.report().title(), e.what()));
    }
    throw;
  }
}

void DiffPipeline::Process(const DiffRequest& request, const report::ReportTarget& target) {
  Validate(request);

  if (Blocked(request.repo().id())) {
    ReportOutput output;
    output.set_title(config_.report().title());
    output.set_summary("This repository is blocked from using the asset diff service.");
    std::string body = "Asset diffs are disabled for this repository.";
    if (!config_.blocklist().contact().empty()) body += " Contact " + config_.blocklist().contact() + " to have it re-enabled.";
    output.set_body(body);
    ASSETDIFF_LOG_INFO("skipping blocked repository", {observability::UintField("repository_id", request.repo().id())});
    sink_->Skipped(target, output);
    return;
  }

  sink_->Started(target);

  Classified files = Classify(request);
  if (files.sprites.empty() && files.maps.empty()) {
    sink_->Completed(target, assembler_.Assemble({}));
    return;
  }

  git::CheckoutManager checkout(ClonePathFor(request.repo().full_name()), config_.repositories());
  if (!checkout.HasClone()) {
    ReportOutput progress;
    progress.set_title(config_.report().title());
    progress.set_summary("Cloning repo...");
    progress.set_body("The repository is being cloned, this will take a few minutes. Future runs will not require cloning.");
    sink_->Progress(target, progress);
  }
  checkout.EnsureClone(RemoteUrlFor(request.repo().full_name()));

  report::ReportOutputs outputs;
  std::exception_ptr    render_error;
  try {
    outputs = Render(checkout, request, files);
  } catch (const std::exception&) {
    render_error = std::current_exception();
  }

  try {
    checkout.CleanUpReferences(request.base().ref());
  } catch (const std::exception& e) {
    ASSETDIFF_LOG_WARN("cleanup of job references failed",
                       {observability::StringField("repository", request.repo().full_name()),
                        observability::StringField("error", e.what())});
    if (render_error) std::rethrow_exception(render_error);
    sink_->Completed(target, outputs);
    throw util::CleanupFailed(request.repo().full_name() + ": " + e.what());
  }

  if (render_error) std::rethrow_exception(render_error);
  sink_->Completed(target, outputs);
}

report::ReportOutputs DiffPipeline::Render(git::CheckoutManager& checkout, const DiffRequest& request, Classified& files) const {
  observability::SpanScope span("assetdiff.render");
  span.SetAttribute("repository", request.repo().full_name());
  span.SetAttribute("pull_request", static_cast<std::int64_t>(request.pull_request()));

  const git::RevisionPair pair =
      checkout.OpenRevisionPair(request.base().sha(), request.head().sha(), request.base().ref(), HeadFetchRef(request));

  const diff::ArtifactLayout layout(config_.output(), OwnerFor(request), request.pull_request());
  const std::size_t          workers = config_.asset_tool().render_workers();

  const diff::SpriteDiffEngine sprites(*codecs_.sprites, layout, workers);
  const diff::MapDiffEngine    maps(*codecs_.maps, *codecs_.rasterizer, layout, workers);

  checkout.WithCheckout(pair.base.reference, [&](const std::filesystem::path& root) {
    for (auto& file : files.sprites) sprites.Load(file, diff::Side::kBase, root, pair.base.sha);
    for (auto& file : files.maps) maps.Load(file, diff::Side::kBase, root);
  });

  // The base stays checked out in the clone while the head lives in a worktree,
  // so renders can read either revision.
  return checkout.WithCheckoutWorktree(pair.head.reference, checkout.WorktreeNameFor(pair), [&](const std::filesystem::path& root) {
    for (auto& file : files.sprites) sprites.Load(file, diff::Side::kHead, root, pair.head.sha);
    for (auto& file : files.maps) maps.Load(file, diff::Side::kHead, root);

    std::vector<report::ReportSection> sections;
    for (const auto& file : files.sprites) sections.push_back(report::SpriteSection(sprites.Diff(file)));
    for (const auto& result : maps.Diff(files.maps)) sections.push_back(report::MapSection(result));

    span.AddEvent("assembling report");
    return assembler_.Assemble(sections);
  });
}

} // namespace assetdiff::core
