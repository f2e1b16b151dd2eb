#include "internal/core/diff_pipeline.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/maintenance.hpp"
#include "internal/git/checkout_manager.hpp"
#include "internal/report/chunk_assembler.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/support/git_fixture.hpp"

namespace {

namespace fs = std::filesystem;

using assetdiff::core::DiffPipeline;
using assetdiff::jobs::v1::DiffRequest;
using assetdiff::report::ReportOutputs;
using assetdiff::report::ReportTarget;
using assetdiff::report::v1::ReportOutput;
using assetdiff::testing::FreshDir;
using assetdiff::testing::OriginRepo;
using assetdiff::testing::ReadText;

std::vector<std::string> Split(const std::string& text, char sep) {
  std::vector<std::string> out;
  std::stringstream        in(text);
  std::string              item;
  while (std::getline(in, item, sep)) {
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

/*
  Reads assets from a tiny text format so fixtures can live in git:
      sprite:  "idle=aaa;walk=bbb"  (state=pixels)
      map:     "2x2:a,b,c,d"        (single level)
*/
class TextAssetCodec final : public assetdiff::assets::SpriteCodec, public assetdiff::assets::MapCodec, public assetdiff::assets::Rasterizer {
 public:
  assetdiff::assets::SpriteSheet LoadSheet(const fs::path& file) override {
    assetdiff::tool::v1::SpriteSheetInfo info;
    info.set_width(32);
    info.set_height(32);
    for (const auto& entry : Split(ReadText(file), ';')) {
      auto* state = info.add_states();
      state->set_name(entry.substr(0, entry.find('=')));
      state->set_dirs(1);
      state->set_frames(1);
    }
    return assetdiff::assets::SpriteSheet::FromInfo(info);
  }

  std::string Frames(const fs::path& file, const assetdiff::assets::SpriteIdentity& identity) override {
    for (const auto& entry : Split(ReadText(file), ';')) {
      const auto eq = entry.find('=');
      if (entry.substr(0, eq) == identity.name) return entry.substr(eq + 1);
    }
    throw assetdiff::util::DecodeError("no state " + identity.name);
  }

  fs::path Render(const fs::path&, const assetdiff::assets::SpriteIdentity& identity, const fs::path& target) override {
    ++renders;
    return Write(target, identity.name);
  }

  assetdiff::assets::MapGrid LoadMap(const fs::path& file) override {
    const std::string text  = ReadText(file);
    const auto        colon = text.find(':');
    const auto        x     = text.find('x');

    assetdiff::tool::v1::MapInfo info;
    info.set_width(static_cast<uint32_t>(std::stoul(text.substr(0, x))));
    info.set_height(static_cast<uint32_t>(std::stoul(text.substr(x + 1, colon - x - 1))));
    info.set_depth(1);
    for (const auto& tile : Split(text.substr(colon + 1), ',')) info.add_tiles(tile);
    return assetdiff::assets::MapGrid::FromInfo(info);
  }

  fs::path Render(const fs::path&, uint32_t z, const assetdiff::assets::Rect& region, const fs::path& target) override {
    ++renders;
    return Write(target, std::to_string(z) + " " + region.ToString());
  }

  fs::path Diff(const fs::path&, const fs::path&, const fs::path& target) override {
    if (rasterizer_offline) throw std::runtime_error("rasterizer offline");
    ++diffs;
    return Write(target, "diff");
  }

  std::atomic<bool> rasterizer_offline{false};
  std::atomic<int>  renders{0};
  std::atomic<int>  diffs{0};

 private:
  static fs::path Write(const fs::path& target, const std::string& contents) {
    const fs::path written = target.string() + ".png";
    std::ofstream(written) << contents;
    return written;
  }
};

class RecordingSink final : public assetdiff::report::ReportSink {
 public:
  void Started(const ReportTarget&) override {
    events.push_back("started");
  }
  void Progress(const ReportTarget&, const ReportOutput& output) override {
    events.push_back("progress");
    last = output;
  }
  void Completed(const ReportTarget&, const ReportOutputs& outputs) override {
    events.push_back("completed");
    completed = outputs;
  }
  void Skipped(const ReportTarget&, const ReportOutput& output) override {
    events.push_back("skipped");
    last = output;
  }
  void Failed(const ReportTarget&, const ReportOutput& output) override {
    events.push_back("failed");
    last = output;
  }

  std::vector<std::string> events;
  ReportOutput             last;
  ReportOutputs            completed;
};

struct Fixture {
  fs::path                                  root;
  OriginRepo                                origin;
  assetdiff::runtime::config::RuntimeConfig config;
  std::shared_ptr<TextAssetCodec>           codec = std::make_shared<TextAssetCodec>();
  std::shared_ptr<RecordingSink>            sink  = std::make_shared<RecordingSink>();
  std::string                               base_sha;
  std::string                               head_sha;

  explicit Fixture(const std::string& name) : root(FreshDir("assetdiff_pipeline_tests", name)), origin(root / "origin" / "org" / "game") {
    assetdiff::config::ConfigLoader::ApplyDefaults(config);
    config.mutable_repositories()->set_clone_root((root / "repos").string());
    config.mutable_repositories()->set_remote_url_template((root / "origin").string() + "/{repo}");
    config.mutable_repositories()->set_fetch_pull_refs(false);
    config.mutable_output()->set_root((root / "images").string());
    config.mutable_output()->set_public_url("https://cdn.example.com/");
    config.mutable_asset_tool()->set_render_workers(2);
    config.mutable_blocklist()->add_repository_ids(666);
    config.mutable_blocklist()->set_contact("assets@example.com");

    base_sha = origin.Commit("refs/heads/main",
                             {{"icons/mob.dmi", "idle=aaa;walk=bbb"}, {"maps/station.dmm", "2x2:a,b,c,d"}, {"README.md", "v1"}});
    head_sha = origin.Commit(
        "refs/heads/feature",
        {{"icons/mob.dmi", "idle=aaa;walk=ccc;run=ddd"}, {"icons/new.dmi", "spin=eee"}, {"maps/station.dmm", "2x2:a,b,c,x"}, {"README.md", "v2"}},
        base_sha);
    origin.SetHead("refs/heads/main");
  }

  DiffPipeline Pipeline() {
    return DiffPipeline(config, DiffPipeline::Codecs{codec, codec, codec}, sink);
  }

  DiffRequest Request(uint64_t repository_id = 7) const {
    DiffRequest request;
    request.set_installation_id(1);
    request.mutable_repo()->set_id(repository_id);
    request.mutable_repo()->set_full_name("org/game");
    request.mutable_base()->set_sha(base_sha);
    request.mutable_base()->set_ref("main");
    request.mutable_head()->set_sha(head_sha);
    request.mutable_head()->set_ref("feature");
    request.set_pull_request(9);
    request.set_report_handle("check-9");

    auto add = [&](const std::string& path, assetdiff::jobs::v1::ChangeKind kind) {
      auto* file = request.add_files();
      file->set_filename(path);
      file->set_status(kind);
    };
    add("icons/mob.dmi", assetdiff::jobs::v1::CHANGE_KIND_MODIFIED);
    add("icons/new.dmi", assetdiff::jobs::v1::CHANGE_KIND_ADDED);
    add("maps/station.dmm", assetdiff::jobs::v1::CHANGE_KIND_MODIFIED);
    add("README.md", assetdiff::jobs::v1::CHANGE_KIND_MODIFIED);
    return request;
  }

  fs::path ClonePath() const {
    return root / "repos" / "org" / "game";
  }

  void ExpectCleanClone() const {
    assetdiff::git::CheckoutManager checkout(ClonePath(), config.repositories());
    checkout.Open();
    assert(checkout.JobBranches().empty());
    assert(checkout.JobWorktrees().empty());
    assert(checkout.HeadReference() == "refs/heads/main");
  }
};

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

void TestBlockedRepositoryIsSkipped() {
  Fixture fixture("blocked");
  auto    pipeline = fixture.Pipeline();

  pipeline.Run(fixture.Request(666));

  assert((fixture.sink->events == std::vector<std::string>{"skipped"}));
  assert(Contains(fixture.sink->last.summary(), "blocked"));
  assert(Contains(fixture.sink->last.body(), "assets@example.com"));
  assert(!fs::exists(fixture.ClonePath()));
}

void TestRequestWithoutAssetsCompletesEmpty() {
  Fixture fixture("no_assets");
  auto    pipeline = fixture.Pipeline();

  auto request = fixture.Request();
  request.clear_files();
  auto* readme = request.add_files();
  readme->set_filename("README.md");
  readme->set_status(assetdiff::jobs::v1::CHANGE_KIND_MODIFIED);

  pipeline.Run(request);

  assert((fixture.sink->events == std::vector<std::string>{"started", "completed"}));
  assert(fixture.sink->completed.primary.summary() == assetdiff::report::ChunkAssembler::kNoChangesSummary);
  assert(fixture.sink->completed.additional.empty());
  assert(!fs::exists(fixture.ClonePath()));
}

void TestFullRunRendersAndCleansUp() {
  Fixture fixture("full");
  auto    pipeline = fixture.Pipeline();

  pipeline.Run(fixture.Request());

  assert((fixture.sink->events == std::vector<std::string>{"started", "progress", "completed"}));
  assert(fixture.sink->last.summary() == "Cloning repo...");

  const auto& body = fixture.sink->completed.primary.body();
  assert(fixture.sink->completed.primary.summary() == fixture.config.report().summary());
  assert(Contains(body, "icons/mob.dmi"));
  assert(Contains(body, "icons/new.dmi"));
  assert(Contains(body, "maps/station.dmm"));
  assert(Contains(body, "walk"));
  assert(Contains(body, "spin"));
  assert(Contains(body, "https://cdn.example.com/1/9/"));
  assert(!Contains(body, "README.md"));

  assert(fixture.codec->diffs.load() == 1);
  assert(fs::exists(fixture.root / "images" / "1" / "9"));
  fixture.ExpectCleanClone();

  // the clone is reused, so there is no clone notice the second time
  pipeline.Run(fixture.Request());
  assert((fixture.sink->events == std::vector<std::string>{"started", "progress", "completed", "started", "completed"}));
  fixture.ExpectCleanClone();
}

void TestRenderFailureReportsAndStillCleansUp() {
  Fixture fixture("render_failure");
  auto    pipeline = fixture.Pipeline();
  fixture.codec->rasterizer_offline = true;

  bool threw = false;
  try {
    pipeline.Run(fixture.Request());
  } catch (const std::runtime_error& e) {
    threw = Contains(e.what(), "rasterizer offline");
  }
  assert(threw);

  assert(fixture.sink->events.back() == "failed");
  assert(Contains(fixture.sink->last.body(), "rasterizer offline"));
  fixture.ExpectCleanClone();
}

void TestInvalidRequestIsRejected() {
  Fixture fixture("invalid");
  auto    pipeline = fixture.Pipeline();

  auto no_sha = fixture.Request();
  no_sha.mutable_head()->clear_sha();

  bool threw = false;
  try {
    pipeline.Run(no_sha);
  } catch (const assetdiff::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert((fixture.sink->events == std::vector<std::string>{"failed"}));

  // nowhere to report without a handle
  auto no_handle = fixture.Request();
  no_handle.clear_report_handle();
  threw = false;
  try {
    pipeline.Run(no_handle);
  } catch (const assetdiff::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(fixture.sink->events.size() == 1);
}

void TestRepositoryAddressing() {
  Fixture fixture("addressing");
  auto    pipeline = fixture.Pipeline();

  assert(pipeline.ClonePathFor("org/game") == fixture.ClonePath());
  assert(pipeline.RemoteUrlFor("org/game") == (fixture.root / "origin").string() + "/org/game");

  for (const std::string bad : {"", "../escape", "/abs/path", "org/../../escape"}) {
    bool threw = false;
    try {
      pipeline.ClonePathFor(bad);
    } catch (const assetdiff::util::InvalidArgument&) {
      threw = true;
    }
    assert(threw);
  }

  auto request = fixture.Request();
  assert(pipeline.HeadFetchRef(request) == "feature");
  fixture.config.mutable_repositories()->set_fetch_pull_refs(true);
  assert(pipeline.HeadFetchRef(request) == "pull/9/head");
  request.set_pull_request(0);
  assert(pipeline.HeadFetchRef(request) == "feature");
}

void TestMaintenanceExpiresArtifactsAndPrunesClones() {
  Fixture fixture("maintenance");
  fixture.config.mutable_maintenance()->set_retention_days(30);

  const fs::path images   = fixture.root / "images";
  const fs::path stale    = images / "1" / "3";
  const fs::path fresh    = images / "1" / "4";
  const fs::path orphaned = images / "2" / "5";
  for (const auto& dir : {stale, fresh, orphaned}) {
    fs::create_directories(dir / "m" / "icons_mob");
    std::ofstream(dir / "m" / "icons_mob" / "x.png") << "png";
  }

  const auto old = fs::file_time_type::clock::now() - std::chrono::hours(24 * 40);
  for (const auto& dir : {stale, orphaned}) {
    for (const auto& entry : fs::recursive_directory_iterator(dir)) fs::last_write_time(entry.path(), old);
    fs::last_write_time(dir, old);
  }

  // a clone with job state left behind, and one that is not a repository
  {
    assetdiff::git::CheckoutManager checkout(fixture.ClonePath(), fixture.config.repositories());
    checkout.EnsureClone(fixture.origin.Url());
    checkout.OpenRevisionPair(fixture.base_sha, fixture.head_sha, "main", "feature");
    assert(checkout.JobBranches().size() == 1);
  }
  fs::create_directories(fixture.root / "repos" / "org" / "broken" / ".git");

  assetdiff::core::Maintenance maintenance(fixture.config);
  const auto                   summary = maintenance.Run();

  assert(summary.artifact_dirs_removed == 2);
  assert(!fs::exists(stale));
  assert(fs::exists(fresh));
  assert(!fs::exists(images / "2"));
  assert(summary.clones_pruned == 1);
  assert(summary.clones_failed == 1);

  assetdiff::git::CheckoutManager checkout(fixture.ClonePath(), fixture.config.repositories());
  checkout.Open();
  assert(checkout.JobBranches().empty());
}

} // namespace

int main() {
  assetdiff::git::GitLibrary library;

  TestBlockedRepositoryIsSkipped();
  TestRequestWithoutAssetsCompletesEmpty();
  TestFullRunRendersAndCleansUp();
  TestRenderFailureReportsAndStillCleansUp();
  TestInvalidRequestIsRejected();
  TestRepositoryAddressing();
  TestMaintenanceExpiresArtifactsAndPrunesClones();

  std::cout << "assetdiff_unit_diff_pipeline: pass\n";
  return 0;
}
