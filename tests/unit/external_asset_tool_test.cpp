#include "internal/assets/external_asset_tool.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "config/config.pb.h"
#include "internal/assets/subprocess.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using assetdiff::assets::ExternalAssetTool;
using assetdiff::assets::RunProcess;
using assetdiff::assets::SpriteIdentity;

constexpr const char* kToolScript = R"(#!/bin/sh
case "$1" in
  sprite-info)
    case "$2" in
      *garbled*) echo "not json" ;;
      *) printf '{"width":32,"height":32,"toolVersion":"2","states":[{"name":"idle","dirs":4,"frames":2,"palette":[1]},{"name":"idle"}]}' ;;
    esac ;;
  sprite-frames) printf 'frames:%s:%s' "$3" "$4" ;;
  sprite-render)
    if [ "$3" = "boom" ]; then echo "renderer crashed" >&2; exit 1; fi
    echo "$5" ;;
  map-info)
    case "$2" in
      *bad*) echo "unterminated key" >&2; exit 4 ;;
      *) printf '{"width":2,"height":1,"depth":2,"tiles":["a","b","c","d"]}' ;;
    esac ;;
  map-render) echo "$8" ;;
  image-diff) ;;
  *) echo "unknown command $1" >&2; exit 3 ;;
esac
)";

fs::path InstallTool() {
  const auto dir = fs::temp_directory_path() / "assetdiff_tool_tests";
  fs::remove_all(dir);
  fs::create_directories(dir);

  const auto path = dir / "fake-asset-tool";
  {
    std::ofstream out(path);
    out << kToolScript;
  }
  fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec, fs::perm_options::replace);
  return path;
}

ExternalAssetTool MakeTool(const fs::path& script) {
  assetdiff::runtime::config::AssetToolConfig config;
  config.set_command(script.string());
  return ExternalAssetTool(config);
}

template <typename Error, typename Fn>
std::string ExpectThrow(Fn&& fn) {
  try {
    fn();
  } catch (const Error& e) {
    return e.what();
  }
  assert(false && "expected exception");
  return {};
}

void TestRunProcessCapturesStreams() {
  const auto result = RunProcess({"sh", "-c", "echo out; echo err >&2; exit 5"});
  assert(result.exit_code == 5);
  assert(!result.Ok());
  assert(result.out == "out\n");
  assert(result.err == "err\n");

  const auto in_dir = RunProcess({"pwd"}, "/");
  assert(in_dir.Ok());
  assert(in_dir.out == "/\n");

  const auto missing = RunProcess({"assetdiff-command-that-does-not-exist"});
  assert(missing.exit_code == 127);
}

void TestSpriteInfoIgnoresUnknownFields() {
  auto tool  = MakeTool(InstallTool());
  auto sheet = tool.LoadSheet("icons/mob.dmi");

  assert(sheet.Width() == 32);
  assert(sheet.States().size() == 2);
  assert(sheet.States()[0].metadata.dirs() == 4);
  assert(sheet.Find(SpriteIdentity{"idle", 1}) != nullptr);

  assert(tool.Frames("icons/mob.dmi", SpriteIdentity{"idle", 1}) == "frames:idle:1");
}

void TestDecodeFailuresRaiseDecodeError() {
  auto tool = MakeTool(InstallTool());

  const auto exit_msg = ExpectThrow<assetdiff::util::DecodeError>([&] { tool.LoadMap("maps/bad.dmm"); });
  assert(exit_msg.find("exit 4") != std::string::npos);
  assert(exit_msg.find("unterminated key") != std::string::npos);

  const auto json_msg = ExpectThrow<assetdiff::util::DecodeError>([&] { tool.LoadSheet("icons/garbled.dmi"); });
  assert(json_msg.find("malformed tool output") != std::string::npos);
}

void TestMapInfoAndRender() {
  auto tool = MakeTool(InstallTool());
  auto grid = tool.LoadMap("maps/station.dmm");
  assert(grid.Width() == 2);
  assert(grid.Depth() == 2);
  assert(grid.At(2, 1, 2) == "d");

  const auto written = tool.Render("maps/station.dmm", 2, assetdiff::assets::Rect{1, 1, 2, 1}, "out/2-after.png");
  assert(written == fs::path("out/2-after.png"));
}

void TestRenderFailuresRaiseRenderError() {
  auto tool = MakeTool(InstallTool());

  assert(tool.Render("icons/mob.dmi", SpriteIdentity{"idle", 0}, "out/idle.png") == fs::path("out/idle.png"));

  const auto crash = ExpectThrow<assetdiff::util::RenderError>([&] { tool.Render("icons/mob.dmi", SpriteIdentity{"boom", 0}, "out/boom.png"); });
  assert(crash.find("renderer crashed") != std::string::npos);

  const auto silent = ExpectThrow<assetdiff::util::RenderError>([&] { tool.Diff("a.png", "b.png", "out/diff.png"); });
  assert(silent.find("renderer reported no output") != std::string::npos);
}

void TestMissingExecutableIsPerAssetError() {
  assetdiff::runtime::config::AssetToolConfig config;
  config.set_command("/nonexistent/assetdiff-tool");
  ExternalAssetTool tool(config);

  ExpectThrow<assetdiff::util::DecodeError>([&] { tool.LoadSheet("icons/mob.dmi"); });
  ExpectThrow<assetdiff::util::RenderError>([&] { tool.Diff("a.png", "b.png", "c.png"); });
}

void TestEmptyCommandRejected() {
  assetdiff::runtime::config::AssetToolConfig config;
  ExpectThrow<assetdiff::util::InvalidArgument>([&] { ExternalAssetTool tool(config); });
}

} // namespace

int main() {
  TestRunProcessCapturesStreams();
  TestSpriteInfoIgnoresUnknownFields();
  TestDecodeFailuresRaiseDecodeError();
  TestMapInfoAndRender();
  TestRenderFailuresRaiseRenderError();
  TestMissingExecutableIsPerAssetError();
  TestEmptyCommandRejected();

  std::cout << "assetdiff_unit_external_asset_tool: pass\n";
  return 0;
}
