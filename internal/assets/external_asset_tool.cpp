#include "internal/assets/external_asset_tool.hpp"

#include <google/protobuf/util/json_util.h>

#include "config/config.pb.h"
#include "internal/assets/subprocess.hpp"
#include "internal/util/errors.hpp"

namespace assetdiff::assets {

namespace {

template <typename Message>
Message ParseJson(const std::string& json, const std::string& what) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  Message message;
  auto    status = google::protobuf::util::JsonStringToMessage(json, &message, options);
  if (!status.ok()) {
    throw util::DecodeError(what + ": malformed tool output: " + std::string(status.message()));
  }
  return message;
}

std::string Trim(std::string value) {
  while (!value.empty() && (value.back() == '\n' || value.back() == '\r' || value.back() == ' ')) {
    value.pop_back();
  }
  return value;
}

std::filesystem::path WrittenPath(const std::string& out, const std::filesystem::path& target) {
  std::string path = Trim(out);
  if (path.empty()) {
    throw util::RenderError("renderer reported no output for " + target.string());
  }
  return std::filesystem::path(std::move(path));
}

} // namespace

ExternalAssetTool::ExternalAssetTool(const assetdiff::runtime::config::AssetToolConfig& config) : command_(config.command()) {
  if (command_.empty()) {
    throw util::InvalidArgument("asset_tool.command must not be empty");
  }
}

std::string ExternalAssetTool::Invoke(const std::vector<std::string>& args, bool render) const {
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.push_back(command_);
  argv.insert(argv.end(), args.begin(), args.end());

  const std::string what = args.front() + " " + (args.size() > 1 ? args[1] : std::string());

  ProcessResult result;
  try {
    result = RunProcess(argv);
  } catch (const std::exception& e) {
    if (render) throw util::RenderError(what + ": " + e.what());
    throw util::DecodeError(what + ": " + e.what());
  }

  if (!result.Ok()) {
    const std::string msg = what + ": exit " + std::to_string(result.exit_code) + ": " + Trim(result.err);
    if (render) throw util::RenderError(msg);
    throw util::DecodeError(msg);
  }
  return std::move(result.out);
}

SpriteSheet ExternalAssetTool::LoadSheet(const std::filesystem::path& file) {
  const auto out = Invoke({"sprite-info", file.string()}, false);
  return SpriteSheet::FromInfo(ParseJson<assetdiff::tool::v1::SpriteSheetInfo>(out, file.string()));
}

std::string ExternalAssetTool::Frames(const std::filesystem::path& file, const SpriteIdentity& identity) {
  return Invoke({"sprite-frames", file.string(), identity.name, std::to_string(identity.duplicate)}, false);
}

std::filesystem::path ExternalAssetTool::Render(const std::filesystem::path& file,
                                                const SpriteIdentity&        identity,
                                                const std::filesystem::path& target) {
  const auto out =
      Invoke({"sprite-render", file.string(), identity.name, std::to_string(identity.duplicate), target.string()}, true);
  return WrittenPath(out, target);
}

MapGrid ExternalAssetTool::LoadMap(const std::filesystem::path& file) {
  const auto out = Invoke({"map-info", file.string()}, false);
  return MapGrid::FromInfo(ParseJson<assetdiff::tool::v1::MapInfo>(out, file.string()));
}

std::filesystem::path ExternalAssetTool::Render(const std::filesystem::path& file,
                                                uint32_t                     z,
                                                const Rect&                  region,
                                                const std::filesystem::path& target) {
  const auto out = Invoke({"map-render",
                           file.string(),
                           std::to_string(z),
                           std::to_string(region.x1),
                           std::to_string(region.y1),
                           std::to_string(region.x2),
                           std::to_string(region.y2),
                           target.string()},
                          true);
  return WrittenPath(out, target);
}

std::filesystem::path ExternalAssetTool::Diff(const std::filesystem::path& before,
                                              const std::filesystem::path& after,
                                              const std::filesystem::path& target) {
  const auto out = Invoke({"image-diff", before.string(), after.string(), target.string()}, true);
  return WrittenPath(out, target);
}

} // namespace assetdiff::assets
