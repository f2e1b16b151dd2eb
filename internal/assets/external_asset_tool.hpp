#pragma once

#include <string>
#include <vector>

#include "internal/assets/asset_codec.hpp"

namespace assetdiff::runtime::config {
class AssetToolConfig;
}

namespace assetdiff::assets {

/*
  Codec and rasterizer backed by the `asset_tool.command` executable.

  Protocol (one process per call):
      sprite-info   <file>                                  -> JSON SpriteSheetInfo
      sprite-frames <file> <state> <duplicate>              -> raw frame bytes
      sprite-render <file> <state> <duplicate> <target>     -> written path
      map-info      <file>                                  -> JSON MapInfo
      map-render    <file> <z> <x1> <y1> <x2> <y2> <target> -> written path
      image-diff    <before> <after> <target>               -> written path
*/
class ExternalAssetTool final : public SpriteCodec, public MapCodec, public Rasterizer {
 public:
  explicit ExternalAssetTool(const assetdiff::runtime::config::AssetToolConfig& config);

  SpriteSheet           LoadSheet(const std::filesystem::path& file) override;
  std::string           Frames(const std::filesystem::path& file, const SpriteIdentity& identity) override;
  std::filesystem::path Render(const std::filesystem::path& file,
                               const SpriteIdentity&        identity,
                               const std::filesystem::path& target) override;

  MapGrid               LoadMap(const std::filesystem::path& file) override;
  std::filesystem::path Render(const std::filesystem::path& file,
                               uint32_t                     z,
                               const Rect&                  region,
                               const std::filesystem::path& target) override;

  std::filesystem::path Diff(const std::filesystem::path& before,
                             const std::filesystem::path& after,
                             const std::filesystem::path& target) override;

 private:
  std::string Invoke(const std::vector<std::string>& args, bool render) const;

  std::string command_;
};

} // namespace assetdiff::assets
