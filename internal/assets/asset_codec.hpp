#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "internal/assets/map_grid.hpp"
#include "internal/assets/sprite_sheet.hpp"

namespace assetdiff::assets {

/*
  Boundary to the external codec and rasterizer.

  Decoding failures throw util::DecodeError, rendering failures throw
  util::RenderError. Render targets are passed without an extension; the
  returned path is the file actually written.

  Implementations must tolerate concurrent Render calls for distinct targets.
*/

class SpriteCodec {
 public:
  virtual ~SpriteCodec() = default;

  virtual SpriteSheet LoadSheet(const std::filesystem::path& file) = 0;

  // Raw pixel frames of one state, used to compare states whose metadata matches.
  virtual std::string Frames(const std::filesystem::path& file, const SpriteIdentity& identity) = 0;

  virtual std::filesystem::path Render(const std::filesystem::path& file,
                                       const SpriteIdentity&        identity,
                                       const std::filesystem::path& target) = 0;
};

class MapCodec {
 public:
  virtual ~MapCodec() = default;

  virtual MapGrid LoadMap(const std::filesystem::path& file) = 0;

  virtual std::filesystem::path Render(const std::filesystem::path& file,
                                       uint32_t                     z,
                                       const Rect&                  region,
                                       const std::filesystem::path& target) = 0;
};

class Rasterizer {
 public:
  virtual ~Rasterizer() = default;

  // Difference image of two renders of the same region.
  virtual std::filesystem::path Diff(const std::filesystem::path& before,
                                     const std::filesystem::path& after,
                                     const std::filesystem::path& target) = 0;
};

} // namespace assetdiff::assets
