#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "assetdiff/tool/v1/asset_tool.pb.h"

namespace assetdiff::assets {

/*
  Tile rectangle, 1-based and inclusive on both corners.
*/
struct Rect {
  uint32_t x1 = 0;
  uint32_t y1 = 0;
  uint32_t x2 = 0;
  uint32_t y2 = 0;

  uint32_t Width() const {
    return x2 - x1 + 1;
  }
  uint32_t Height() const {
    return y2 - y1 + 1;
  }

  // "(x1, y1) - (x2, y2)"
  std::string ToString() const;

  friend bool operator==(const Rect& a, const Rect& b) {
    return a.x1 == b.x1 && a.y1 == b.y1 && a.x2 == b.x2 && a.y2 == b.y2;
  }
};

/*
  Decoded tile map: `depth` stacked z-levels of width x height tiles.

  Each tile holds the asset tool's canonical description of what is placed
  there; two tiles are equal exactly when their strings are.
*/
class MapGrid {
 public:
  MapGrid() = default;

  // Throws DecodeError when the tile count does not match the dimensions.
  static MapGrid FromInfo(const assetdiff::tool::v1::MapInfo& info);

  uint32_t Width() const {
    return width_;
  }
  uint32_t Height() const {
    return height_;
  }
  uint32_t Depth() const {
    return depth_;
  }

  // z is 1-based, as the maps themselves number levels.
  bool HasLevel(uint32_t z) const {
    return z >= 1 && z <= depth_;
  }

  // 1-based coordinates; callers stay inside the extent.
  const std::string& At(uint32_t x, uint32_t y, uint32_t z) const;

  bool Contains(uint32_t x, uint32_t y) const {
    return x >= 1 && y >= 1 && x <= width_ && y <= height_;
  }

  Rect Extent() const {
    return Rect{1, 1, width_, height_};
  }

 private:
  uint32_t                 width_  = 0;
  uint32_t                 height_ = 0;
  uint32_t                 depth_  = 0;
  std::vector<std::string> tiles_;
};

} // namespace assetdiff::assets
