#include "internal/assets/map_grid.hpp"

#include "internal/util/errors.hpp"

namespace assetdiff::assets {

std::string Rect::ToString() const {
  return "(" + std::to_string(x1) + ", " + std::to_string(y1) + ") - (" + std::to_string(x2) + ", " + std::to_string(y2) + ")";
}

MapGrid MapGrid::FromInfo(const assetdiff::tool::v1::MapInfo& info) {
  const uint64_t expected = static_cast<uint64_t>(info.width()) * info.height() * info.depth();
  if (expected != static_cast<uint64_t>(info.tiles_size())) {
    throw util::DecodeError("map has " + std::to_string(info.tiles_size()) + " tiles, expected " + std::to_string(expected));
  }

  MapGrid grid;
  grid.width_  = info.width();
  grid.height_ = info.height();
  grid.depth_  = info.depth();
  grid.tiles_.assign(info.tiles().begin(), info.tiles().end());
  return grid;
}

const std::string& MapGrid::At(uint32_t x, uint32_t y, uint32_t z) const {
  const size_t index = (static_cast<size_t>(z - 1) * height_ + (y - 1)) * width_ + (x - 1);
  return tiles_[index];
}

} // namespace assetdiff::assets
