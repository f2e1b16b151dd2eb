#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "internal/assets/asset_codec.hpp"
#include "internal/diff/artifact_paths.hpp"
#include "internal/diff/sprite_diff.hpp"
#include "internal/model/file_change.hpp"

namespace assetdiff::diff {

enum class BoundType {
  kNone,     // level unchanged
  kOnlyHead, // level added
  kOnlyBase, // level removed
  kBoth,     // level changed inside `bounds`
};

const char* ToString(BoundType type);

struct LevelBound {
  uint32_t     z    = 0;
  BoundType    type = BoundType::kNone;
  assets::Rect bounds;
};

// Minimal rectangle over all differing tiles of level z; nullopt if none differ.
// Tiles outside either revision's extent count as differing.
std::optional<assets::Rect> DiffBounds(const assets::MapGrid& base, const assets::MapGrid& head, uint32_t z);

// One entry per z-level present in either revision, in z order.
std::vector<LevelBound> CompareLevels(const assets::MapGrid& base, const assets::MapGrid& head);

struct MapSide {
  std::filesystem::path file;
  assets::MapGrid       grid;
};

struct MapFile {
  std::string            path;
  model::RevisionSides   sides;
  std::optional<MapSide> base;
  std::optional<MapSide> head;
  std::string            error;
};

struct MapLevelDiff {
  uint32_t     z    = 0;
  BoundType    type = BoundType::kNone;
  assets::Rect bounds;
  // Dimensions of the level as shown for added levels.
  uint32_t    width  = 0;
  uint32_t    height = 0;
  std::string before_link;
  std::string after_link;
  std::string diff_link;
  std::string error;
};

struct MapFileDiff {
  std::string               path;
  model::DiffKind           kind = model::DiffKind::kModified;
  std::vector<MapLevelDiff> levels;
  std::string               error;
};

/*
  Classifies every z-level of every map and renders the changed regions.

  Added and removed maps render each level whole. Modified maps only render
  levels that changed: before/after/diff for Both, the new level for OnlyHead,
  nothing for OnlyBase or None. Levels render in parallel; their artifact
  paths never overlap.
*/
class MapDiffEngine {
 public:
  MapDiffEngine(assets::MapCodec& codec, assets::Rasterizer& rasterizer, const ArtifactLayout& layout, std::size_t workers);

  void Load(MapFile& file, Side side, const std::filesystem::path& root) const;

  // Throws InvariantViolation when a modified head map has no base counterpart.
  std::vector<MapFileDiff> Diff(const std::vector<MapFile>& files) const;

 private:
  void RenderLevel(const MapFile& file, model::DiffKind kind, MapLevelDiff& level) const;
  std::string Render(const MapSide& side, const MapFile& file, model::DiffKind kind, uint32_t z, const assets::Rect& region, const char* suffix) const;

  assets::MapCodec&     codec_;
  assets::Rasterizer&   rasterizer_;
  const ArtifactLayout& layout_;
  std::size_t           workers_;
};

} // namespace assetdiff::diff
