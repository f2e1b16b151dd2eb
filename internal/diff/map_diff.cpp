#include "internal/diff/map_diff.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include "internal/diff/parallel.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace assetdiff::diff {

const char* ToString(BoundType type) {
  switch (type) {
    case BoundType::kNone:
      return "none";
    case BoundType::kOnlyHead:
      return "only_head";
    case BoundType::kOnlyBase:
      return "only_base";
    case BoundType::kBoth:
      return "both";
  }
  return "none";
}

std::optional<assets::Rect> DiffBounds(const assets::MapGrid& base, const assets::MapGrid& head, uint32_t z) {
  const uint32_t width  = std::max(base.Width(), head.Width());
  const uint32_t height = std::max(base.Height(), head.Height());

  std::optional<assets::Rect> bounds;
  for (uint32_t y = 1; y <= height; ++y) {
    for (uint32_t x = 1; x <= width; ++x) {
      const bool in_base = base.Contains(x, y);
      const bool in_head = head.Contains(x, y);
      if (in_base && in_head && base.At(x, y, z) == head.At(x, y, z)) continue;

      if (!bounds) {
        bounds = assets::Rect{x, y, x, y};
        continue;
      }
      bounds->x1 = std::min(bounds->x1, x);
      bounds->y1 = std::min(bounds->y1, y);
      bounds->x2 = std::max(bounds->x2, x);
      bounds->y2 = std::max(bounds->y2, y);
    }
  }
  return bounds;
}

std::vector<LevelBound> CompareLevels(const assets::MapGrid& base, const assets::MapGrid& head) {
  std::vector<LevelBound> out;
  const uint32_t          depth = std::max(base.Depth(), head.Depth());
  out.reserve(depth);

  for (uint32_t z = 1; z <= depth; ++z) {
    LevelBound level;
    level.z = z;
    if (!base.HasLevel(z)) {
      level.type   = BoundType::kOnlyHead;
      level.bounds = head.Extent();
    } else if (!head.HasLevel(z)) {
      level.type   = BoundType::kOnlyBase;
      level.bounds = base.Extent();
    } else if (auto bounds = DiffBounds(base, head, z)) {
      level.type   = BoundType::kBoth;
      level.bounds = *bounds;
    }
    out.push_back(level);
  }
  return out;
}

MapDiffEngine::MapDiffEngine(assets::MapCodec& codec, assets::Rasterizer& rasterizer, const ArtifactLayout& layout, std::size_t workers)
    : codec_(codec), rasterizer_(rasterizer), layout_(layout), workers_(workers == 0 ? 1 : workers) {
}

void MapDiffEngine::Load(MapFile& file, Side side, const std::filesystem::path& root) const {
  const auto& relative = side == Side::kBase ? file.sides.base_path : file.sides.head_path;
  if (!relative || !file.error.empty()) return;

  try {
    MapSide loaded;
    loaded.file = root / *relative;
    loaded.grid = codec_.LoadMap(loaded.file);
    (side == Side::kBase ? file.base : file.head) = std::move(loaded);
  } catch (const util::DecodeError& e) {
    file.error = std::string("failed to decode ") + (side == Side::kBase ? "base" : "head") + " revision: " + e.what();
  }
}

std::string MapDiffEngine::Render(const MapSide&      side,
                                  const MapFile&      file,
                                  model::DiffKind     kind,
                                  uint32_t            z,
                                  const assets::Rect& region,
                                  const char*         suffix) const {
  const auto start   = std::chrono::steady_clock::now();
  const auto written = codec_.Render(side.file, z, region, layout_.Target(kind, file.path, std::to_string(z) + "-" + suffix));
  const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);
  observability::Metrics::Instance().ObserveRenderDurationMs("map", elapsed.count());
  return written.string();
}

void MapDiffEngine::RenderLevel(const MapFile& file, model::DiffKind kind, MapLevelDiff& level) const {
  switch (kind) {
    case model::DiffKind::kAdded:
      level.after_link = layout_.Link(Render(*file.head, file, kind, level.z, level.bounds, "added"));
      return;
    case model::DiffKind::kRemoved:
      level.before_link = layout_.Link(Render(*file.base, file, kind, level.z, level.bounds, "removed"));
      return;
    case model::DiffKind::kModified:
      break;
  }

  switch (level.type) {
    case BoundType::kNone:
    case BoundType::kOnlyBase:
      return;
    case BoundType::kOnlyHead:
      level.after_link = layout_.Link(Render(*file.head, file, kind, level.z, level.bounds, "after"));
      return;
    case BoundType::kBoth: {
      const std::filesystem::path before = Render(*file.base, file, kind, level.z, level.bounds, "before");
      const std::filesystem::path after  = Render(*file.head, file, kind, level.z, level.bounds, "after");
      const auto diff = rasterizer_.Diff(before, after, layout_.Target(kind, file.path, std::to_string(level.z) + "-diff"));

      level.before_link = layout_.Link(before);
      level.after_link  = layout_.Link(after);
      level.diff_link   = layout_.Link(diff);
      return;
    }
  }
}

std::vector<MapFileDiff> MapDiffEngine::Diff(const std::vector<MapFile>& files) const {
  std::string unaccounted;
  for (const auto& file : files) {
    if (!file.error.empty() || model::DiffKindFor(file.sides) != model::DiffKind::kModified) continue;
    if (file.head.has_value() != file.base.has_value()) {
      unaccounted += (unaccounted.empty() ? "" : ", ") + file.path;
    }
  }
  if (!unaccounted.empty()) {
    throw util::InvariantViolation("assets unaccounted for between base and head: " + unaccounted);
  }

  std::vector<MapFileDiff>                        results;
  std::vector<std::pair<std::size_t, std::size_t>> tasks;
  results.reserve(files.size());

  for (const auto& file : files) {
    MapFileDiff result;
    result.path = file.path;

    const auto kind = model::DiffKindFor(file.sides);
    if (!kind) {
      throw util::InvalidArgument("map file " + file.path + " takes part on neither revision");
    }
    result.kind = *kind;

    if (!file.error.empty()) {
      result.error = file.error;
      results.push_back(std::move(result));
      continue;
    }

    if (*kind != model::DiffKind::kModified) {
      const auto& side = *kind == model::DiffKind::kAdded ? file.head : file.base;
      if (!side) {
        throw util::InvariantViolation("assets unaccounted for: " + file.path + " was not loaded");
      }
      for (uint32_t z = 1; z <= side->grid.Depth(); ++z) {
        MapLevelDiff level;
        level.z      = z;
        level.type   = *kind == model::DiffKind::kAdded ? BoundType::kOnlyHead : BoundType::kOnlyBase;
        level.bounds = side->grid.Extent();
        level.width  = side->grid.Width();
        level.height = side->grid.Height();
        result.levels.push_back(level);
      }
    } else {
      for (const auto& bound : CompareLevels(file.base->grid, file.head->grid)) {
        if (bound.type == BoundType::kNone) continue;
        MapLevelDiff level;
        level.z      = bound.z;
        level.type   = bound.type;
        level.bounds = bound.bounds;
        const auto& shown = bound.type == BoundType::kOnlyBase ? file.base->grid : file.head->grid;
        level.width  = shown.Width();
        level.height = shown.Height();
        result.levels.push_back(level);
      }
    }

    for (std::size_t l = 0; l < result.levels.size(); ++l) {
      tasks.emplace_back(results.size(), l);
    }
    results.push_back(std::move(result));
  }

  ParallelFor(tasks.size(), workers_, [&](std::size_t i) {
    const auto [file_index, level_index] = tasks[i];
    auto& result = results[file_index];
    auto& level  = result.levels[level_index];
    try {
      RenderLevel(files[file_index], result.kind, level);
    } catch (const util::RenderError& e) {
      level.error = e.what();
    }
  });

  return results;
}

} // namespace assetdiff::diff
