#include "internal/diff/sprite_diff.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <set>

#include "internal/diff/parallel.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace assetdiff::diff {

namespace {

std::set<assets::SpriteIdentity> Identities(const assets::SpriteSheet& sheet) {
  std::set<assets::SpriteIdentity> out;
  for (const auto& state : sheet.States()) out.insert(state.identity);
  return out;
}

struct Candidate {
  SpriteLine line;
  bool       include = true;
};

} // namespace

const char* ToString(SpriteChange change) {
  switch (change) {
    case SpriteChange::kCreated:
      return "Created";
    case SpriteChange::kDeleted:
      return "Deleted";
    case SpriteChange::kModified:
      return "Modified";
  }
  return "Modified";
}

SpriteDiffEngine::SpriteDiffEngine(assets::SpriteCodec& codec, const ArtifactLayout& layout, std::size_t workers)
    : codec_(codec), layout_(layout), workers_(workers == 0 ? 1 : workers) {
}

void SpriteDiffEngine::Load(SpriteFile& file, Side side, const std::filesystem::path& root, const std::string& sha) const {
  const auto& relative = side == Side::kBase ? file.sides.base_path : file.sides.head_path;
  if (!relative || !file.error.empty()) return;

  const char* label = side == Side::kBase ? "base" : "head";
  try {
    SpriteSide loaded;
    loaded.file = root / *relative;
    loaded.sha  = sha;
    try {
      loaded.content_hash = util::Sha256File(loaded.file);
    } catch (const std::runtime_error& e) {
      throw util::DecodeError(e.what());
    }
    loaded.sheet = codec_.LoadSheet(loaded.file);

    (side == Side::kBase ? file.base : file.head) = std::move(loaded);
  } catch (const util::DecodeError& e) {
    file.error = std::string("failed to decode ") + label + " revision: " + e.what();
  }
}

std::string SpriteDiffEngine::Render(const SpriteFile&             file,
                                     const SpriteSide&             side,
                                     const assets::SpriteIdentity& identity,
                                     model::DiffKind               kind,
                                     const char*                   suffix) const {
  const std::string name =
      SpriteArtifactName(side.sha, file.path, side.content_hash, identity.duplicate, identity.name) + "-" + suffix;

  const auto start   = std::chrono::steady_clock::now();
  const auto written = codec_.Render(side.file, identity, layout_.Target(kind, file.path, name));
  const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);
  observability::Metrics::Instance().ObserveRenderDurationMs("sprite", elapsed.count());

  return layout_.Link(written);
}

SpriteFileDiff SpriteDiffEngine::Diff(const SpriteFile& file) const {
  SpriteFileDiff result;
  result.path = file.path;

  const auto kind = model::DiffKindFor(file.sides);
  if (!kind) {
    throw util::InvalidArgument("sprite file " + file.path + " takes part on neither revision");
  }
  result.kind = *kind;

  if (!file.error.empty()) {
    result.error = file.error;
    return result;
  }

  const bool need_base = *kind != model::DiffKind::kAdded;
  const bool need_head = *kind != model::DiffKind::kRemoved;
  if ((need_base && !file.base) || (need_head && !file.head)) {
    throw util::InvariantViolation("assets unaccounted for: " + file.path + " was not loaded on every revision");
  }

  std::vector<Candidate> candidates;

  switch (*kind) {
    case model::DiffKind::kAdded:
      for (const auto& state : file.head->sheet.States()) {
        candidates.push_back({{state.identity, SpriteChange::kCreated, {}, {}, {}}, true});
      }
      break;
    case model::DiffKind::kRemoved:
      for (const auto& state : file.base->sheet.States()) {
        candidates.push_back({{state.identity, SpriteChange::kDeleted, {}, {}, {}}, true});
      }
      break;
    case model::DiffKind::kModified: {
      const auto base_ids = Identities(file.base->sheet);
      const auto head_ids = Identities(file.head->sheet);

      std::vector<assets::SpriteIdentity> one_sided;
      std::set_symmetric_difference(
          base_ids.begin(), base_ids.end(), head_ids.begin(), head_ids.end(), std::back_inserter(one_sided));
      for (const auto& id : one_sided) {
        const auto change = base_ids.count(id) ? SpriteChange::kDeleted : SpriteChange::kCreated;
        candidates.push_back({{id, change, {}, {}, {}}, true});
      }

      std::vector<assets::SpriteIdentity> shared;
      std::set_intersection(base_ids.begin(), base_ids.end(), head_ids.begin(), head_ids.end(), std::back_inserter(shared));
      for (const auto& id : shared) {
        candidates.push_back({{id, SpriteChange::kModified, {}, {}, {}}, false});
      }
      break;
    }
  }

  ParallelFor(candidates.size(), workers_, [&](std::size_t i) {
    auto& candidate = candidates[i];
    auto& line      = candidate.line;
    try {
      switch (line.change) {
        case SpriteChange::kCreated:
          line.after_link = Render(file, *file.head, line.identity, *kind, "added");
          break;
        case SpriteChange::kDeleted:
          line.before_link = Render(file, *file.base, line.identity, *kind, "removed");
          break;
        case SpriteChange::kModified: {
          const auto* before = file.base->sheet.Find(line.identity);
          const auto* after  = file.head->sheet.Find(line.identity);

          bool changed = !assets::SameMetadata(*before, *after);
          if (!changed) {
            changed = codec_.Frames(file.base->file, line.identity) != codec_.Frames(file.head->file, line.identity);
          }
          if (!changed) return;

          candidate.include = true;
          line.before_link  = Render(file, *file.base, line.identity, *kind, "before");
          line.after_link   = Render(file, *file.head, line.identity, *kind, "after");
          break;
        }
      }
    } catch (const util::RenderError& e) {
      candidate.include = true;
      line.error        = e.what();
    } catch (const util::DecodeError& e) {
      candidate.include = true;
      line.error        = e.what();
    }
  });

  for (auto& candidate : candidates) {
    if (candidate.include) result.lines.push_back(std::move(candidate.line));
  }
  return result;
}

} // namespace assetdiff::diff
