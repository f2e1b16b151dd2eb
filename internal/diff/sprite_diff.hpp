#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "internal/assets/asset_codec.hpp"
#include "internal/diff/artifact_paths.hpp"
#include "internal/model/file_change.hpp"

namespace assetdiff::diff {

enum class Side {
  kBase,
  kHead,
};

enum class SpriteChange {
  kCreated,
  kDeleted,
  kModified,
};

const char* ToString(SpriteChange change);

struct SpriteSide {
  std::filesystem::path file; // on disk, inside a revision view
  std::string           sha;
  std::string           content_hash;
  assets::SpriteSheet   sheet;
};

/*
  One sprite-sheet file of a job, filled in view by view.
*/
struct SpriteFile {
  std::string               path; // repository relative
  model::RevisionSides      sides;
  std::optional<SpriteSide> base;
  std::optional<SpriteSide> head;
  std::string               error; // first decode failure, reported inline
};

struct SpriteLine {
  assets::SpriteIdentity identity;
  SpriteChange           change = SpriteChange::kModified;
  std::string            before_link;
  std::string            after_link;
  std::string            error;
};

struct SpriteFileDiff {
  std::string             path;
  model::DiffKind         kind = model::DiffKind::kModified;
  std::vector<SpriteLine> lines;
  std::string             error;
};

/*
  Decides which sprite states changed and renders only those.

  Modified files: states only on one side are Created/Deleted; shared states
  are compared by metadata first and by pixel frames only when the metadata
  matches. Output lists one-sided states, then changed shared states, each
  sorted by (name, duplicate).
*/
class SpriteDiffEngine {
 public:
  SpriteDiffEngine(assets::SpriteCodec& codec, const ArtifactLayout& layout, std::size_t workers);

  // Loads `side` of the file from a revision view rooted at `root`, if that side takes part.
  void Load(SpriteFile& file, Side side, const std::filesystem::path& root, const std::string& sha) const;

  SpriteFileDiff Diff(const SpriteFile& file) const;

 private:
  std::string Render(const SpriteFile& file, const SpriteSide& side, const assets::SpriteIdentity& identity, model::DiffKind kind, const char* suffix) const;

  assets::SpriteCodec&  codec_;
  const ArtifactLayout& layout_;
  std::size_t           workers_;
};

} // namespace assetdiff::diff
