#pragma once

#include <optional>
#include <string>
#include <vector>

#include "assetdiff/jobs/v1/job.pb.h"

namespace assetdiff::runtime::config {
class AssetToolConfig;
}

namespace assetdiff::model {

enum class ChangeKind {
  kAdded,
  kRemoved,
  kModified,
  kRenamed,
  kCopied,
  kUnchanged,
};

struct FileChange {
  std::string path;
  // Only meaningful for kRenamed.
  std::string previous_path;
  ChangeKind  kind = ChangeKind::kModified;
};

/*
  Which revision each side of a diff reads a file from.

  An absent side means the file does not take part on that revision.
*/
struct RevisionSides {
  std::optional<std::string> base_path;
  std::optional<std::string> head_path;
};

enum class DiffKind {
  kAdded,
  kRemoved,
  kModified,
};

enum class AssetKind {
  kSprite,
  kMap,
  kOther,
};

RevisionSides SidesFor(const FileChange& change);

// Unchanged/Unspecified sides (both absent) yield nullopt.
std::optional<DiffKind> DiffKindFor(const RevisionSides& sides);

const char* ToString(ChangeKind kind);
const char* ToString(DiffKind kind);

ChangeKind              FromProto(assetdiff::jobs::v1::ChangeKind kind);
std::vector<FileChange> FromProto(const google::protobuf::RepeatedPtrField<assetdiff::jobs::v1::FileChange>& files);

AssetKind ClassifyAsset(const std::string& path, const assetdiff::runtime::config::AssetToolConfig& config);

} // namespace assetdiff::model
