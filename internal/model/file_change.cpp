#include "internal/model/file_change.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace assetdiff::model {

namespace {

// Request paths are joined onto a checkout root, so they must stay below it.
void CheckRepositoryPath(const std::string& path, const char* field) {
  const std::filesystem::path candidate(path);
  if (candidate.is_absolute() || candidate.has_root_directory()) {
    throw util::InvalidArgument(std::string(field) + " must be relative: " + path);
  }
  for (const auto& component : candidate) {
    if (component == "..") {
      throw util::InvalidArgument(std::string(field) + " must not contain '..': " + path);
    }
  }
}

} // namespace

RevisionSides SidesFor(const FileChange& change) {
  switch (change.kind) {
    case ChangeKind::kAdded:
      return {std::nullopt, change.path};
    case ChangeKind::kRemoved:
      return {change.path, std::nullopt};
    case ChangeKind::kModified:
      return {change.path, change.path};
    case ChangeKind::kRenamed:
      // diff against the old location when the platform told us where it was
      if (!change.previous_path.empty()) {
        return {change.previous_path, change.path};
      }
      return {std::nullopt, change.path};
    case ChangeKind::kCopied:
      return {std::nullopt, change.path};
    case ChangeKind::kUnchanged:
      return {std::nullopt, std::nullopt};
  }
  return {std::nullopt, std::nullopt};
}

std::optional<DiffKind> DiffKindFor(const RevisionSides& sides) {
  if (sides.base_path && sides.head_path) return DiffKind::kModified;
  if (sides.head_path) return DiffKind::kAdded;
  if (sides.base_path) return DiffKind::kRemoved;
  return std::nullopt;
}

const char* ToString(ChangeKind kind) {
  switch (kind) {
    case ChangeKind::kAdded:
      return "added";
    case ChangeKind::kRemoved:
      return "removed";
    case ChangeKind::kModified:
      return "modified";
    case ChangeKind::kRenamed:
      return "renamed";
    case ChangeKind::kCopied:
      return "copied";
    case ChangeKind::kUnchanged:
      return "unchanged";
  }
  return "unknown";
}

const char* ToString(DiffKind kind) {
  switch (kind) {
    case DiffKind::kAdded:
      return "ADDED";
    case DiffKind::kRemoved:
      return "DELETED";
    case DiffKind::kModified:
      return "MODIFIED";
  }
  return "UNKNOWN";
}

ChangeKind FromProto(assetdiff::jobs::v1::ChangeKind kind) {
  using namespace assetdiff::jobs::v1;
  switch (kind) {
    case CHANGE_KIND_ADDED:
      return ChangeKind::kAdded;
    case CHANGE_KIND_REMOVED:
      return ChangeKind::kRemoved;
    case CHANGE_KIND_MODIFIED:
      return ChangeKind::kModified;
    case CHANGE_KIND_RENAMED:
      return ChangeKind::kRenamed;
    case CHANGE_KIND_COPIED:
      return ChangeKind::kCopied;
    case CHANGE_KIND_UNCHANGED:
      return ChangeKind::kUnchanged;
    default:
      throw util::InvalidArgument("unsupported file change status " + std::to_string(static_cast<int>(kind)));
  }
}

std::vector<FileChange> FromProto(const google::protobuf::RepeatedPtrField<assetdiff::jobs::v1::FileChange>& files) {
  std::vector<FileChange> out;
  out.reserve(files.size());
  for (const auto& file : files) {
    if (file.filename().empty()) {
      throw util::InvalidArgument("file change without filename");
    }
    CheckRepositoryPath(file.filename(), "filename");
    if (!file.previous_filename().empty()) {
      CheckRepositoryPath(file.previous_filename(), "previous_filename");
    }
    out.push_back({file.filename(), file.previous_filename(), FromProto(file.status())});
  }
  return out;
}

AssetKind ClassifyAsset(const std::string& path, const assetdiff::runtime::config::AssetToolConfig& config) {
  auto ends_with = [&path](const std::string& extension) {
    if (extension.empty() || path.size() < extension.size()) return false;
    return std::equal(extension.rbegin(), extension.rend(), path.rbegin(),
                      [](char a, char b) { return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b)); });
  };

  for (const auto& extension : config.sprite_extensions()) {
    if (ends_with(extension)) return AssetKind::kSprite;
  }
  for (const auto& extension : config.map_extensions()) {
    if (ends_with(extension)) return AssetKind::kMap;
  }
  return AssetKind::kOther;
}

} // namespace assetdiff::model
