#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "internal/model/file_change.hpp"

namespace assetdiff::runtime::config {
class OutputConfig;
}

namespace assetdiff::diff {

// "maps/Station Alpha.dmm" -> "maps_Station Alpha-<12 hex of sha256(path)>"
std::string FileIndex(const std::string& path);

// Stable name for one rendered sprite state (hex SHA-256).
std::string SpriteArtifactName(const std::string& sha,
                               const std::string& path,
                               const std::string& content_hash,
                               uint32_t           duplicate,
                               const std::string& state_name);

/*
  Where a job's rendered artifacts go, and how they are linked.

      <root>/<owner>/<pull_request>/{a|r|m}/<file_index>/<stem>.<ext>

  The renderer picks the extension, so targets are handed out without one.
*/
class ArtifactLayout {
 public:
  ArtifactLayout(const assetdiff::runtime::config::OutputConfig& config, std::string owner, uint64_t pull_request);

  // Creates the file's directory on first use.
  std::filesystem::path Target(model::DiffKind kind, const std::string& file, const std::string& stem) const;

  // Public link for a file the renderer wrote under this layout.
  std::string Link(const std::filesystem::path& written) const;

  const std::filesystem::path& JobDirectory() const {
    return job_dir_;
  }

  static const char* KindDirectory(model::DiffKind kind);

 private:
  std::filesystem::path root_;
  std::filesystem::path job_dir_;
  std::string           public_url_;
};

} // namespace assetdiff::diff
