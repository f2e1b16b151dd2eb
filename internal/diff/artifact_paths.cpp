#include "internal/diff/artifact_paths.hpp"

#include "config/config.pb.h"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace assetdiff::diff {

namespace {
constexpr std::size_t kFileIndexHashChars = 12;
}

std::string FileIndex(const std::string& path) {
  std::string index = path;
  const auto  slash = index.find_last_of('/');
  const auto  dot   = index.find_last_of('.');
  if (dot != std::string::npos && (slash == std::string::npos || dot > slash)) {
    index.erase(dot);
  }
  for (auto& c : index) {
    if (c == '/') c = '_';
  }
  // the readable part alone can collide ("a/b.dmm" vs "a_b.dmm")
  return index + "-" + util::Sha256Hex(path).substr(0, kFileIndexHashChars);
}

std::string SpriteArtifactName(const std::string& sha,
                               const std::string& path,
                               const std::string& content_hash,
                               uint32_t           duplicate,
                               const std::string& state_name) {
  util::Sha256 hash;
  hash.Field(sha).Field(path).Field(content_hash).Field(static_cast<uint64_t>(duplicate)).Field(state_name);
  return hash.HexDigest();
}

ArtifactLayout::ArtifactLayout(const assetdiff::runtime::config::OutputConfig& config, std::string owner, uint64_t pull_request)
    : root_(std::filesystem::absolute(config.root()).lexically_normal()), public_url_(config.public_url()) {
  if (owner.empty()) {
    throw util::InvalidArgument("artifact owner must not be empty");
  }
  while (!public_url_.empty() && public_url_.back() == '/') {
    public_url_.pop_back();
  }
  job_dir_ = root_ / owner / std::to_string(pull_request);
}

const char* ArtifactLayout::KindDirectory(model::DiffKind kind) {
  switch (kind) {
    case model::DiffKind::kAdded:
      return "a";
    case model::DiffKind::kRemoved:
      return "r";
    case model::DiffKind::kModified:
      return "m";
  }
  return "m";
}

std::filesystem::path ArtifactLayout::Target(model::DiffKind kind, const std::string& file, const std::string& stem) const {
  const auto dir = job_dir_ / KindDirectory(kind) / FileIndex(file);
  std::filesystem::create_directories(dir);
  return dir / stem;
}

std::string ArtifactLayout::Link(const std::filesystem::path& written) const {
  const auto relative = std::filesystem::absolute(written).lexically_normal().lexically_relative(root_);
  if (relative.empty() || *relative.begin() == "..") {
    throw util::RenderError("renderer wrote outside the output root: " + written.string());
  }
  return public_url_ + "/" + relative.generic_string();
}

} // namespace assetdiff::diff
