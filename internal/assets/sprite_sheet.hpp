#pragma once

#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

#include "assetdiff/tool/v1/asset_tool.pb.h"

namespace assetdiff::assets {

// Placeholder shown for the unnamed state.
inline constexpr const char* kDefaultStateName = "{{DEFAULT}}";

/*
  One sprite state, as addressed by the asset tool.

  States may repeat inside a sheet; `duplicate` numbers the repeats in file
  order starting at 0.
*/
struct SpriteIdentity {
  std::string name;
  uint32_t    duplicate = 0;

  std::string DisplayName() const;

  friend bool operator==(const SpriteIdentity& a, const SpriteIdentity& b) {
    return a.name == b.name && a.duplicate == b.duplicate;
  }
  friend bool operator<(const SpriteIdentity& a, const SpriteIdentity& b) {
    return std::tie(a.name, a.duplicate) < std::tie(b.name, b.duplicate);
  }
};

struct SpriteState {
  SpriteIdentity                       identity;
  assetdiff::tool::v1::SpriteStateInfo metadata;
};

class SpriteSheet {
 public:
  SpriteSheet() = default;

  // Duplicate indexes are recomputed from state order; the tool's values are only a hint.
  static SpriteSheet FromInfo(const assetdiff::tool::v1::SpriteSheetInfo& info);

  const std::vector<SpriteState>& States() const {
    return states_;
  }

  const SpriteState* Find(const SpriteIdentity& identity) const;

  uint32_t Width() const {
    return width_;
  }
  uint32_t Height() const {
    return height_;
  }

 private:
  uint32_t                 width_  = 0;
  uint32_t                 height_ = 0;
  std::vector<SpriteState> states_;
};

// Structural comparison; cheap, and never says "equal" for differing metadata.
bool SameMetadata(const SpriteState& a, const SpriteState& b);

} // namespace assetdiff::assets
