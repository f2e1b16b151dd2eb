#include "internal/assets/sprite_sheet.hpp"

#include <map>

#include <google/protobuf/util/message_differencer.h>

namespace assetdiff::assets {

std::string SpriteIdentity::DisplayName() const {
  std::string shown = name.empty() ? kDefaultStateName : name;
  if (duplicate > 0) {
    shown += " (" + std::to_string(duplicate) + ")";
  }
  return shown;
}

SpriteSheet SpriteSheet::FromInfo(const assetdiff::tool::v1::SpriteSheetInfo& info) {
  SpriteSheet sheet;
  sheet.width_  = info.width();
  sheet.height_ = info.height();

  std::map<std::string, uint32_t> seen;
  sheet.states_.reserve(info.states_size());
  for (const auto& state : info.states()) {
    SpriteState entry;
    entry.identity.name      = state.name();
    entry.identity.duplicate = seen[state.name()]++;
    entry.metadata           = state;
    entry.metadata.set_duplicate(entry.identity.duplicate);
    sheet.states_.push_back(std::move(entry));
  }
  return sheet;
}

const SpriteState* SpriteSheet::Find(const SpriteIdentity& identity) const {
  for (const auto& state : states_) {
    if (state.identity == identity) return &state;
  }
  return nullptr;
}

bool SameMetadata(const SpriteState& a, const SpriteState& b) {
  return google::protobuf::util::MessageDifferencer::Equals(a.metadata, b.metadata);
}

} // namespace assetdiff::assets
