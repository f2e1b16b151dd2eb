#include "internal/model/file_change.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "config/config.pb.h"
#include "internal/assets/map_grid.hpp"
#include "internal/assets/sprite_sheet.hpp"
#include "internal/util/errors.hpp"

namespace {

using assetdiff::model::ChangeKind;
using assetdiff::model::DiffKind;
using assetdiff::model::FileChange;

void TestSidesForEveryChangeKind() {
  using assetdiff::model::DiffKindFor;
  using assetdiff::model::SidesFor;

  auto added = SidesFor({"icons/new.dmi", "", ChangeKind::kAdded});
  assert(!added.base_path && *added.head_path == "icons/new.dmi");
  assert(DiffKindFor(added) == DiffKind::kAdded);

  auto removed = SidesFor({"icons/old.dmi", "", ChangeKind::kRemoved});
  assert(*removed.base_path == "icons/old.dmi" && !removed.head_path);
  assert(DiffKindFor(removed) == DiffKind::kRemoved);

  auto modified = SidesFor({"icons/mob.dmi", "", ChangeKind::kModified});
  assert(*modified.base_path == "icons/mob.dmi" && *modified.head_path == "icons/mob.dmi");
  assert(DiffKindFor(modified) == DiffKind::kModified);

  auto renamed = SidesFor({"icons/mob2.dmi", "icons/mob.dmi", ChangeKind::kRenamed});
  assert(*renamed.base_path == "icons/mob.dmi" && *renamed.head_path == "icons/mob2.dmi");
  assert(DiffKindFor(renamed) == DiffKind::kModified);

  auto renamed_unknown = SidesFor({"icons/mob2.dmi", "", ChangeKind::kRenamed});
  assert(!renamed_unknown.base_path && *renamed_unknown.head_path == "icons/mob2.dmi");
  assert(DiffKindFor(renamed_unknown) == DiffKind::kAdded);

  auto copied = SidesFor({"icons/copy.dmi", "icons/mob.dmi", ChangeKind::kCopied});
  assert(!copied.base_path && *copied.head_path == "icons/copy.dmi");

  auto unchanged = SidesFor({"icons/same.dmi", "", ChangeKind::kUnchanged});
  assert(!unchanged.base_path && !unchanged.head_path);
  assert(!DiffKindFor(unchanged));
}

void TestFromProtoRejectsUnspecifiedStatus() {
  google::protobuf::RepeatedPtrField<assetdiff::jobs::v1::FileChange> files;
  auto*                                                               file = files.Add();
  file->set_filename("icons/mob.dmi");
  file->set_status(assetdiff::jobs::v1::CHANGE_KIND_RENAMED);
  file->set_previous_filename("icons/old.dmi");

  const auto changes = assetdiff::model::FromProto(files);
  assert(changes.size() == 1);
  assert(changes[0].kind == ChangeKind::kRenamed);
  assert(changes[0].previous_path == "icons/old.dmi");

  files.Add()->set_filename("icons/broken.dmi");
  bool threw = false;
  try {
    (void)assetdiff::model::FromProto(files);
  } catch (const assetdiff::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestFromProtoRejectsMissingFilename() {
  google::protobuf::RepeatedPtrField<assetdiff::jobs::v1::FileChange> files;
  files.Add()->set_status(assetdiff::jobs::v1::CHANGE_KIND_ADDED);

  bool threw = false;
  try {
    (void)assetdiff::model::FromProto(files);
  } catch (const assetdiff::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestFromProtoRejectsPathsOutsideCheckout() {
  auto rejects = [](const std::string& filename, const std::string& previous) {
    google::protobuf::RepeatedPtrField<assetdiff::jobs::v1::FileChange> files;
    auto*                                                               file = files.Add();
    file->set_filename(filename);
    file->set_previous_filename(previous);
    file->set_status(previous.empty() ? assetdiff::jobs::v1::CHANGE_KIND_MODIFIED : assetdiff::jobs::v1::CHANGE_KIND_RENAMED);
    try {
      (void)assetdiff::model::FromProto(files);
    } catch (const assetdiff::util::InvalidArgument&) {
      return true;
    }
    return false;
  };

  assert(rejects("/etc/passwd.dmi", ""));
  assert(rejects("../../outside.dmm", ""));
  assert(rejects("maps/../../outside.dmm", ""));
  assert(rejects("icons/mob.dmi", "/etc/old.dmi"));
  assert(rejects("icons/mob.dmi", "icons/../../old.dmi"));

  assert(!rejects("icons/mob.dmi", ""));
  assert(!rejects("icons/..mob.dmi", "icons/mob..old.dmi"));
  assert(!rejects("./maps/station.dmm", ""));
}

void TestClassifyAssetIgnoresCase() {
  assetdiff::runtime::config::AssetToolConfig config;
  config.add_sprite_extensions(".dmi");
  config.add_map_extensions(".dmm");

  using assetdiff::model::AssetKind;
  using assetdiff::model::ClassifyAsset;
  assert(ClassifyAsset("icons/mob.dmi", config) == AssetKind::kSprite);
  assert(ClassifyAsset("icons/MOB.DMI", config) == AssetKind::kSprite);
  assert(ClassifyAsset("maps/station.dmm", config) == AssetKind::kMap);
  assert(ClassifyAsset("code/game.dm", config) == AssetKind::kOther);
  assert(ClassifyAsset("dmi", config) == AssetKind::kOther);
}

void TestSpriteSheetNumbersDuplicates() {
  assetdiff::tool::v1::SpriteSheetInfo info;
  info.set_width(32);
  info.set_height(32);
  for (const char* name : {"", "idle", "idle", "walk", "idle"}) {
    auto* state = info.add_states();
    state->set_name(name);
    state->set_duplicate(99); // tool hint, recomputed
  }

  const auto sheet = assetdiff::assets::SpriteSheet::FromInfo(info);
  assert(sheet.States().size() == 5);
  assert(sheet.States()[0].identity.DisplayName() == "{{DEFAULT}}");
  assert(sheet.States()[1].identity.duplicate == 0);
  assert(sheet.States()[2].identity.duplicate == 1);
  assert(sheet.States()[4].identity.duplicate == 2);
  assert(sheet.States()[4].identity.DisplayName() == "idle (2)");
  assert(sheet.States()[4].metadata.duplicate() == 2);
  assert(sheet.Find({"walk", 0}) != nullptr);
  assert(sheet.Find({"walk", 1}) == nullptr);
}

void TestMapGridAddressing() {
  assetdiff::tool::v1::MapInfo info;
  info.set_width(2);
  info.set_height(2);
  info.set_depth(2);
  for (const char* tile : {"a", "b", "c", "d", "e", "f", "g", "h"}) info.add_tiles(tile);

  const auto grid = assetdiff::assets::MapGrid::FromInfo(info);
  assert(grid.At(1, 1, 1) == "a");
  assert(grid.At(2, 1, 1) == "b");
  assert(grid.At(1, 2, 1) == "c");
  assert(grid.At(2, 2, 2) == "h");
  assert(grid.HasLevel(2) && !grid.HasLevel(0) && !grid.HasLevel(3));
  assert((grid.Extent() == assetdiff::assets::Rect{1, 1, 2, 2}));
  assert(grid.Extent().ToString() == "(1, 1) - (2, 2)");

  info.add_tiles("extra");
  bool threw = false;
  try {
    (void)assetdiff::assets::MapGrid::FromInfo(info);
  } catch (const assetdiff::util::DecodeError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSidesForEveryChangeKind();
  TestFromProtoRejectsUnspecifiedStatus();
  TestFromProtoRejectsMissingFilename();
  TestFromProtoRejectsPathsOutsideCheckout();
  TestClassifyAssetIgnoresCase();
  TestSpriteSheetNumbersDuplicates();
  TestMapGridAddressing();

  std::cout << "assetdiff_unit_file_change: pass\n";
  return 0;
}
