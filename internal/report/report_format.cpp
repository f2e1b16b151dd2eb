#include "internal/report/report_format.hpp"

namespace assetdiff::report {

namespace {

constexpr const char* kSpriteHeader =
    "| Name | Old | New | Change |\n"
    "| :--- | :---: | :---: | :--- |\n";

constexpr const char* kLevelAdded   = "Z-LEVEL ADDED";
constexpr const char* kLevelDeleted = "Z-LEVEL DELETED";
constexpr const char* kUnavailable  = "Unavailable";
constexpr const char* kRowHint      = "If the image doesn't load, use the raw link above";

// Table cells cannot hold pipes or line breaks.
std::string Cell(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c == '|') {
      out += "\\|";
    } else if (c == '\n' || c == '\r') {
      out += ' ';
    } else {
      out += c;
    }
  }
  return out;
}

std::string Image(const std::string& alt, const std::string& link) {
  return link.empty() ? std::string() : "![" + alt + "](" + link + ")";
}

std::string Link(const char* text, const std::string& link) {
  return link.empty() ? std::string(kUnavailable) : "[" + std::string(text) + "](" + link + ")";
}

std::string ErrorBlock(const std::string& error) {
  return "```\n" + error + "\n```";
}

std::string LevelName(const std::string& file, uint32_t z) {
  return file + " (Z-level: " + std::to_string(z) + ")";
}

std::string ModifiedLevel(const std::string& name,
                          const std::string& bounds,
                          const std::string& before_link,
                          const std::string& after_link,
                          const std::string& diff_link,
                          const std::string& old_row,
                          const std::string& new_row,
                          const std::string& diff_row) {
  return "**" + name + "** " + bounds + "\n\n"
         "| Old | New | Difference |\n"
         "| :---: | :---: | :---: |\n"
         "| " + before_link + " | " + after_link + " | " + diff_link + " |\n"
         "| " + old_row + " | " + new_row + " | " + diff_row + " |\n";
}

std::string MapLevelEntry(const std::string& file, model::DiffKind kind, const diff::MapLevelDiff& level) {
  const std::string name = LevelName(file, level.z);

  if (!level.error.empty()) {
    return "**" + name + "**\n\nFailed to render:\n\n" + ErrorBlock(level.error) + "\n";
  }

  switch (kind) {
    case model::DiffKind::kAdded:
      return "**" + name + "**\n\n" + Image(kRowHint, level.after_link) + "\n";
    case model::DiffKind::kRemoved:
      return "**" + name + "**\n\n" + Image(kRowHint, level.before_link) + "\n";
    case model::DiffKind::kModified:
      break;
  }

  switch (level.type) {
    case diff::BoundType::kOnlyHead: {
      const std::string dims =
          "(" + std::to_string(level.width) + ", " + std::to_string(level.height) + ", " + std::to_string(level.z) + ")";
      return ModifiedLevel(
          name, dims, kUnavailable, Link("New", level.after_link), kUnavailable, kLevelAdded, Image(kRowHint, level.after_link), kLevelAdded);
    }
    case diff::BoundType::kOnlyBase: {
      const std::string dims =
          "(" + std::to_string(level.width) + ", " + std::to_string(level.height) + ", " + std::to_string(level.z) + ")";
      return ModifiedLevel(name, dims, kUnavailable, kUnavailable, kUnavailable, kLevelDeleted, kLevelDeleted, kLevelDeleted);
    }
    case diff::BoundType::kBoth:
      return ModifiedLevel(name,
                           level.bounds.ToString(),
                           Link("Old", level.before_link),
                           Link("New", level.after_link),
                           Link("Diff", level.diff_link),
                           Image(kRowHint, level.before_link),
                           Image(kRowHint, level.after_link),
                           Image(kRowHint, level.diff_link));
    case diff::BoundType::kNone:
      break;
  }
  return {};
}

} // namespace

ReportSection SpriteSection(const diff::SpriteFileDiff& diff) {
  ReportSection section;
  section.title = diff.path;

  if (!diff.error.empty()) {
    section.label = "ERROR";
    section.lines.push_back(ErrorBlock(diff.error));
    return section;
  }

  section.label  = model::ToString(diff.kind);
  section.header = kSpriteHeader;
  for (const auto& line : diff.lines) {
    const std::string name = Cell(line.identity.DisplayName());
    if (!line.error.empty()) {
      section.lines.push_back("| " + name + " | | | Error: " + Cell(line.error) + " |");
      continue;
    }
    section.lines.push_back("| " + name + " | " + Image(name, line.before_link) + " | " + Image(name, line.after_link) + " | " +
                            diff::ToString(line.change) + " |");
  }
  return section;
}

ReportSection MapSection(const diff::MapFileDiff& diff) {
  ReportSection section;
  section.title = diff.path;

  if (!diff.error.empty()) {
    section.label = "ERROR";
    section.lines.push_back(ErrorBlock(diff.error));
    return section;
  }

  section.label = model::ToString(diff.kind);
  for (const auto& level : diff.levels) {
    std::string entry = MapLevelEntry(diff.path, diff.kind, level);
    if (!entry.empty()) section.lines.push_back(std::move(entry));
  }
  return section;
}

assetdiff::report::v1::ReportOutput FailureOutput(const std::string& title, const std::string& message) {
  assetdiff::report::v1::ReportOutput output;
  output.set_title(title);
  output.set_summary("The asset diff job failed.");
  output.set_body(ErrorBlock(message));
  return output;
}

} // namespace assetdiff::report
