#include "internal/report/chunk_assembler.hpp"

#include <cstring>
#include <utility>

#include "internal/util/errors.hpp"

namespace assetdiff::report {

namespace {

constexpr std::size_t kMaxTitle = 256;

// Longest prefix of `text` no longer than `size` that does not split a UTF-8 sequence.
std::string Utf8Prefix(const std::string& text, std::size_t size) {
  if (size >= text.size()) return text;
  while (size > 0 && (static_cast<unsigned char>(text[size]) & 0xC0) == 0x80) {
    --size;
  }
  return text.substr(0, size);
}

} // namespace

ChunkAssembler::ChunkAssembler(ChunkLimits limits, std::string title, std::string summary)
    : limits_(limits), title_(std::move(title)), summary_(std::move(summary)) {
  if (limits_.detail_ceiling == 0 || limits_.detail_ceiling >= limits_.report_ceiling) {
    throw util::InvalidArgument("detail_ceiling (" + std::to_string(limits_.detail_ceiling) + ") must be below report_ceiling (" +
                                std::to_string(limits_.report_ceiling) + ")");
  }
}

std::string ChunkAssembler::DetailBlock(const std::string& label, const std::string& title, const std::string& table) {
  return "<details><summary><h3>" + label + ": " + title + "</h3></summary>\n\n" + table + "\n</details>\n\n";
}

std::string ChunkAssembler::FitLine(const std::string& line, std::size_t header_size) const {
  // room for the line itself once the header and its newline are in the table
  const std::size_t room = limits_.detail_ceiling > header_size + 1 ? limits_.detail_ceiling - header_size - 1 : 0;
  if (line.size() <= room) return line;

  const std::size_t marker = std::strlen(kTruncationMarker);
  if (room <= marker) return Utf8Prefix(kTruncationMarker, room);
  return Utf8Prefix(line, room - marker) + kTruncationMarker;
}

void ChunkAssembler::SplitSection(const ReportSection& section, std::vector<Table>& tables) const {
  std::vector<std::string> texts;
  std::string              current = section.header;
  bool                     has_lines = false;

  for (const auto& line : section.lines) {
    const std::string fitted = FitLine(line, section.header.size());
    if (has_lines && current.size() + fitted.size() + 1 > limits_.detail_ceiling) {
      texts.push_back(std::move(current));
      current   = section.header;
      has_lines = false;
    }
    current += fitted;
    current += '\n';
    has_lines = true;
  }
  if (has_lines) texts.push_back(std::move(current));

  const std::string title = Utf8Prefix(section.title, kMaxTitle);
  for (std::size_t i = 0; i < texts.size(); ++i) {
    Table table;
    table.label = section.label;
    table.title = texts.size() > 1 ? title + " (" + std::to_string(i + 1) + ")" : title;
    table.text  = std::move(texts[i]);
    tables.push_back(std::move(table));
  }
}

std::string ChunkAssembler::FitBlock(const Table& table) const {
  std::string block = DetailBlock(table.label, table.title, table.text);
  if (block.size() <= limits_.report_ceiling) return block;

  const std::size_t overhead = block.size() - table.text.size();
  const std::size_t marker   = std::strlen(kTruncationMarker);
  if (overhead + marker > limits_.report_ceiling) {
    throw util::InvalidArgument("report_ceiling too small for section " + table.title);
  }
  return DetailBlock(table.label, table.title, Utf8Prefix(table.text, limits_.report_ceiling - overhead - marker) + kTruncationMarker);
}

assetdiff::report::v1::ReportOutput ChunkAssembler::MakeOutput(std::string body, bool empty) const {
  assetdiff::report::v1::ReportOutput output;
  output.set_title(title_);
  output.set_summary(empty ? kNoChangesSummary : summary_);
  output.set_body(std::move(body));
  return output;
}

ReportOutputs ChunkAssembler::Assemble(const std::vector<ReportSection>& sections) const {
  std::vector<Table> tables;
  for (const auto& section : sections) {
    SplitSection(section, tables);
  }

  std::vector<std::string> bodies;
  std::string              body;
  for (const auto& table : tables) {
    const std::string block = FitBlock(table);
    if (!body.empty() && body.size() + block.size() > limits_.report_ceiling) {
      bodies.push_back(std::move(body));
      body.clear();
    }
    body += block;
  }
  if (!body.empty()) bodies.push_back(std::move(body));

  ReportOutputs outputs;
  if (bodies.empty()) {
    outputs.primary = MakeOutput({}, true);
    return outputs;
  }

  outputs.primary = MakeOutput(std::move(bodies.front()), false);
  for (std::size_t i = 1; i < bodies.size(); ++i) {
    outputs.additional.push_back(MakeOutput(std::move(bodies[i]), false));
  }
  return outputs;
}

} // namespace assetdiff::report
