#include "internal/report/chunk_assembler.hpp"

#include <cassert>
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using assetdiff::report::ChunkAssembler;
using assetdiff::report::ChunkLimits;
using assetdiff::report::ReportOutputs;
using assetdiff::report::ReportSection;

// Exactly 99 characters, numbered so order can be checked after packing.
std::string NumberedLine(std::size_t i) {
  char prefix[16];
  std::snprintf(prefix, sizeof(prefix), "| L%06zu ", i);
  std::string line = prefix;
  line.append(99 - line.size() - 1, 'x');
  line += '|';
  return line;
}

std::string AllBodies(const ReportOutputs& outputs) {
  std::string all = outputs.primary.body();
  for (const auto& extra : outputs.additional) all += extra.body();
  return all;
}

void TestLargeSectionSplitsIntoThreeOutputs() {
  ReportSection section;
  section.title  = "icons/mob.dmi";
  section.label  = "MODIFIED";
  section.header = "| A | B |\n";
  for (std::size_t i = 0; i < 1300; ++i) section.lines.push_back(NumberedLine(i));
  assert(section.lines.front().size() == 99);

  ChunkAssembler assembler(ChunkLimits{}, "Asset difference rendering", "Assets with diff:");
  const auto     outputs = assembler.Assemble({section});

  assert(outputs.Count() == 3);
  assert(outputs.primary.body().size() <= 60000);
  for (const auto& extra : outputs.additional) assert(extra.body().size() <= 60000);

  assert(outputs.primary.body().find("MODIFIED: icons/mob.dmi (1)") != std::string::npos);
  assert(outputs.additional[0].body().find("MODIFIED: icons/mob.dmi (2)") != std::string::npos);
  assert(outputs.additional[1].body().find("MODIFIED: icons/mob.dmi (3)") != std::string::npos);
  assert(outputs.primary.summary() == "Assets with diff:");
  assert(outputs.additional[0].title() == "Asset difference rendering");

  // Every line survives, in order, and every table repeats the header.
  const std::string all = AllBodies(outputs);
  std::size_t       pos = 0;
  for (std::size_t i = 0; i < 1300; ++i) {
    const auto found = all.find(NumberedLine(i), pos);
    assert(found != std::string::npos);
    pos = found + 1;
  }
  std::size_t headers = 0;
  for (auto at = all.find("| A | B |\n"); at != std::string::npos; at = all.find("| A | B |\n", at + 1)) ++headers;
  assert(headers == 3);
}

void TestTablesStayUnderDetailCeiling() {
  ReportSection section;
  section.title  = "maps/station.dmm";
  section.label  = "MODIFIED";
  section.header = "| H |\n";
  for (std::size_t i = 0; i < 200; ++i) section.lines.push_back(NumberedLine(i));

  ChunkLimits limits;
  limits.detail_ceiling = 1000;
  limits.report_ceiling = 5000;
  ChunkAssembler assembler(limits, "t", "s");
  const auto     outputs = assembler.Assemble({section});

  const std::string open  = "</h3></summary>\n\n";
  const std::string close = "\n</details>";
  const std::string all   = AllBodies(outputs);
  std::size_t       tables = 0;
  for (auto at = all.find(open); at != std::string::npos; at = all.find(open, at + 1)) {
    const auto start = at + open.size();
    const auto end   = all.find(close, start);
    assert(end != std::string::npos);
    assert(end - start <= limits.detail_ceiling);
    ++tables;
  }
  // 6 + k * 100 <= 1000 -> 9 lines per table
  assert(tables == 23);
  assert(outputs.primary.body().size() <= limits.report_ceiling);
  for (const auto& extra : outputs.additional) assert(extra.body().size() <= limits.report_ceiling);
}

void TestSmallSectionsShareOneOutput() {
  std::vector<ReportSection> sections;
  for (const char* name : {"a.dmi", "b.dmi", "c.dmm"}) {
    ReportSection section;
    section.title = name;
    section.label = "ADDED";
    section.lines = {"| one |", "| two |"};
    sections.push_back(section);
  }

  ChunkAssembler assembler(ChunkLimits{}, "t", "s");
  const auto     outputs = assembler.Assemble(sections);
  assert(outputs.Count() == 1);

  const auto& body = outputs.primary.body();
  const auto  a    = body.find("ADDED: a.dmi</h3>");
  const auto  b    = body.find("ADDED: b.dmi</h3>");
  const auto  c    = body.find("ADDED: c.dmm</h3>");
  assert(a != std::string::npos && b != std::string::npos && c != std::string::npos);
  assert(a < b && b < c);
  // single-table sections are not numbered
  assert(body.find("a.dmi (1)") == std::string::npos);
}

void TestEmptyInputYieldsPrimaryOnly() {
  ChunkAssembler assembler(ChunkLimits{}, "Asset difference rendering", "Assets with diff:");
  const auto     outputs = assembler.Assemble({});

  assert(outputs.Count() == 1);
  assert(outputs.primary.body().empty());
  assert(outputs.primary.summary() == ChunkAssembler::kNoChangesSummary);
  assert(outputs.primary.title() == "Asset difference rendering");
}

void TestOversizedLineIsTruncated() {
  ReportSection section;
  section.title = "huge.dmi";
  section.label = "MODIFIED";
  section.lines = {std::string(70000, 'y')};

  ChunkAssembler assembler(ChunkLimits{}, "t", "s");
  const auto     outputs = assembler.Assemble({section});

  assert(outputs.Count() == 1);
  assert(outputs.primary.body().size() <= 60000);
  assert(outputs.primary.body().find(ChunkAssembler::kTruncationMarker) != std::string::npos);
}

void TestAssemblyIsDeterministic() {
  ReportSection section;
  section.title = "icons/obj.dmi";
  section.label = "MODIFIED";
  for (std::size_t i = 0; i < 800; ++i) section.lines.push_back(NumberedLine(i));

  ChunkAssembler assembler(ChunkLimits{}, "t", "s");
  const auto     first  = assembler.Assemble({section});
  const auto     second = assembler.Assemble({section});
  assert(first.Count() == second.Count());
  assert(AllBodies(first) == AllBodies(second));
}

void TestConstructorRejectsInvertedCeilings() {
  for (const auto& limits : {ChunkLimits{60000, 55000}, ChunkLimits{60000, 60000}, ChunkLimits{0, 100}}) {
    bool threw = false;
    try {
      ChunkAssembler assembler(limits, "t", "s");
    } catch (const assetdiff::util::InvalidArgument&) {
      threw = true;
    }
    assert(threw);
  }
}

} // namespace

int main() {
  TestLargeSectionSplitsIntoThreeOutputs();
  TestTablesStayUnderDetailCeiling();
  TestSmallSectionsShareOneOutput();
  TestEmptyInputYieldsPrimaryOnly();
  TestOversizedLineIsTruncated();
  TestAssemblyIsDeterministic();
  TestConstructorRejectsInvertedCeilings();

  std::cout << "assetdiff_unit_chunk_assembler: pass\n";
  return 0;
}
