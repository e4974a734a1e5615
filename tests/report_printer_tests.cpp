/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/**
 * @file report_printer_tests.cpp
 * @brief Listing, match and JSON rendering
 */

#include <gtest/gtest.h>
#include <sstream>
#include "Demangler.h"
#include "output/ReportPrinter.h"
#include "test_helpers.hpp"

namespace {

bool contains(const std::string& text, const std::string& fragment) {
    return text.find(fragment) != std::string::npos;
}

Range makeRange(RangeKind kind, const std::string& name, uint64_t offset, uint64_t size,
                std::optional<uint64_t> vaddr, size_t index) {
    Range range;
    range.kind = kind;
    range.name = name;
    range.file_offset = offset;
    range.file_size = size;
    range.virtual_address = vaddr;
    range.index = index;
    return range;
}

std::vector<MatchReport> sampleReports() {
    Range segment = makeRange(RangeKind::Segment, "__TEXT", 0, 0x100, 0x1000, 0);
    Range command = makeRange(RangeKind::LoadCommand, "LC_MAIN", 0x20, 0x18, std::nullopt, 1);

    MatchReport mapped;
    mapped.offset = 0x15;
    mapped.ranges.push_back({segment, 0x1015});

    MatchReport unmapped;
    unmapped.offset = 0x24;
    unmapped.ranges.push_back({segment, 0x1024});
    unmapped.ranges.push_back({command, std::nullopt});
    return {mapped, unmapped};
}

/// Object file model with one section symbol and one relocation against .text
ElfModel sampleObject() {
    ElfModel model;
    model.header.type = ET_REL;
    model.header.machine = EM_X86_64;
    model.is_64 = true;

    model.section_headers.resize(3);
    model.section_headers[1].name = ".text";
    model.section_headers[1].type = SHT_PROGBITS;
    model.section_headers[2].name = ".rela.text";
    model.section_headers[2].type = SHT_RELA;

    StringTableBuilder names;
    uint32_t main_name = names.add("_ZN3foo3barEv");
    model.symbol_strings = StringTable(std::vector<char>(names.bytes().begin(), names.bytes().end()));

    ElfSymbol null_symbol;
    ElfSymbol text_symbol;
    text_symbol.info = STT_SECTION;
    text_symbol.shndx = 1;
    ElfSymbol function;
    function.name = main_name;
    function.info = static_cast<uint8_t>((STB_GLOBAL << 4) | STT_FUNC);
    function.shndx = 1;
    function.value = 0x10;
    model.symbols = {null_symbol, text_symbol, function};

    ElfRelocation relocation;
    relocation.offset = 0x4;
    relocation.sym = 1;
    relocation.type = R_X86_64_PC32;
    relocation.addend = -4;
    relocation.is_rela = true;
    ElfSectionRelocations group;
    group.section_index = 2;
    group.target_index = 1;
    group.relocations.push_back(relocation);
    model.section_relocations.push_back(group);
    return model;
}

}  // namespace

// ============================================================================
// Matches
// ============================================================================

TEST(ReportPrinter, PrintsMatchesWithContainingRanges) {
    std::ostringstream out;
    ReportPrinter printer(out, {});
    printer.printMatches("X", sampleReports());

    EXPECT_EQ(out.str(),
              "Matches for \"X\":\n"
              "  0x15\n"
              "  ├──__TEXT(0) ∈ 0x1015\n"
              "  0x24\n"
              "  ├──__TEXT(0) ∈ 0x1024\n"
              "  ├──LC_MAIN(1) @ 0x24\n"
              "\n");
}

TEST(ReportPrinter, PrintsNoAnsiSequencesWithoutColor) {
    std::ostringstream out;
    ReportPrinter printer(out, {});
    printer.printMatches("X", sampleReports());
    EXPECT_FALSE(contains(out.str(), "\033["));
}

TEST(ReportPrinter, ColorWrapsStyledFragments) {
    std::ostringstream out;
    ReportPrinter::Options options;
    options.color = true;
    ReportPrinter printer(out, options);
    printer.printMatches("X", sampleReports());
    EXPECT_TRUE(contains(out.str(), std::string(styleFor(StyleTag::Segment).open) + "__TEXT(0)\033[0m"));
}

TEST(ReportPrinter, RangeTableListsEveryRange) {
    std::ostringstream out;
    ReportPrinter printer(out, {});
    printer.printRanges({makeRange(RangeKind::Section, ".text", 0x1000, 0x20, 0x401000, 1),
                         makeRange(RangeKind::Section, ".comment", 0x2000, 0x10, std::nullopt, 2)});
    std::string text = out.str();
    EXPECT_TRUE(contains(text, "Ranges(2):"));
    EXPECT_TRUE(contains(text, "vaddr: 0x401000"));
    EXPECT_TRUE(contains(text, "vaddr: none"));
}

// ============================================================================
// JSON
// ============================================================================

TEST(ReportPrinter, JsonCarriesRangesAndMatches) {
    std::ostringstream out;
    ReportPrinter printer(out, {});
    printer.printJson("a.out", BinaryFormat::MachO,
                      {makeRange(RangeKind::Segment, "__TEXT", 0, 0x100, 0x1000, 0)}, std::string("X"),
                      sampleReports());
    std::string json = out.str();
    EXPECT_TRUE(contains(json, "\"format\": \"Mach-O\""));
    EXPECT_TRUE(contains(json, "{\"kind\": \"Segment\", \"name\": \"__TEXT\", \"index\": 0, "
                               "\"file_offset\": 0, \"file_size\": 256, \"virtual_address\": 4096}"));
    EXPECT_TRUE(contains(json, "\"search\": \"X\""));
    EXPECT_TRUE(contains(json, "\"normalized_address\": 4117"));
    EXPECT_TRUE(contains(json, "\"normalized_address\": null"));
    EXPECT_EQ(json.back(), '\n');
}

TEST(ReportPrinter, JsonWithoutSearchOmitsMatches) {
    std::ostringstream out;
    ReportPrinter printer(out, {});
    printer.printJson("a.out", BinaryFormat::PE, {}, std::nullopt, {});
    EXPECT_EQ(out.str(),
              "{\n"
              "  \"file\": \"a.out\",\n"
              "  \"format\": \"PE\",\n"
              "  \"ranges\": []\n"
              "}\n");
}

TEST(ReportPrinter, JsonEscapesControlCharacters) {
    EXPECT_EQ(ReportPrinter::jsonEscape("a\"b\\c\n\x01"), "a\\\"b\\\\c\\n\\u0001");
}

// ============================================================================
// Listings
// ============================================================================

TEST(ReportPrinter, ElfListingResolvesSymbolsAndRelocations) {
    std::ostringstream out;
    ReportPrinter printer(out, {});
    printer.printElf(sampleObject());
    std::string text = out.str();

    EXPECT_TRUE(contains(text, "Syms(3):"));
    EXPECT_TRUE(contains(text, "_ZN3foo3barEv"));
    EXPECT_TRUE(contains(text, "st_shndx: .text(1)"));
    EXPECT_TRUE(contains(text, "Shdr Relocations(1):\n  .text(1)\n"));
    EXPECT_TRUE(contains(text, "R_X86_64_PC32 .text-0x4"));
    EXPECT_TRUE(contains(text, "Dynamic: None"));
    EXPECT_TRUE(contains(text, "Libraries(0):"));
}

TEST(ReportPrinter, DemanglesWhenEnabled) {
    std::ostringstream out;
    ReportPrinter::Options options;
    options.demangle = true;
    ReportPrinter printer(out, options);
    printer.printElf(sampleObject());
    EXPECT_TRUE(contains(out.str(), "foo::bar()"));
    EXPECT_FALSE(contains(out.str(), "_ZN3foo3barEv"));
}

TEST(ReportPrinter, PrettyElfListingUsesColumnTables) {
    std::ostringstream out;
    ReportPrinter::Options options;
    options.pretty = true;
    ReportPrinter printer(out, options);
    printer.printElf(sampleObject());
    std::string text = out.str();
    EXPECT_TRUE(contains(text, "addr"));
    EXPECT_TRUE(contains(text, "section"));
    EXPECT_TRUE(contains(text, "----"));
}

TEST(ReportPrinter, MachOExportSizesAreDistanceToNextExport) {
    MachOModel model;
    model.is_64 = true;
    model.header.filetype = MachOFormat::MH_DYLIB;
    model.exports = {{"_a", 0x1000, 0, std::nullopt},
                     {"_b", 0x1040, 0, std::nullopt},
                     {"_c", 0x1000, 0, std::nullopt},
                     {"_d", 0, MachOFormat::EXPORT_SYMBOL_FLAGS_REEXPORT, std::string("libz.dylib")}};

    std::ostringstream out;
    ReportPrinter printer(out, {});
    printer.printMachO(model);
    std::string text = out.str();
    EXPECT_TRUE(contains(text, "_a (64)"));
    EXPECT_TRUE(contains(text, "_c (64)"));
    EXPECT_TRUE(contains(text, "_b (0)"));
    EXPECT_TRUE(contains(text, "_d (4096) -> libz.dylib"));
    EXPECT_TRUE(contains(text, "is_lib: true"));
}

TEST(ReportPrinter, MachOListingFlagsBadSectionNames) {
    MachOModel model;
    MachOSegment segment;
    segment.name = "__DATA";
    segment.sections.push_back(MachOSection{});
    model.segments.push_back(segment);

    std::ostringstream out;
    ReportPrinter printer(out, {});
    printer.printMachO(model);
    EXPECT_TRUE(contains(out.str(), "0: __DATA(1)"));
    EXPECT_TRUE(contains(out.str(), "BAD SECTION NAME"));
}

TEST(ReportPrinter, PeImportsAreGroupedByDll) {
    PeModel model;
    PeImport by_name;
    by_name.dll = "KERNEL32.dll";
    by_name.name = "ExitProcess";
    by_name.hint = 7;
    PeImport by_ordinal;
    by_ordinal.dll = "KERNEL32.dll";
    by_ordinal.by_ordinal = true;
    by_ordinal.ordinal = 5;
    model.imports = {by_name, by_ordinal};
    model.libraries = {"KERNEL32.dll"};

    std::ostringstream out;
    ReportPrinter printer(out, {});
    printer.printPe(model);
    std::string text = out.str();
    EXPECT_TRUE(contains(text, "  KERNEL32.dll(2)\n"));
    EXPECT_TRUE(contains(text, "ExitProcess (hint: 7)"));
    EXPECT_TRUE(contains(text, "ordinal 5"));
}

TEST(ReportPrinter, ArchiveSymbolsPointAtMembers) {
    ArchiveModel model;
    ArchiveMember member;
    member.name = "hello.o";
    member.header_offset = 0x44;
    member.data_offset = 0x80;
    member.size = 6;
    member.mode = 0100644;
    model.members.push_back(member);
    model.symbols.push_back({"say_hello", 0x44});
    model.symbols.push_back({"orphan", 0x99});

    std::ostringstream out;
    ReportPrinter printer(out, {});
    printer.printArchive(model);
    std::string text = out.str();
    EXPECT_TRUE(contains(text, "mode: 0o100644"));
    EXPECT_TRUE(contains(text, "say_hello -> hello.o"));
    EXPECT_TRUE(contains(text, "orphan -> 0x99"));
}

// ============================================================================
// Demangler
// ============================================================================

TEST(Demangler, DemanglesItaniumNames) {
    Demangler demangler;
    EXPECT_EQ(demangler.demangle("_ZN3foo3barEv"), "foo::bar()");
    EXPECT_EQ(demangler.demangle("__ZN3foo3barEv"), "foo::bar()");
}

TEST(Demangler, LeavesOtherNamesUnchanged) {
    Demangler demangler;
    EXPECT_EQ(demangler.demangle("main"), "main");
    EXPECT_EQ(demangler.demangle("_Znot_mangled"), "_Znot_mangled");
    EXPECT_EQ(demangler.display("_ZN3foo3barEv", false), "_ZN3foo3barEv");
}
