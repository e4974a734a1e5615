/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "BinStructures.h"
#include "Demangler.h"

/**
 * @file ReportPrinter.h
 * @brief Text, column-table and JSON rendering of decoded binaries
 *
 * ReportPrinter turns the decoded format models, the normalized Range table
 * and pattern MatchReports into output for a terminal or a script.
 *
 * ## Output Modes:
 * - **Text**: one line per entry, grouped under `Title(count):` headings
 * - **Pretty**: header, section and symbol listings as aligned column tables
 * - **JSON**: the Range table and MatchReports only
 *
 * ## Styling:
 * Every styled fragment is tagged with a StyleTag. The tag is looked up in a
 * fixed table of ANSI sequences, so a new enum value only needs a new table
 * row. When color is disabled the tag is ignored and output is plain.
 *
 * ## Usage Example:
 * ```cpp
 * ReportPrinter printer(std::cout, {use_color, config.pretty, config.demangle});
 * printer.printElf(model);
 * printer.printMatches("hello", reports);
 * ```
 *
 * @see CorrelationReporter
 * @see SymbolCrossReferencer
 */

/**
 * @brief Presentation category of an output fragment
 */
enum class StyleTag : uint8_t {
    Plain,
    Title,
    Address,
    Offset,
    Size,
    Name,
    Library,
    Bad,
    // Range kinds
    Segment,
    Section,
    ProgramHeader,
    LoadCommand,
    // Symbol bindings
    BindLocal,
    BindGlobal,
    BindWeak,
    BindOther,
    // Symbol types
    KindObject,
    KindFunction,
    KindIndirectFunction,
    KindSection,
    KindOther,
    Count
};

/**
 * @brief ANSI rendering of a StyleTag
 */
struct StyleDescriptor {
    const char* open;  ///< Escape sequence, empty for unstyled
};

/**
 * @brief Look up the style of a tag
 */
const StyleDescriptor& styleFor(StyleTag tag);

StyleTag styleTag(RangeKind kind);
StyleTag styleTag(SymbolBinding binding);
StyleTag styleTag(SymbolKind kind);

class ReportPrinter {
public:
    struct Options {
        bool color = false;
        bool pretty = false;
        bool demangle = false;
    };

    ReportPrinter(std::ostream& out, Options options);

    void printElf(const ElfModel& model);
    void printMachO(const MachOModel& model);

    /**
     * @brief Fat header and arch table; each slice is printed separately
     */
    void printFatArches(const std::vector<MachOFatArch>& arches);

    void printPe(const PeModel& model);
    void printArchive(const ArchiveModel& model);

    /**
     * @brief Debug listing of the normalized Range table
     */
    void printRanges(const std::vector<Range>& ranges);

    /**
     * @brief Search results, one offset per report followed by its containing ranges
     * @param label Needle as the user gave it
     */
    void printMatches(const std::string& label, const std::vector<MatchReport>& reports);

    /**
     * @brief Range table and optional search results as one JSON document
     */
    void printJson(const std::string& file,
                   BinaryFormat format,
                   const std::vector<Range>& ranges,
                   const std::optional<std::string>& label,
                   const std::vector<MatchReport>& reports);

    static std::string jsonEscape(const std::string& text);

private:
    std::string paint(StyleTag tag, const std::string& text) const;
    std::string name(const std::string& raw) const;

    void printElfSymbols(const char* title,
                         const ElfModel& model,
                         const std::vector<ElfSymbol>& symbols,
                         const StringTable& strings);
    void printElfRelocations(const char* title,
                             const ElfModel& model,
                             const std::vector<ElfRelocation>& relocations,
                             bool dynamic);
    void printElfSectionRelocations(const ElfModel& model);
    void printElfDynamic(const ElfModel& model);
    void printLibraries(const std::vector<std::string>& libraries);

    std::ostream& out_;
    Options options_;
    Demangler demangler_;
};
