/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/**
 * @file ReportPrinter.cpp
 * @brief Listing, table and JSON output for every supported format
 *
 * Column widths follow a fixed layout so that listings of different files
 * line up when diffed. Text layout per format:
 * - ELF: header, program headers, section headers, symbols, relocations,
 *   dynamic table, libraries, summary
 * - Mach-O: header, load commands, segments with sections, exports,
 *   imports, libraries, summary
 * - PE: header, sections, imports grouped by DLL, exports, libraries
 * - Archive: members and the symbol index
 */

#include "ReportPrinter.h"
#include <elf.h>
#include <algorithm>
#include <functional>
#include <iomanip>
#include <map>
#include <sstream>
#include "FormatDetector.h"
#include "FormatNames.h"
#include "MachOFormat.h"
#include "SymbolCrossReferencer.h"

namespace {

constexpr const char* RESET = "\033[0m";

std::string hex(uint64_t value) {
    std::ostringstream oss;
    oss << "0x" << std::hex << value;
    return oss.str();
}

/// Address column: right aligned, hex without prefix
std::string address(uint64_t value) {
    std::ostringstream oss;
    oss << std::setw(16) << std::right << std::hex << value;
    return oss.str();
}

std::string padRight(const std::string& text, size_t width) {
    return text.size() >= width ? text : text + std::string(width - text.size(), ' ');
}

std::string padLeft(const std::string& text, size_t width) {
    return text.size() >= width ? text : std::string(width - text.size(), ' ') + text;
}

std::string indexColumn(size_t value) {
    return padLeft(std::to_string(value), 4);
}

const char* boolText(bool value) {
    return value ? "true" : "false";
}

const char* endianness(bool little_endian) {
    return little_endian ? "little-endian" : "big-endian";
}

// ============================================================================
// Column tables (--pretty)
// ============================================================================

struct Cell {
    Cell(std::string value, StyleTag style = StyleTag::Plain) : text(std::move(value)), tag(style) {}
    Cell(const char* value, StyleTag style = StyleTag::Plain) : text(value), tag(style) {}

    std::string text;
    StyleTag tag;
};

/**
 * @brief Aligned column table; widths are measured on the unstyled text
 */
class ColumnTable {
public:
    using Painter = std::function<std::string(StyleTag, const std::string&)>;

    explicit ColumnTable(std::vector<std::string> headers) : headers_(std::move(headers)) {
        for (const auto& header : headers_) {
            widths_.push_back(header.size());
        }
    }

    void addRow(std::vector<Cell> row) {
        for (size_t i = 0; i < row.size() && i < widths_.size(); ++i) {
            widths_[i] = std::max(widths_[i], row[i].text.size());
        }
        rows_.push_back(std::move(row));
    }

    void print(std::ostream& out, const Painter& paint) const {
        for (size_t i = 0; i < headers_.size(); ++i) {
            out << (i == 0 ? "" : "  ") << paint(StyleTag::Title, padRight(headers_[i], widths_[i]));
        }
        out << "\n";
        for (size_t i = 0; i < headers_.size(); ++i) {
            out << (i == 0 ? "" : "  ") << std::string(widths_[i], '-');
        }
        out << "\n";
        for (const auto& row : rows_) {
            for (size_t i = 0; i < row.size() && i < widths_.size(); ++i) {
                out << (i == 0 ? "" : "  ") << paint(row[i].tag, padRight(row[i].text, widths_[i]));
            }
            out << "\n";
        }
    }

private:
    std::vector<std::string> headers_;
    std::vector<size_t> widths_;
    std::vector<std::vector<Cell>> rows_;
};

// ============================================================================
// Dynamic table value classes
// ============================================================================

bool isStringTag(int64_t tag) {
    return tag == DT_NEEDED || tag == DT_RPATH || tag == DT_RUNPATH || tag == DT_SONAME;
}

bool isAddressTag(int64_t tag) {
    switch (tag) {
        case DT_PLTGOT:
        case DT_HASH:
        case DT_GNU_HASH:
        case DT_STRTAB:
        case DT_SYMTAB:
        case DT_RELA:
        case DT_REL:
        case DT_INIT:
        case DT_FINI:
        case DT_INIT_ARRAY:
        case DT_FINI_ARRAY:
        case DT_PREINIT_ARRAY:
        case DT_JMPREL:
        case DT_VERSYM:
        case DT_VERDEF:
        case DT_VERNEED:
        case DT_DEBUG:
            return true;
        default:
            return false;
    }
}

bool isSizeTag(int64_t tag) {
    switch (tag) {
        case DT_PLTRELSZ:
        case DT_RELASZ:
        case DT_RELAENT:
        case DT_RELSZ:
        case DT_RELENT:
        case DT_STRSZ:
        case DT_SYMENT:
        case DT_INIT_ARRAYSZ:
        case DT_FINI_ARRAYSZ:
        case DT_PREINIT_ARRAYSZ:
            return true;
        default:
            return false;
    }
}

}  // namespace

// ============================================================================
// Style table
// ============================================================================

const StyleDescriptor& styleFor(StyleTag tag) {
    static const StyleDescriptor styles[] = {
        {""},               // Plain
        {"\033[1m"},        // Title
        {"\033[33m"},       // Address
        {"\033[33m"},       // Offset
        {"\033[32m"},       // Size
        {"\033[1;37m"},     // Name
        {"\033[1;34m"},     // Library
        {"\033[1;31m"},     // Bad
        {"\033[1;35m"},     // Segment
        {"\033[1;36m"},     // Section
        {"\033[35m"},       // ProgramHeader
        {"\033[34m"},       // LoadCommand
        {"\033[2m"},        // BindLocal
        {"\033[1;32m"},     // BindGlobal
        {"\033[1;33m"},     // BindWeak
        {""},               // BindOther
        {"\033[36m"},       // KindObject
        {"\033[1;31m"},     // KindFunction
        {"\033[1;35m"},     // KindIndirectFunction
        {"\033[34m"},       // KindSection
        {""},               // KindOther
    };
    static_assert(sizeof(styles) / sizeof(styles[0]) == static_cast<size_t>(StyleTag::Count),
                  "style table out of sync with StyleTag");
    return styles[static_cast<size_t>(tag)];
}

StyleTag styleTag(RangeKind kind) {
    switch (kind) {
        case RangeKind::Segment:
            return StyleTag::Segment;
        case RangeKind::Section:
            return StyleTag::Section;
        case RangeKind::ProgramHeader:
            return StyleTag::ProgramHeader;
        case RangeKind::LoadCommand:
            return StyleTag::LoadCommand;
    }
    return StyleTag::Plain;
}

StyleTag styleTag(SymbolBinding binding) {
    switch (binding) {
        case SymbolBinding::Local:
            return StyleTag::BindLocal;
        case SymbolBinding::Global:
            return StyleTag::BindGlobal;
        case SymbolBinding::Weak:
            return StyleTag::BindWeak;
        case SymbolBinding::Other:
            return StyleTag::BindOther;
    }
    return StyleTag::Plain;
}

StyleTag styleTag(SymbolKind kind) {
    switch (kind) {
        case SymbolKind::Object:
            return StyleTag::KindObject;
        case SymbolKind::Function:
            return StyleTag::KindFunction;
        case SymbolKind::IndirectFunction:
            return StyleTag::KindIndirectFunction;
        case SymbolKind::Section:
            return StyleTag::KindSection;
        case SymbolKind::Other:
            return StyleTag::KindOther;
    }
    return StyleTag::Plain;
}

// ============================================================================
// ReportPrinter
// ============================================================================

ReportPrinter::ReportPrinter(std::ostream& out, Options options)
    : out_(out), options_(options) {}

std::string ReportPrinter::paint(StyleTag tag, const std::string& text) const {
    if (!options_.color) {
        return text;
    }
    const StyleDescriptor& style = styleFor(tag);
    if (*style.open == '\0') {
        return text;
    }
    return style.open + text + RESET;
}

std::string ReportPrinter::name(const std::string& raw) const {
    return demangler_.display(raw, options_.demangle);
}

// ============================================================================
// ELF
// ============================================================================

void ReportPrinter::printElf(const ElfModel& model) {
    const ElfHeaderInfo& header = model.header;
    out_ << "ELF " << paint(StyleTag::Title, ElfNames::fileType(header.type)) << " "
         << ElfNames::machine(header.machine) << "-" << endianness(model.little_endian) << " @ "
         << paint(StyleTag::Address, hex(model.entry)) << ":\n\n";

    out_ << "e_phoff: " << hex(header.phoff) << " e_shoff: " << hex(header.shoff)
         << " e_flags: " << hex(header.flags) << " e_ehsize: " << header.ehsize
         << " e_phentsize: " << header.phentsize << " e_phnum: " << header.phnum
         << " e_shentsize: " << header.shentsize << " e_shnum: " << header.shnum
         << " e_shstrndx: " << header.shstrndx << "\n\n";

    auto painter = [this](StyleTag tag, const std::string& text) { return paint(tag, text); };

    out_ << paint(StyleTag::Title, "ProgramHeaders(" + std::to_string(model.program_headers.size()) + "):")
         << "\n";
    if (options_.pretty) {
        ColumnTable table({"idx", "type", "flags", "offset", "vaddr", "paddr", "filesz", "memsz",
                           "align"});
        for (size_t i = 0; i < model.program_headers.size(); ++i) {
            const auto& phdr = model.program_headers[i];
            table.addRow({std::to_string(i),
                          {ElfNames::programHeaderType(phdr.type), StyleTag::ProgramHeader},
                          ElfNames::programHeaderFlags(phdr.flags),
                          {hex(phdr.offset), StyleTag::Offset},
                          {hex(phdr.vaddr), StyleTag::Address},
                          {hex(phdr.paddr), StyleTag::Address},
                          {hex(phdr.filesz), StyleTag::Size},
                          {hex(phdr.memsz), StyleTag::Size},
                          hex(phdr.align)});
        }
        table.print(out_, painter);
    } else {
        for (size_t i = 0; i < model.program_headers.size(); ++i) {
            const auto& phdr = model.program_headers[i];
            out_ << indexColumn(i) << " "
                 << paint(StyleTag::ProgramHeader, padRight(ElfNames::programHeaderType(phdr.type), 16))
                 << " " << padLeft(ElfNames::programHeaderFlags(phdr.flags), 4)
                 << " p_offset: " << paint(StyleTag::Offset, hex(phdr.offset))
                 << " p_vaddr: " << paint(StyleTag::Address, hex(phdr.vaddr))
                 << " p_paddr: " << paint(StyleTag::Address, hex(phdr.paddr))
                 << " p_filesz: " << paint(StyleTag::Size, hex(phdr.filesz))
                 << " p_memsz: " << paint(StyleTag::Size, hex(phdr.memsz))
                 << " p_flags: " << hex(phdr.flags) << " p_align: " << hex(phdr.align) << "\n";
        }
    }
    out_ << "\n";

    out_ << paint(StyleTag::Title, "SectionHeaders(" + std::to_string(model.section_headers.size()) + "):")
         << "\n";
    if (options_.pretty) {
        ColumnTable table({"idx", "name", "type", "offset", "addr", "size", "link", "info",
                           "entsize", "align", "flags"});
        for (size_t i = 0; i < model.section_headers.size(); ++i) {
            const auto& shdr = model.section_headers[i];
            table.addRow({std::to_string(i),
                          {shdr.name, StyleTag::Section},
                          ElfNames::sectionType(shdr.type),
                          {hex(shdr.offset), StyleTag::Offset},
                          {hex(shdr.addr), StyleTag::Address},
                          {hex(shdr.size), StyleTag::Size},
                          std::to_string(shdr.link),
                          hex(shdr.info),
                          hex(shdr.entsize),
                          hex(shdr.addralign),
                          ElfNames::sectionFlags(shdr.flags)});
        }
        table.print(out_, painter);
    } else {
        for (size_t i = 0; i < model.section_headers.size(); ++i) {
            const auto& shdr = model.section_headers[i];
            out_ << indexColumn(i) << " " << paint(StyleTag::Section, padRight(shdr.name, 16)) << " "
                 << ElfNames::sectionType(shdr.type)
                 << " sh_offset: " << paint(StyleTag::Offset, hex(shdr.offset))
                 << " sh_addr: " << paint(StyleTag::Address, hex(shdr.addr))
                 << " sh_size: " << paint(StyleTag::Size, hex(shdr.size))
                 << " sh_link: " << shdr.link << " sh_info: " << hex(shdr.info)
                 << " sh_entsize: " << hex(shdr.entsize) << " sh_flags: " << hex(shdr.flags)
                 << " sh_addralign: " << hex(shdr.addralign) << "\n";
            if (shdr.flags != 0) {
                out_ << std::string(16, ' ') << ElfNames::sectionFlags(shdr.flags) << "\n";
            }
        }
    }
    out_ << "\n";

    printElfSymbols("Syms", model, model.symbols, model.symbol_strings);
    printElfSymbols("Dyn Syms", model, model.dynamic_symbols, model.dynamic_strings);
    printElfRelocations("Dynamic Relas", model, model.dynamic_relas, true);
    printElfRelocations("Dynamic Rel", model, model.dynamic_rels, true);
    printElfRelocations("Plt Relocations", model, model.plt_relocations, true);
    printElfSectionRelocations(model);
    printElfDynamic(model);
    printLibraries(model.libraries);

    out_ << "Soname: " << paint(StyleTag::Library, model.soname ? *model.soname : "None") << "\n";
    out_ << "Interpreter: " << (model.interpreter ? *model.interpreter : "None") << "\n";
    out_ << "is_64: " << boolText(model.is_64) << "\n";
    out_ << "is_lib: " << boolText(model.is_lib) << "\n";
    out_ << "little_endian: " << boolText(model.little_endian) << "\n";
    out_ << "entry: " << paint(StyleTag::Address, hex(model.entry)) << "\n";
}

void ReportPrinter::printElfSymbols(const char* title,
                                    const ElfModel& model,
                                    const std::vector<ElfSymbol>& symbols,
                                    const StringTable& strings) {
    SymbolCrossReferencer references(symbols, strings,
                                     SectionIndexResolver::forElf(model.section_headers));

    out_ << paint(StyleTag::Title, std::string(title) + "(" + std::to_string(symbols.size()) + "):")
         << "\n";
    if (options_.pretty) {
        ColumnTable table({"addr", "bind", "type", "name", "size", "other", "section"});
        for (size_t i = 0; i < symbols.size(); ++i) {
            SymbolRef symbol = references.resolveSymbol(i);
            table.addRow({{hex(symbol.value), StyleTag::Address},
                          {ElfNames::symbolBinding(symbol.raw_binding), styleTag(symbol.binding)},
                          {ElfNames::symbolType(symbol.raw_type), styleTag(symbol.type)},
                          {name(symbol.name), StyleTag::Name},
                          {std::to_string(symbol.size), StyleTag::Size},
                          hex(symbol.other),
                          {symbol.owning_section, StyleTag::Section}});
        }
        table.print(out_, [this](StyleTag tag, const std::string& text) { return paint(tag, text); });
    } else {
        for (size_t i = 0; i < symbols.size(); ++i) {
            SymbolRef symbol = references.resolveSymbol(i);
            out_ << paint(StyleTag::Address, address(symbol.value)) << " "
                 << paint(styleTag(symbol.binding),
                          padRight(ElfNames::symbolBinding(symbol.raw_binding), 8))
                 << " "
                 << paint(styleTag(symbol.type), padRight(ElfNames::symbolType(symbol.raw_type), 9))
                 << " " << paint(StyleTag::Name, name(symbol.name))
                 << " st_size: " << paint(StyleTag::Size, std::to_string(symbol.size))
                 << " st_other: " << hex(symbol.other)
                 << " st_shndx: " << paint(StyleTag::Section, symbol.owning_section) << "\n";
        }
    }
    out_ << "\n";
}

void ReportPrinter::printElfRelocations(const char* title,
                                        const ElfModel& model,
                                        const std::vector<ElfRelocation>& relocations,
                                        bool dynamic) {
    const auto& symbols = dynamic ? model.dynamic_symbols : model.symbols;
    const auto& strings = dynamic ? model.dynamic_strings : model.symbol_strings;
    SymbolCrossReferencer references(symbols, strings,
                                     SectionIndexResolver::forElf(model.section_headers));

    out_ << paint(StyleTag::Title,
                  std::string(title) + "(" + std::to_string(relocations.size()) + "):")
         << "\n";
    for (const auto& relocation : relocations) {
        RelocationRef ref = references.resolveRelocation(relocation, model.header.machine);
        out_ << paint(StyleTag::Address, address(ref.offset)) << " " << ref.type_name << " "
             << paint(StyleTag::Name, name(ref.symbol_name)) << ref.addend_text << "\n";
    }
    out_ << "\n";
}

void ReportPrinter::printElfSectionRelocations(const ElfModel& model) {
    SectionIndexResolver sections = SectionIndexResolver::forElf(model.section_headers);
    SymbolCrossReferencer static_references(model.symbols, model.symbol_strings, sections);
    SymbolCrossReferencer dynamic_references(model.dynamic_symbols, model.dynamic_strings, sections);

    out_ << paint(StyleTag::Title,
                  "Shdr Relocations(" + std::to_string(model.section_relocations.size()) + "):")
         << "\n";
    for (const auto& group : model.section_relocations) {
        // The symbol table is the one the relocation section links to
        bool dynamic = false;
        if (group.section_index < model.section_headers.size()) {
            uint32_t link = model.section_headers[group.section_index].link;
            dynamic = link < model.section_headers.size() &&
                      model.section_headers[link].type == SHT_DYNSYM;
        }
        const SymbolCrossReferencer& references = dynamic ? dynamic_references : static_references;

        auto target = sections.sectionName(group.target_index);
        out_ << "  " << paint(StyleTag::Section, target ? *target : sections.render(group.target_index))
             << "(" << group.relocations.size() << ")\n";
        for (const auto& relocation : group.relocations) {
            RelocationRef ref = references.resolveRelocation(relocation, model.header.machine);
            out_ << paint(StyleTag::Address, address(ref.offset)) << " " << ref.type_name << " "
                 << paint(StyleTag::Name, name(ref.symbol_name)) << ref.addend_text << "\n";
        }
    }
    out_ << "\n";
}

void ReportPrinter::printElfDynamic(const ElfModel& model) {
    if (!model.dynamic) {
        out_ << "Dynamic: None\n\n";
        return;
    }

    const auto& entries = *model.dynamic;
    out_ << paint(StyleTag::Title, "Dynamic(" + std::to_string(entries.size()) + "):") << "\n";
    for (const auto& entry : entries) {
        out_ << padLeft(ElfNames::dynamicTag(entry.tag), 16) << " ";
        if (isStringTag(entry.tag)) {
            out_ << paint(StyleTag::Library, model.dynamic_strings.nameAt(entry.value));
        } else if (isAddressTag(entry.tag)) {
            out_ << paint(StyleTag::Address, hex(entry.value));
        } else if (isSizeTag(entry.tag)) {
            out_ << paint(StyleTag::Size, std::to_string(entry.value));
        } else {
            out_ << hex(entry.value);
        }
        out_ << "\n";
    }
    out_ << "\n";
}

void ReportPrinter::printLibraries(const std::vector<std::string>& libraries) {
    out_ << paint(StyleTag::Title, "Libraries(" + std::to_string(libraries.size()) + "):") << "\n";
    for (const auto& library : libraries) {
        out_ << paint(StyleTag::Library, padLeft(library, 16)) << "\n";
    }
    out_ << "\n";
}

// ============================================================================
// Mach-O
// ============================================================================

void ReportPrinter::printFatArches(const std::vector<MachOFatArch>& arches) {
    out_ << paint(StyleTag::Title, "Fat(" + std::to_string(arches.size()) + "):") << "\n";
    for (size_t i = 0; i < arches.size(); ++i) {
        const auto& arch = arches[i];
        out_ << indexColumn(i) << " " << padRight(MachONames::cpuType(arch.cputype), 10)
             << " offset: " << paint(StyleTag::Offset, hex(arch.offset))
             << " size: " << paint(StyleTag::Size, hex(arch.size)) << " align: " << arch.align
             << "\n";
    }
    out_ << "\n";
}

void ReportPrinter::printMachO(const MachOModel& model) {
    out_ << "Mach-o " << paint(StyleTag::Title, MachONames::fileType(model.header.filetype)) << " "
         << MachONames::cpuType(model.header.cputype) << "-" << endianness(model.little_endian)
         << " @ " << paint(StyleTag::Address, hex(model.entry)) << ":\n\n";

    out_ << paint(StyleTag::Title, "LoadCommands(" + std::to_string(model.load_commands.size()) + "):")
         << "\n";
    for (size_t i = 0; i < model.load_commands.size(); ++i) {
        out_ << indexColumn(i) << " "
             << paint(StyleTag::LoadCommand, MachONames::loadCommand(model.load_commands[i].cmd))
             << "\n";
    }
    out_ << "\n";

    out_ << paint(StyleTag::Title, "Segments(" + std::to_string(model.segments.size()) + "):") << "\n";
    if (options_.pretty) {
        ColumnTable table({"segment", "idx", "name", "addr", "size", "offset", "align", "reloff",
                           "nreloc", "flags"});
        for (const auto& segment : model.segments) {
            for (size_t j = 0; j < segment.sections.size(); ++j) {
                const auto& section = segment.sections[j];
                table.addRow({{segment.name ? *segment.name : UNREADABLE_NAME, StyleTag::Segment},
                              std::to_string(j),
                              section.name ? Cell(*section.name, StyleTag::Section)
                                           : Cell("BAD SECTION NAME", StyleTag::Bad),
                              {hex(section.addr), StyleTag::Address},
                              {hex(section.size), StyleTag::Size},
                              {hex(section.offset), StyleTag::Offset},
                              std::to_string(section.align),
                              hex(section.reloff),
                              std::to_string(section.nreloc),
                              hex(section.flags)});
            }
        }
        table.print(out_, [this](StyleTag tag, const std::string& text) { return paint(tag, text); });
    } else {
        for (size_t i = 0; i < model.segments.size(); ++i) {
            const auto& segment = model.segments[i];
            std::string segment_name = segment.name ? *segment.name : UNREADABLE_NAME;
            out_ << "  " << i << ": "
                 << paint(StyleTag::Segment,
                          segment_name + "(" + std::to_string(segment.sections.size()) + ")")
                 << "\n";
            for (size_t j = 0; j < segment.sections.size(); ++j) {
                const auto& section = segment.sections[j];
                out_ << "    " << j << ": ";
                if (!section.name) {
                    out_ << paint(StyleTag::Bad, "BAD SECTION NAME") << "\n";
                    continue;
                }
                out_ << paint(StyleTag::Section, padRight(*section.name, 16))
                     << " addr: " << paint(StyleTag::Address, hex(section.addr))
                     << " size: " << paint(StyleTag::Size, hex(section.size))
                     << " offset: " << paint(StyleTag::Offset, hex(section.offset))
                     << " align: " << section.align << " reloff: " << hex(section.reloff)
                     << " nreloc: " << section.nreloc << " flags: " << hex(section.flags)
                     << " data: " << section.file_size << "\n";
            }
        }
    }
    out_ << "\n";

    // Export sizes are the distance to the next export by address
    std::vector<size_t> order(model.exports.size());
    for (size_t i = 0; i < order.size(); ++i) {
        order[i] = i;
    }
    std::stable_sort(order.begin(), order.end(), [&model](size_t a, size_t b) {
        return model.exports[a].address < model.exports[b].address;
    });
    std::vector<uint64_t> export_sizes(model.exports.size(), 0);
    for (size_t k = 0; k < order.size(); ++k) {
        uint64_t current = model.exports[order[k]].address;
        for (size_t next = k + 1; next < order.size(); ++next) {
            if (model.exports[order[next]].address != current) {
                export_sizes[order[k]] = model.exports[order[next]].address - current;
                break;
            }
        }
    }

    out_ << paint(StyleTag::Title, "Exports(" + std::to_string(model.exports.size()) + "):") << "\n";
    for (size_t i = 0; i < model.exports.size(); ++i) {
        const auto& exported = model.exports[i];
        out_ << paint(StyleTag::Address, address(exported.address)) << " "
             << paint(StyleTag::Name, name(exported.name)) << " (" << export_sizes[i] << ")";
        if (exported.reexport_from) {
            out_ << " -> " << paint(StyleTag::Library, *exported.reexport_from);
        }
        out_ << "\n";
    }
    out_ << "\n";

    const unsigned pointer_size = model.is_64 ? 8 : 4;
    out_ << paint(StyleTag::Title, "Imports(" + std::to_string(model.imports.size()) + "):") << "\n";
    for (const auto& imported : model.imports) {
        out_ << paint(StyleTag::Address, address(imported.address)) << " "
             << paint(StyleTag::Name, name(imported.name)) << " (" << pointer_size << ")"
             << " -> " << paint(StyleTag::Library, imported.dylib);
        if (imported.weak) {
            out_ << " [weak]";
        }
        if (imported.lazy) {
            out_ << " [lazy]";
        }
        out_ << "\n";
    }
    out_ << "\n";

    printLibraries(model.libraries);

    bool is_lib = model.header.filetype == MachOFormat::MH_DYLIB ||
                  model.header.filetype == MachOFormat::MH_BUNDLE;
    out_ << "Name: " << paint(StyleTag::Library, model.name ? *model.name : "None") << "\n";
    out_ << "is_64: " << boolText(model.is_64) << "\n";
    out_ << "is_lib: " << boolText(is_lib) << "\n";
    out_ << "little_endian: " << boolText(model.little_endian) << "\n";
    out_ << "entry: " << paint(StyleTag::Address, hex(model.entry)) << "\n";
}

// ============================================================================
// PE
// ============================================================================

void ReportPrinter::printPe(const PeModel& model) {
    out_ << "PE " << paint(StyleTag::Title, model.is_lib ? "DLL" : "EXE") << " "
         << PeNames::machine(model.machine) << " @ "
         << paint(StyleTag::Address, hex(model.image_base + model.entry_rva)) << ":\n\n";

    out_ << "Machine: " << PeNames::machine(model.machine)
         << " Characteristics: " << hex(model.characteristics)
         << " TimeDateStamp: " << model.timestamp << "\n";
    out_ << "ImageBase: " << hex(model.image_base) << " AddressOfEntryPoint: " << hex(model.entry_rva)
         << " Subsystem: " << PeNames::subsystem(model.subsystem) << "\n\n";

    out_ << paint(StyleTag::Title, "Sections(" + std::to_string(model.sections.size()) + "):") << "\n";
    if (options_.pretty) {
        ColumnTable table({"idx", "name", "virtual_size", "virtual_address", "raw_size",
                           "raw_offset", "characteristics"});
        for (size_t i = 0; i < model.sections.size(); ++i) {
            const auto& section = model.sections[i];
            table.addRow({std::to_string(i),
                          {section.name, StyleTag::Section},
                          {hex(section.virtual_size), StyleTag::Size},
                          {hex(section.virtual_address), StyleTag::Address},
                          {hex(section.raw_size), StyleTag::Size},
                          {hex(section.raw_offset), StyleTag::Offset},
                          hex(section.characteristics)});
        }
        table.print(out_, [this](StyleTag tag, const std::string& text) { return paint(tag, text); });
    } else {
        for (size_t i = 0; i < model.sections.size(); ++i) {
            const auto& section = model.sections[i];
            out_ << indexColumn(i) << " " << paint(StyleTag::Section, padRight(section.name, 16))
                 << " VirtualSize: " << paint(StyleTag::Size, hex(section.virtual_size))
                 << " VirtualAddress: " << paint(StyleTag::Address, hex(section.virtual_address))
                 << " SizeOfRawData: " << paint(StyleTag::Size, hex(section.raw_size))
                 << " PointerToRawData: " << paint(StyleTag::Offset, hex(section.raw_offset))
                 << " Characteristics: " << hex(section.characteristics) << "\n";
        }
    }
    out_ << "\n";

    // Group imports by DLL in order of first appearance
    std::vector<std::string> dlls;
    std::map<std::string, std::vector<const PeImport*>> by_dll;
    for (const auto& imported : model.imports) {
        auto& bucket = by_dll[imported.dll];
        if (bucket.empty()) {
            dlls.push_back(imported.dll);
        }
        bucket.push_back(&imported);
    }

    out_ << paint(StyleTag::Title, "Imports(" + std::to_string(model.imports.size()) + "):") << "\n";
    for (const auto& dll : dlls) {
        const auto& entries = by_dll[dll];
        out_ << "  " << paint(StyleTag::Library, dll) << "(" << entries.size() << ")\n";
        for (const PeImport* imported : entries) {
            out_ << paint(StyleTag::Address, address(imported->iat_rva)) << " ";
            if (imported->by_ordinal) {
                out_ << "ordinal " << imported->ordinal;
            } else {
                out_ << paint(StyleTag::Name, name(imported->name)) << " (hint: " << imported->hint
                     << ")";
            }
            out_ << "\n";
        }
    }
    out_ << "\n";

    out_ << paint(StyleTag::Title, "Exports(" + std::to_string(model.exports.size()) + "):") << "\n";
    for (const auto& exported : model.exports) {
        out_ << paint(StyleTag::Address, address(exported.rva)) << " "
             << paint(StyleTag::Name, exported.name.empty() ? "<ordinal>" : name(exported.name))
             << " ordinal: " << exported.ordinal;
        if (exported.forwarder) {
            out_ << " -> " << paint(StyleTag::Library, *exported.forwarder);
        }
        out_ << "\n";
    }
    out_ << "\n";

    printLibraries(model.libraries);

    out_ << "Name: " << (model.export_name ? *model.export_name : "None") << "\n";
    out_ << "is_64: " << boolText(model.is_64) << "\n";
    out_ << "is_lib: " << boolText(model.is_lib) << "\n";
    out_ << "entry: " << paint(StyleTag::Address, hex(model.image_base + model.entry_rva)) << "\n";
}

// ============================================================================
// Archive
// ============================================================================

void ReportPrinter::printArchive(const ArchiveModel& model) {
    out_ << paint(StyleTag::Title, "Archive") << "\n\n";

    std::map<uint64_t, std::string> member_names;
    out_ << paint(StyleTag::Title, "Members(" + std::to_string(model.members.size()) + "):") << "\n";
    for (size_t i = 0; i < model.members.size(); ++i) {
        const auto& member = model.members[i];
        member_names[member.header_offset] = member.name;
        std::ostringstream mode;
        mode << "0o" << std::oct << member.mode;
        out_ << indexColumn(i) << " " << paint(StyleTag::Name, padRight(member.name, 24))
             << " offset: " << paint(StyleTag::Offset, hex(member.data_offset))
             << " size: " << paint(StyleTag::Size, std::to_string(member.size))
             << " date: " << member.date << " uid: " << member.uid << " gid: " << member.gid
             << " mode: " << mode.str() << "\n";
    }
    out_ << "\n";

    out_ << paint(StyleTag::Title, "Symbol Index(" + std::to_string(model.symbols.size()) + "):")
         << "\n";
    for (const auto& symbol : model.symbols) {
        auto member = member_names.find(symbol.member_offset);
        out_ << paint(StyleTag::Offset, address(symbol.member_offset)) << " "
             << paint(StyleTag::Name, name(symbol.name)) << " -> "
             << (member != member_names.end() ? member->second
                                              : paint(StyleTag::Bad, hex(symbol.member_offset)))
             << "\n";
    }
    out_ << "\n";
}

// ============================================================================
// Ranges and matches
// ============================================================================

void ReportPrinter::printRanges(const std::vector<Range>& ranges) {
    out_ << paint(StyleTag::Title, "Ranges(" + std::to_string(ranges.size()) + "):") << "\n";
    for (size_t i = 0; i < ranges.size(); ++i) {
        const Range& range = ranges[i];
        out_ << indexColumn(i) << " " << paint(styleTag(range.kind), padRight(toString(range.kind), 14))
             << " " << padRight(range.name + "(" + std::to_string(range.index) + ")", 24)
             << " file_offset: " << paint(StyleTag::Offset, hex(range.file_offset))
             << " file_size: " << paint(StyleTag::Size, hex(range.file_size)) << " vaddr: "
             << (range.virtual_address ? paint(StyleTag::Address, hex(*range.virtual_address))
                                       : std::string("none"))
             << "\n";
    }
    out_ << "\n";
}

void ReportPrinter::printMatches(const std::string& label, const std::vector<MatchReport>& reports) {
    out_ << "Matches for " << paint(StyleTag::Name, "\"" + label + "\"") << ":\n";
    for (const auto& report : reports) {
        out_ << "  " << paint(StyleTag::Offset, hex(report.offset)) << "\n";
        for (const auto& located : report.ranges) {
            const Range& range = located.range;
            out_ << "  ├──"
                 << paint(styleTag(range.kind), range.name + "(" + std::to_string(range.index) + ")");
            if (located.normalized_address) {
                out_ << " ∈ " << paint(StyleTag::Address, hex(*located.normalized_address));
            } else {
                out_ << " @ " << paint(StyleTag::Offset, hex(report.offset));
            }
            out_ << "\n";
        }
    }
    out_ << "\n";
}

// ============================================================================
// JSON
// ============================================================================

std::string ReportPrinter::jsonEscape(const std::string& text) {
    std::ostringstream oss;
    for (char c : text) {
        switch (c) {
            case '"':
                oss << "\\\"";
                break;
            case '\\':
                oss << "\\\\";
                break;
            case '\n':
                oss << "\\n";
                break;
            case '\r':
                oss << "\\r";
                break;
            case '\t':
                oss << "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c)) << std::dec
                        << std::setfill(' ');
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void ReportPrinter::printJson(const std::string& file,
                              BinaryFormat format,
                              const std::vector<Range>& ranges,
                              const std::optional<std::string>& label,
                              const std::vector<MatchReport>& reports) {
    auto optionalNumber = [](const std::optional<uint64_t>& value) {
        return value ? std::to_string(*value) : std::string("null");
    };

    out_ << "{\n";
    out_ << "  \"file\": \"" << jsonEscape(file) << "\",\n";
    out_ << "  \"format\": \"" << FormatDetector::formatName(format) << "\",\n";
    out_ << "  \"ranges\": [";
    for (size_t i = 0; i < ranges.size(); ++i) {
        const Range& range = ranges[i];
        out_ << (i == 0 ? "\n" : ",\n");
        out_ << "    {\"kind\": \"" << toString(range.kind) << "\", \"name\": \""
             << jsonEscape(range.name) << "\", \"index\": " << range.index
             << ", \"file_offset\": " << range.file_offset << ", \"file_size\": " << range.file_size
             << ", \"virtual_address\": " << optionalNumber(range.virtual_address) << "}";
    }
    out_ << (ranges.empty() ? "]" : "\n  ]");

    if (label) {
        out_ << ",\n  \"search\": \"" << jsonEscape(*label) << "\",\n";
        out_ << "  \"matches\": [";
        for (size_t i = 0; i < reports.size(); ++i) {
            const MatchReport& report = reports[i];
            out_ << (i == 0 ? "\n" : ",\n");
            out_ << "    {\"offset\": " << report.offset << ", \"ranges\": [";
            for (size_t j = 0; j < report.ranges.size(); ++j) {
                const LocatedRange& located = report.ranges[j];
                out_ << (j == 0 ? "" : ", ") << "{\"kind\": \"" << toString(located.range.kind)
                     << "\", \"name\": \"" << jsonEscape(located.range.name)
                     << "\", \"index\": " << located.range.index
                     << ", \"normalized_address\": " << optionalNumber(located.normalized_address)
                     << "}";
            }
            out_ << "]}";
        }
        out_ << (reports.empty() ? "]" : "\n  ]");
    }
    out_ << "\n}\n";
}
