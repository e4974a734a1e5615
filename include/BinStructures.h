/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/**
 * @file BinStructures.h
 * @brief Core data structures shared by the format decoders and the correlation engine
 *
 * This file defines the fundamental value types used throughout bintk:
 *
 * ## Structure Categories:
 * 1. **Correlation Structures**: Range, LocatedRange and MatchReport, the
 *    format-independent view of a binary's layout
 * 2. **Cross-Reference Structures**: SymbolRef and RelocationRef, fully named
 *    records produced from raw symbol and relocation tables
 * 3. **Format Models**: decoded ELF, Mach-O, PE and archive structures
 *
 * ## Design Philosophy:
 * - **Read-only values**: everything here is computed once from the loaded file
 *   and never mutated afterwards
 * - **Arena plus index**: string tables are kept as byte blobs and referenced by
 *   offset, so an out-of-range reference is detected instead of dereferenced
 * - **Anomalies as data**: malformed names and indices are carried as sentinel
 *   text rather than thrown
 *
 * @see StructuralModelAdapter.h for how format models become Ranges
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

/// Placeholder rendered for names whose bytes cannot be decoded
constexpr const char* UNREADABLE_NAME = "<unreadable>";

// ============================================================================
// Format Identification
// ============================================================================

/**
 * @brief Container format detected from the leading bytes of a file
 */
enum class BinaryFormat : uint8_t {
    Unknown,  ///< Magic not recognized
    Elf,      ///< ELF object, executable or shared object
    MachO,    ///< Single-architecture Mach-O image
    MachFat,  ///< Universal (fat) Mach-O container
    PE,       ///< PE/COFF image (MZ stub)
    Archive   ///< Unix ar static archive
};

// ============================================================================
// Correlation Structures
// ============================================================================

/**
 * @brief Kind of structural entity a Range was derived from
 */
enum class RangeKind : uint8_t {
    Segment,        ///< Mach-O segment file data
    Section,        ///< ELF or Mach-O section
    ProgramHeader,  ///< ELF program header
    LoadCommand     ///< Mach-O load command bytes
};

/**
 * @brief Display name for a range kind
 */
inline const char* toString(RangeKind kind) {
    switch (kind) {
        case RangeKind::Segment:
            return "Segment";
        case RangeKind::Section:
            return "Section";
        case RangeKind::ProgramHeader:
            return "ProgramHeader";
        case RangeKind::LoadCommand:
            return "LoadCommand";
    }
    return "Unknown";
}

/**
 * @brief A named, typed byte interval of the input file
 *
 * Covers `[file_offset, file_offset + file_size)`. A zero-sized range never
 * contains any offset. Ranges of different kinds may overlap.
 */
struct Range {
    RangeKind kind = RangeKind::Section;
    std::string name;                         ///< Display label, or UNREADABLE_NAME
    uint64_t file_offset = 0;                 ///< First byte covered
    uint64_t file_size = 0;                   ///< Number of bytes covered
    std::optional<uint64_t> virtual_address;  ///< Base address, absent when unmapped
    size_t index = 0;                         ///< Position within the originating table

    /**
     * @brief Half-open containment test
     * @param offset Raw file offset
     * @return true if file_offset <= offset < file_offset + file_size
     */
    bool contains(uint64_t offset) const {
        return offset >= file_offset && offset - file_offset < file_size;
    }

    bool operator==(const Range& other) const {
        return kind == other.kind && name == other.name && file_offset == other.file_offset &&
               file_size == other.file_size && virtual_address == other.virtual_address &&
               index == other.index;
    }

    bool operator!=(const Range& other) const {
        return !(*this == other);
    }
};

/**
 * @brief A range containing a queried offset, with the offset's mapped address
 */
struct LocatedRange {
    Range range;
    std::optional<uint64_t> normalized_address;  ///< Absent when range is unmapped
};

/**
 * @brief One pattern match and every range that contains it
 */
struct MatchReport {
    uint64_t offset = 0;
    std::vector<LocatedRange> ranges;  ///< In build order; innermost last
};

// ============================================================================
// Cross-Reference Structures
// ============================================================================

/**
 * @brief Symbol binding, normalized across formats
 */
enum class SymbolBinding : uint8_t {
    Local,
    Global,
    Weak,
    Other
};

/**
 * @brief Symbol type, normalized across formats
 */
enum class SymbolKind : uint8_t {
    Object,
    Function,
    IndirectFunction,
    Section,
    Other
};

/**
 * @brief Resolved identity of a symbol table entry
 */
struct SymbolRef {
    uint64_t value = 0;
    uint64_t size = 0;
    SymbolBinding binding = SymbolBinding::Other;
    SymbolKind type = SymbolKind::Other;
    uint8_t raw_binding = 0;     ///< Format value, used for display
    uint8_t raw_type = 0;        ///< Format value, used for display
    uint8_t other = 0;           ///< Visibility byte
    uint32_t section_index = 0;  ///< Raw section index
    std::string name;            ///< Symbol name; section name for anonymous section symbols
    std::string owning_section;  ///< "", "name(idx)", "ABS" or "BAD_IDX(n)"
};

/**
 * @brief A relocation entry resolved against its symbol
 */
struct RelocationRef {
    uint64_t offset = 0;
    uint32_t type = 0;
    std::string type_name;
    uint32_t symbol_index = 0;
    std::string symbol_name;  ///< Never empty: falls back to section name or "ABS"
    int64_t addend = 0;
    std::string addend_text;  ///< Empty for a zero addend, else "+0x.." or "-0x.."
};

// ============================================================================
// String Table Arena
// ============================================================================

/**
 * @brief Immutable string table addressed by byte offset
 *
 * Names are looked up by offset into the raw table bytes. A lookup that starts
 * outside the table or runs off its end without a terminator yields no value.
 */
class StringTable {
public:
    StringTable() = default;
    explicit StringTable(std::vector<char> bytes) : bytes_(std::move(bytes)) {}

    /**
     * @brief Look up the NUL-terminated string starting at an offset
     * @param offset Byte offset into the table
     * @return The string, or std::nullopt if it cannot be read
     */
    std::optional<std::string> lookup(uint64_t offset) const {
        if (offset >= bytes_.size()) {
            return std::nullopt;
        }
        const char* begin = bytes_.data() + offset;
        const void* terminator = std::memchr(begin, '\0', bytes_.size() - offset);
        if (terminator == nullptr) {
            return std::nullopt;
        }
        return std::string(begin, static_cast<const char*>(terminator));
    }

    /**
     * @brief Look up a name, substituting the unreadable placeholder on failure
     */
    std::string nameAt(uint64_t offset) const {
        auto name = lookup(offset);
        return name ? *name : std::string(UNREADABLE_NAME);
    }

    size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }

private:
    std::vector<char> bytes_;
};

// ============================================================================
// ELF Model
// ============================================================================

struct ElfHeaderInfo {
    uint8_t elf_class = 0;  ///< ELFCLASS32 / ELFCLASS64
    uint8_t data = 0;       ///< ELFDATA2LSB / ELFDATA2MSB
    uint16_t type = 0;
    uint16_t machine = 0;
    uint32_t version = 0;
    uint64_t entry = 0;
    uint64_t phoff = 0;
    uint64_t shoff = 0;
    uint32_t flags = 0;
    uint16_t ehsize = 0;
    uint16_t phentsize = 0;
    size_t phnum = 0;  ///< Extended count (PN_XNUM resolved)
    uint16_t shentsize = 0;
    size_t shnum = 0;     ///< Extended count (SHN_UNDEF resolved)
    size_t shstrndx = 0;  ///< Extended index (SHN_XINDEX resolved)
};

struct ElfProgramHeader {
    uint32_t type = 0;
    uint32_t flags = 0;
    uint64_t offset = 0;
    uint64_t vaddr = 0;
    uint64_t paddr = 0;
    uint64_t filesz = 0;
    uint64_t memsz = 0;
    uint64_t align = 0;
};

struct ElfSectionHeader {
    std::string name;  ///< Resolved through the section name table
    uint32_t name_offset = 0;
    uint32_t type = 0;
    uint64_t flags = 0;
    uint64_t addr = 0;
    uint64_t offset = 0;
    uint64_t size = 0;
    uint32_t link = 0;
    uint32_t info = 0;
    uint64_t addralign = 0;
    uint64_t entsize = 0;
};

struct ElfSymbol {
    uint32_t name = 0;  ///< Offset into the associated string table
    uint8_t info = 0;
    uint8_t other = 0;
    uint32_t shndx = 0;  ///< Extended index already applied
    uint64_t value = 0;
    uint64_t size = 0;

    uint8_t bind() const { return static_cast<uint8_t>(info >> 4); }
    uint8_t type() const { return static_cast<uint8_t>(info & 0xf); }
};

struct ElfRelocation {
    uint64_t offset = 0;
    uint32_t sym = 0;
    uint32_t type = 0;
    int64_t addend = 0;
    bool is_rela = false;
};

/**
 * @brief Relocations of one SHT_REL/SHT_RELA section, keyed by the section they patch
 */
struct ElfSectionRelocations {
    size_t section_index = 0;  ///< The relocation section itself
    uint32_t target_index = 0; ///< sh_info: section being relocated
    std::vector<ElfRelocation> relocations;
};

struct ElfDynamicEntry {
    int64_t tag = 0;
    uint64_t value = 0;
};

/**
 * @brief Complete decoded view of an ELF file
 */
struct ElfModel {
    ElfHeaderInfo header;
    bool is_64 = false;
    bool little_endian = true;
    bool is_lib = false;
    uint64_t entry = 0;

    std::vector<ElfProgramHeader> program_headers;
    std::vector<ElfSectionHeader> section_headers;

    std::vector<ElfSymbol> symbols;          ///< .symtab
    StringTable symbol_strings;              ///< .strtab
    std::vector<ElfSymbol> dynamic_symbols;  ///< .dynsym
    StringTable dynamic_strings;             ///< .dynstr

    std::vector<ElfRelocation> dynamic_relas;
    std::vector<ElfRelocation> dynamic_rels;
    std::vector<ElfRelocation> plt_relocations;
    std::vector<ElfSectionRelocations> section_relocations;

    std::optional<std::vector<ElfDynamicEntry>> dynamic;
    std::vector<std::string> libraries;
    std::optional<std::string> soname;
    std::optional<std::string> interpreter;
};

// ============================================================================
// Mach-O Model
// ============================================================================

struct MachOHeaderInfo {
    uint32_t magic = 0;
    uint32_t cputype = 0;
    uint32_t cpusubtype = 0;
    uint32_t filetype = 0;
    uint32_t ncmds = 0;
    uint32_t sizeofcmds = 0;
    uint32_t flags = 0;
};

struct MachOLoadCommand {
    uint32_t cmd = 0;
    uint32_t cmdsize = 0;
    uint64_t offset = 0;  ///< Absolute file offset of the command
};

struct MachOSection {
    std::optional<std::string> name;          ///< Absent when the name bytes are malformed
    std::optional<std::string> segment_name;
    uint64_t addr = 0;
    uint64_t size = 0;
    uint64_t offset = 0;     ///< Absolute file offset (0 for zero-fill)
    uint32_t align = 0;
    uint64_t reloff = 0;     ///< Absolute file offset of relocations
    uint32_t nreloc = 0;
    uint32_t flags = 0;
    uint64_t file_size = 0;  ///< Bytes actually present in the file

    /// S_ZEROFILL, S_GB_ZEROFILL and S_THREAD_LOCAL_ZEROFILL occupy no file bytes
    bool isZeroFill() const {
        uint32_t type = flags & 0xffu;
        return type == 0x01 || type == 0x0c || type == 0x12;
    }
};

struct MachOSegment {
    std::optional<std::string> name;
    uint64_t vmaddr = 0;
    uint64_t vmsize = 0;
    uint64_t fileoff = 0;  ///< Absolute file offset
    uint64_t filesize = 0;
    uint32_t maxprot = 0;
    uint32_t initprot = 0;
    uint32_t flags = 0;
    size_t command_index = 0;  ///< Index of the defining load command
    std::vector<MachOSection> sections;
};

struct MachOSymbol {
    std::string name;
    uint8_t type = 0;
    uint8_t sect = 0;
    uint16_t desc = 0;
    uint64_t value = 0;
};

struct MachOExport {
    std::string name;
    uint64_t address = 0;  ///< Image base plus trie offset
    uint64_t flags = 0;
    std::optional<std::string> reexport_from;
};

struct MachOImport {
    std::string name;
    std::string dylib;
    uint64_t address = 0;
    int64_t addend = 0;
    bool lazy = false;
    bool weak = false;
};

/**
 * @brief Complete decoded view of a single-architecture Mach-O image
 */
struct MachOModel {
    MachOHeaderInfo header;
    bool is_64 = false;
    bool little_endian = true;
    uint64_t slice_offset = 0;  ///< Offset of this image inside a fat file
    uint64_t entry = 0;
    std::optional<std::string> name;     ///< LC_ID_DYLIB install name
    std::vector<std::string> libraries;  ///< Dependent dylibs, in load order

    std::vector<MachOLoadCommand> load_commands;
    std::vector<MachOSegment> segments;
    std::vector<MachOSymbol> symbols;
    std::vector<MachOExport> exports;
    std::vector<MachOImport> imports;

    /// Non-fatal decoding problems (malformed export trie or bind stream)
    std::vector<std::string> warnings;
};

struct MachOFatArch {
    uint32_t cputype = 0;
    uint32_t cpusubtype = 0;
    uint64_t offset = 0;
    uint64_t size = 0;
    uint32_t align = 0;
};

// ============================================================================
// PE Model
// ============================================================================

struct PeSection {
    std::string name;
    uint32_t virtual_size = 0;
    uint32_t virtual_address = 0;
    uint32_t raw_size = 0;
    uint32_t raw_offset = 0;
    uint32_t characteristics = 0;
};

struct PeImport {
    std::string dll;
    std::string name;  ///< Empty when imported by ordinal
    uint16_t ordinal = 0;
    uint16_t hint = 0;
    bool by_ordinal = false;
    uint64_t iat_rva = 0;  ///< RVA of the import address table slot
};

struct PeExport {
    std::string name;  ///< Empty for ordinal-only exports
    uint32_t ordinal = 0;
    uint32_t rva = 0;
    std::optional<std::string> forwarder;
};

/**
 * @brief Decoded view of a PE/COFF image
 */
struct PeModel {
    uint16_t machine = 0;
    uint16_t characteristics = 0;
    uint32_t timestamp = 0;
    bool is_64 = false;
    bool is_lib = false;
    uint64_t image_base = 0;
    uint32_t entry_rva = 0;
    uint16_t subsystem = 0;
    std::vector<PeSection> sections;
    std::vector<PeImport> imports;
    std::vector<PeExport> exports;
    std::optional<std::string> export_name;
    std::vector<std::string> libraries;
};

// ============================================================================
// Archive Model
// ============================================================================

struct ArchiveMember {
    std::string name;
    uint64_t header_offset = 0;
    uint64_t data_offset = 0;
    uint64_t size = 0;
    int64_t date = 0;
    uint32_t uid = 0;
    uint32_t gid = 0;
    uint32_t mode = 0;
};

struct ArchiveSymbol {
    std::string name;
    uint64_t member_offset = 0;  ///< Header offset of the defining member
};

struct ArchiveModel {
    std::vector<ArchiveMember> members;
    std::vector<ArchiveSymbol> symbols;
};
