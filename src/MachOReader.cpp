/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "MachOReader.h"
#include <cstring>
#include <optional>
#include <set>
#include <sstream>
#include <utility>
#include <vector>
#include "BinExceptions.h"
#include "BinMemoryValidator.h"
#include "MachOFormat.h"

using BinReaderExceptions::BinaryFileError;
using BinReaderExceptions::BinaryParsingError;
using BinReaderExceptions::MemoryAccessError;
using BinReaderExceptions::UnsupportedFormatError;
using BinReaderUtils::BinMemoryValidator;
using BinReaderUtils::SafeArithmetic;
namespace MemoryConstants = BinReaderUtils::MemoryConstants;
using namespace MachOFormat;

namespace {

std::string hex(uint64_t value) {
    std::ostringstream oss;
    oss << "0x" << std::hex << value;
    return oss.str();
}

/**
 * @brief dyld_info_command fields needed for imports and exports
 */
struct DyldInfo {
    uint32_t bind_off = 0;
    uint32_t bind_size = 0;
    uint32_t weak_bind_off = 0;
    uint32_t weak_bind_size = 0;
    uint32_t lazy_bind_off = 0;
    uint32_t lazy_bind_size = 0;
    uint32_t export_off = 0;
    uint32_t export_size = 0;
};

/**
 * @brief Decoder state for one Mach-O image
 *
 * Offsets recorded in the model are relative to the start of the image; the
 * caller rebases them for fat slices.
 */
class ImageDecoder {
public:
    ImageDecoder(const uint8_t* data, size_t size, const std::string& filename)
        : image_(data, size, filename), filename_(filename) {}

    MachOModel decode() {
        readHeader();
        readLoadCommands();
        resolveEntry();

        try {
            if (export_trie_) {
                readExports(export_trie_->first, export_trie_->second);
            }
        } catch (const BinaryParsingError& e) {
            model_.exports.clear();
            model_.warnings.push_back(std::string("export trie: ") + e.what());
        }

        try {
            if (dyld_info_) {
                readBinds(dyld_info_->bind_off, dyld_info_->bind_size, false);
                readBinds(dyld_info_->lazy_bind_off, dyld_info_->lazy_bind_size, true);
            } else {
                readUndefinedSymbols();
            }
        } catch (const BinaryParsingError& e) {
            model_.imports.clear();
            model_.warnings.push_back(std::string("bind opcodes: ") + e.what());
        }

        return std::move(model_);
    }

private:
    BinMemoryValidator image_;
    std::string filename_;
    MachOModel model_;
    uint64_t header_size_ = 0;
    std::optional<DyldInfo> dyld_info_;
    std::optional<std::pair<uint64_t, uint64_t>> export_trie_;
    std::optional<uint64_t> main_entryoff_;
    std::optional<uint64_t> thread_pc_;

    // ========================================================================
    // Header and load commands
    // ========================================================================

    void readHeader() {
        uint32_t magic = image_.readU32(0, "Mach-O magic");
        switch (magic) {
            case MH_MAGIC:
                model_.is_64 = false;
                model_.little_endian = true;
                break;
            case MH_MAGIC_64:
                model_.is_64 = true;
                model_.little_endian = true;
                break;
            case MH_CIGAM:
                model_.is_64 = false;
                model_.little_endian = false;
                break;
            case MH_CIGAM_64:
                model_.is_64 = true;
                model_.little_endian = false;
                break;
            default:
                throw BinaryFileError::invalidFormat("Mach-O magic " + hex(magic), filename_);
        }
        image_.setLittleEndian(model_.little_endian);

        header_size_ = model_.is_64 ? MACH_HEADER_64_SIZE : MACH_HEADER_SIZE;
        image_.validateRange(0, header_size_, "mach_header");

        MachOHeaderInfo& header = model_.header;
        header.magic = image_.readU32(0);
        header.cputype = image_.readU32(4);
        header.cpusubtype = image_.readU32(8);
        header.filetype = image_.readU32(12);
        header.ncmds = image_.readU32(16);
        header.sizeofcmds = image_.readU32(20);
        header.flags = image_.readU32(24);
    }

    void readLoadCommands() {
        const MachOHeaderInfo& header = model_.header;
        if (header.ncmds > MemoryConstants::MAX_LOAD_COMMANDS) {
            throw BinaryFileError::invalidFormat(
                "load command count " + std::to_string(header.ncmds), filename_);
        }
        image_.validateRange(header_size_, header.sizeofcmds, "load commands");

        uint64_t cursor = header_size_;
        uint64_t end = header_size_ + header.sizeofcmds;
        model_.load_commands.reserve(header.ncmds);

        for (uint32_t i = 0; i < header.ncmds; ++i) {
            if (end - cursor < LOAD_COMMAND_SIZE) {
                throw BinaryFileError::invalidFormat(
                    "load command " + std::to_string(i) + ": header beyond sizeofcmds", filename_);
            }
            uint32_t cmd = image_.readU32(cursor, "load_command.cmd");
            uint32_t cmdsize = image_.readU32(cursor + 4, "load_command.cmdsize");
            if (cmdsize < LOAD_COMMAND_SIZE || cmdsize > end - cursor) {
                throw BinaryFileError::invalidFormat("load command " + std::to_string(i) +
                                                         ": cmdsize " + hex(cmdsize) +
                                                         " overruns the command area",
                                                     filename_);
            }

            model_.load_commands.push_back({cmd, cmdsize, cursor});
            readLoadCommand(cmd, cursor, cmdsize, i);
            cursor += cmdsize;
        }
    }

    void readLoadCommand(uint32_t cmd, uint64_t offset, uint32_t cmdsize, size_t index) {
        switch (cmd) {
            case LC_SEGMENT:
            case LC_SEGMENT_64:
                readSegment(cmd == LC_SEGMENT_64, offset, cmdsize, index);
                break;
            case LC_SYMTAB:
                readSymtab(offset, cmdsize);
                break;
            case LC_LOAD_DYLIB:
            case LC_LOAD_WEAK_DYLIB:
            case LC_REEXPORT_DYLIB:
            case LC_LAZY_LOAD_DYLIB:
            case LC_LOAD_UPWARD_DYLIB:
                model_.libraries.push_back(commandString(offset, cmdsize));
                break;
            case LC_ID_DYLIB:
                model_.name = commandString(offset, cmdsize);
                break;
            case LC_MAIN:
                requireSize(cmdsize, 24, "entry_point_command");
                main_entryoff_ = image_.readU64(offset + 8, "entryoff");
                break;
            case LC_UNIXTHREAD:
                readThreadState(offset, cmdsize);
                break;
            case LC_DYLD_INFO:
            case LC_DYLD_INFO_ONLY:
                readDyldInfo(offset, cmdsize);
                break;
            case LC_DYLD_EXPORTS_TRIE:
                requireSize(cmdsize, 16, "linkedit_data_command");
                export_trie_ = std::make_pair(static_cast<uint64_t>(image_.readU32(offset + 8)),
                                              static_cast<uint64_t>(image_.readU32(offset + 12)));
                break;
            default:
                break;
        }
    }

    void requireSize(uint32_t cmdsize, uint32_t minimum, const char* what) const {
        if (cmdsize < minimum) {
            throw BinaryFileError::invalidFormat(
                std::string(what) + " with cmdsize " + std::to_string(cmdsize), filename_);
        }
    }

    void readSegment(bool is_64, uint64_t offset, uint32_t cmdsize, size_t index) {
        size_t fixed_size = is_64 ? SEGMENT_COMMAND_64_SIZE : SEGMENT_COMMAND_SIZE;
        size_t section_size = is_64 ? SECTION_64_SIZE : SECTION_SIZE;
        requireSize(cmdsize, static_cast<uint32_t>(fixed_size), "segment_command");

        MachOSegment segment;
        segment.command_index = index;
        segment.name = image_.readFixedName(offset + 8, NAME_FIELD_SIZE, "segname");

        uint32_t nsects = 0;
        if (is_64) {
            segment.vmaddr = image_.readU64(offset + 24);
            segment.vmsize = image_.readU64(offset + 32);
            segment.fileoff = image_.readU64(offset + 40);
            segment.filesize = image_.readU64(offset + 48);
            segment.maxprot = image_.readU32(offset + 56);
            segment.initprot = image_.readU32(offset + 60);
            nsects = image_.readU32(offset + 64);
            segment.flags = image_.readU32(offset + 68);
        } else {
            segment.vmaddr = image_.readU32(offset + 24);
            segment.vmsize = image_.readU32(offset + 28);
            segment.fileoff = image_.readU32(offset + 32);
            segment.filesize = image_.readU32(offset + 36);
            segment.maxprot = image_.readU32(offset + 40);
            segment.initprot = image_.readU32(offset + 44);
            nsects = image_.readU32(offset + 48);
            segment.flags = image_.readU32(offset + 52);
        }

        if (nsects > (cmdsize - fixed_size) / section_size) {
            throw BinaryFileError::invalidFormat(
                "segment with " + std::to_string(nsects) + " sections in cmdsize " +
                    std::to_string(cmdsize),
                filename_);
        }

        segment.sections.reserve(nsects);
        for (uint32_t i = 0; i < nsects; ++i) {
            uint64_t s = offset + fixed_size + static_cast<uint64_t>(i) * section_size;
            MachOSection section;
            section.name = image_.readFixedName(s, NAME_FIELD_SIZE, "sectname");
            section.segment_name = image_.readFixedName(s + 16, NAME_FIELD_SIZE, "segname");
            if (is_64) {
                section.addr = image_.readU64(s + 32);
                section.size = image_.readU64(s + 40);
                section.offset = image_.readU32(s + 48);
                section.align = image_.readU32(s + 52);
                section.reloff = image_.readU32(s + 56);
                section.nreloc = image_.readU32(s + 60);
                section.flags = image_.readU32(s + 64);
            } else {
                section.addr = image_.readU32(s + 32);
                section.size = image_.readU32(s + 36);
                section.offset = image_.readU32(s + 40);
                section.align = image_.readU32(s + 44);
                section.reloff = image_.readU32(s + 48);
                section.nreloc = image_.readU32(s + 52);
                section.flags = image_.readU32(s + 56);
            }
            section.file_size = section.isZeroFill() ? 0 : section.size;
            segment.sections.push_back(std::move(section));
        }

        model_.segments.push_back(std::move(segment));
    }

    void readSymtab(uint64_t offset, uint32_t cmdsize) {
        requireSize(cmdsize, 24, "symtab_command");
        uint32_t symoff = image_.readU32(offset + 8);
        uint32_t nsyms = image_.readU32(offset + 12);
        uint32_t stroff = image_.readU32(offset + 16);
        uint32_t strsize = image_.readU32(offset + 20);

        if (nsyms > MemoryConstants::MAX_TABLE_ENTRIES) {
            throw BinaryFileError::invalidFormat("symbol count " + std::to_string(nsyms), filename_);
        }
        size_t entry_size = model_.is_64 ? NLIST_64_SIZE : NLIST_SIZE;
        image_.validateRange(symoff, SafeArithmetic::safeMultiply(nsyms, entry_size), "nlist table");
        image_.validateRange(stroff, strsize, "symbol string table");

        const char* strings = reinterpret_cast<const char*>(image_.getData()) + stroff;
        StringTable string_table(std::vector<char>(strings, strings + strsize));

        model_.symbols.reserve(nsyms);
        for (uint32_t i = 0; i < nsyms; ++i) {
            uint64_t entry = symoff + static_cast<uint64_t>(i) * entry_size;
            MachOSymbol symbol;
            uint32_t strx = image_.readU32(entry);
            symbol.type = image_.readU8(entry + 4);
            symbol.sect = image_.readU8(entry + 5);
            symbol.desc = image_.readU16(entry + 6);
            symbol.value = image_.readWord(entry + 8, model_.is_64);
            symbol.name = string_table.nameAt(strx);
            model_.symbols.push_back(std::move(symbol));
        }
    }

    /**
     * @brief Read an lc_str embedded in a load command
     * @return The string, or UNREADABLE_NAME if it escapes the command
     */
    std::string commandString(uint64_t offset, uint32_t cmdsize) const {
        if (cmdsize < 12) {
            return UNREADABLE_NAME;
        }
        uint32_t name_offset = image_.readU32(offset + 8, "lc_str.offset");
        if (name_offset >= cmdsize) {
            return UNREADABLE_NAME;
        }
        const char* begin = reinterpret_cast<const char*>(image_.getData()) + offset + name_offset;
        size_t limit = cmdsize - name_offset;
        if (std::memchr(begin, '\0', limit) == nullptr) {
            return UNREADABLE_NAME;
        }
        return std::string(begin);
    }

    void readThreadState(uint64_t offset, uint32_t cmdsize) {
        requireSize(cmdsize, 16, "thread_command");
        uint32_t flavor = image_.readU32(offset + 8);
        uint64_t state = offset + 16;
        uint64_t command_end = offset + cmdsize;

        // Program counter position within the first thread state
        uint64_t pc_offset = 0;
        size_t width = 0;
        if (model_.header.cputype == CPU_TYPE_X86_64 && flavor == x86_THREAD_STATE64) {
            pc_offset = 16 * 8;  // rip
            width = 8;
        } else if (model_.header.cputype == CPU_TYPE_X86 && flavor == x86_THREAD_STATE32) {
            pc_offset = 10 * 4;  // eip
            width = 4;
        } else if (model_.header.cputype == CPU_TYPE_ARM64 && flavor == ARM_THREAD_STATE64) {
            pc_offset = 32 * 8;  // x0-x28, fp, lr, sp, pc
            width = 8;
        } else if (model_.header.cputype == CPU_TYPE_ARM && flavor == ARM_THREAD_STATE) {
            pc_offset = 15 * 4;  // r0-r12, sp, lr, pc
            width = 4;
        } else {
            return;
        }

        if (state + pc_offset + width > command_end) {
            return;
        }
        thread_pc_ = image_.readWord(state + pc_offset, width == 8, "thread pc");
    }

    void readDyldInfo(uint64_t offset, uint32_t cmdsize) {
        requireSize(cmdsize, 48, "dyld_info_command");
        DyldInfo info;
        info.bind_off = image_.readU32(offset + 16);
        info.bind_size = image_.readU32(offset + 20);
        info.weak_bind_off = image_.readU32(offset + 24);
        info.weak_bind_size = image_.readU32(offset + 28);
        info.lazy_bind_off = image_.readU32(offset + 32);
        info.lazy_bind_size = image_.readU32(offset + 36);
        info.export_off = image_.readU32(offset + 40);
        info.export_size = image_.readU32(offset + 44);
        dyld_info_ = info;
        if (info.export_size != 0) {
            export_trie_ = std::make_pair(static_cast<uint64_t>(info.export_off),
                                          static_cast<uint64_t>(info.export_size));
        }
    }

    // ========================================================================
    // Entry point and library ordinals
    // ========================================================================

    uint64_t textBase() const {
        for (const auto& segment : model_.segments) {
            if (segment.name && *segment.name == "__TEXT") {
                return segment.vmaddr;
            }
        }
        return 0;
    }

    void resolveEntry() {
        if (main_entryoff_) {
            model_.entry = textBase() + *main_entryoff_;
        } else if (thread_pc_) {
            model_.entry = *thread_pc_;
        }
    }

    /**
     * @brief Name of the dylib a library ordinal refers to
     *
     * Positive ordinals index the dependent library list starting at 1; zero
     * and the negative specials refer to the image itself or to flat lookup.
     */
    std::string dylibForOrdinal(int64_t ordinal) const {
        if (ordinal > 0 && static_cast<uint64_t>(ordinal) <= model_.libraries.size()) {
            return model_.libraries[static_cast<size_t>(ordinal - 1)];
        }
        switch (ordinal) {
            case 0:
                return "self";
            case -1:
                return "main-executable";
            case -2:
                return "flat-lookup";
            case -3:
                return "weak-lookup";
            default:
                return "BAD_ORDINAL(" + std::to_string(ordinal) + ")";
        }
    }

    // ========================================================================
    // Exports
    // ========================================================================

    std::string terminatedString(uint64_t offset, uint64_t end, const char* context) const {
        image_.validateRange(offset, end - offset, context);
        const char* begin = reinterpret_cast<const char*>(image_.getData()) + offset;
        if (std::memchr(begin, '\0', end - offset) == nullptr) {
            throw MemoryAccessError(std::string("Unterminated string in ") + context,
                                    static_cast<size_t>(offset));
        }
        return std::string(begin);
    }

    /**
     * @brief Walk the export trie depth-first, in edge order
     */
    void readExports(uint64_t start, uint64_t size) {
        if (size == 0) {
            return;
        }
        image_.validateRange(start, size, "export trie");
        const uint64_t end = start + size;
        const uint64_t base = textBase();

        struct PendingNode {
            uint64_t offset;
            std::string prefix;
        };
        std::vector<PendingNode> pending{{start, std::string()}};
        std::set<uint64_t> visited;

        while (!pending.empty()) {
            PendingNode node = std::move(pending.back());
            pending.pop_back();

            if (node.offset >= end) {
                throw MemoryAccessError("Export trie node outside trie",
                                        static_cast<size_t>(node.offset));
            }
            if (!visited.insert(node.offset).second) {
                throw BinaryFileError::invalidFormat("export trie: loop at node " + hex(node.offset),
                                                     filename_);
            }

            uint64_t cursor = node.offset;
            uint64_t terminal_size = image_.readUleb128(cursor, end, "export trie");
            uint64_t children = SafeArithmetic::safeAdd(cursor, terminal_size, "export trie");
            if (children >= end) {
                throw MemoryAccessError("Export trie terminal info overruns trie",
                                        static_cast<size_t>(cursor));
            }

            if (terminal_size != 0) {
                MachOExport exported;
                exported.name = node.prefix;
                exported.flags = image_.readUleb128(cursor, children, "export flags");
                if (exported.flags & EXPORT_SYMBOL_FLAGS_REEXPORT) {
                    int64_t ordinal =
                        static_cast<int64_t>(image_.readUleb128(cursor, children, "reexport ordinal"));
                    exported.reexport_from = dylibForOrdinal(ordinal);
                } else {
                    uint64_t value = image_.readUleb128(cursor, children, "export address");
                    uint64_t kind = exported.flags & EXPORT_SYMBOL_FLAGS_KIND_MASK;
                    exported.address =
                        kind == EXPORT_SYMBOL_FLAGS_KIND_ABSOLUTE ? value : base + value;
                }
                model_.exports.push_back(std::move(exported));
            }

            cursor = children;
            uint8_t child_count = image_.readU8(cursor++, "export trie child count");
            std::vector<PendingNode> edges;
            edges.reserve(child_count);
            for (uint8_t i = 0; i < child_count; ++i) {
                std::string edge = terminatedString(cursor, end, "export trie edge");
                cursor += edge.size() + 1;
                uint64_t child = image_.readUleb128(cursor, end, "export trie child");
                std::string prefix = node.prefix + edge;
                if (prefix.size() > MemoryConstants::MAX_STRING_LENGTH) {
                    throw MemoryAccessError("Export symbol name too long",
                                            static_cast<size_t>(cursor));
                }
                edges.push_back({SafeArithmetic::safeAdd(start, child, "export trie"),
                                 std::move(prefix)});
            }
            for (auto it = edges.rbegin(); it != edges.rend(); ++it) {
                pending.push_back(std::move(*it));
            }
        }
    }

    // ========================================================================
    // Imports
    // ========================================================================

    /**
     * @brief Replay a bind or lazy bind opcode stream
     *
     * In the lazy stream BIND_OPCODE_DONE terminates each entry rather than
     * the whole stream.
     */
    void readBinds(uint64_t start, uint64_t size, bool lazy) {
        if (size == 0) {
            return;
        }
        image_.validateRange(start, size, lazy ? "lazy bind opcodes" : "bind opcodes");
        const uint64_t end = start + size;
        const uint64_t pointer_size = model_.is_64 ? 8 : 4;

        uint64_t cursor = start;
        uint64_t segment_offset = 0;
        uint8_t segment_index = 0;
        std::string symbol;
        int64_t ordinal = 0;
        int64_t addend = 0;
        bool weak = false;

        auto bind = [&]() {
            if (model_.imports.size() >= MemoryConstants::MAX_TABLE_ENTRIES) {
                throw BinaryFileError::invalidFormat("bind opcodes: too many binds", filename_);
            }
            MachOImport imported;
            imported.name = symbol;
            imported.dylib = dylibForOrdinal(ordinal);
            imported.address = segment_index < model_.segments.size()
                                   ? model_.segments[segment_index].vmaddr + segment_offset
                                   : segment_offset;
            imported.addend = addend;
            imported.lazy = lazy;
            imported.weak = weak;
            model_.imports.push_back(std::move(imported));
        };

        while (cursor < end) {
            uint8_t byte = image_.readU8(cursor++);
            uint8_t immediate = byte & BIND_IMMEDIATE_MASK;
            uint8_t opcode = byte & BIND_OPCODE_MASK;

            switch (opcode) {
                case BIND_OPCODE_DONE:
                    if (!lazy) {
                        return;
                    }
                    break;
                case BIND_OPCODE_SET_DYLIB_ORDINAL_IMM:
                    ordinal = immediate;
                    break;
                case BIND_OPCODE_SET_DYLIB_ORDINAL_ULEB:
                    ordinal = static_cast<int64_t>(image_.readUleb128(cursor, end, "dylib ordinal"));
                    break;
                case BIND_OPCODE_SET_DYLIB_SPECIAL_IMM:
                    // Special ordinals are small negative numbers
                    ordinal = immediate == 0
                                  ? 0
                                  : static_cast<int8_t>(BIND_OPCODE_MASK | immediate);
                    break;
                case BIND_OPCODE_SET_SYMBOL_TRAILING_FLAGS_IMM:
                    weak = (immediate & BIND_SYMBOL_FLAGS_WEAK_IMPORT) != 0;
                    symbol = terminatedString(cursor, end, "bind symbol name");
                    cursor += symbol.size() + 1;
                    break;
                case BIND_OPCODE_SET_TYPE_IMM:
                    // Only pointer binds are recorded; the type does not change the address
                    break;
                case BIND_OPCODE_SET_ADDEND_SLEB:
                    addend = image_.readSleb128(cursor, end, "bind addend");
                    break;
                case BIND_OPCODE_SET_SEGMENT_AND_OFFSET_ULEB:
                    segment_index = immediate;
                    segment_offset = image_.readUleb128(cursor, end, "bind segment offset");
                    break;
                case BIND_OPCODE_ADD_ADDR_ULEB:
                    segment_offset += image_.readUleb128(cursor, end, "bind address delta");
                    break;
                case BIND_OPCODE_DO_BIND:
                    bind();
                    segment_offset += pointer_size;
                    break;
                case BIND_OPCODE_DO_BIND_ADD_ADDR_ULEB:
                    bind();
                    segment_offset +=
                        image_.readUleb128(cursor, end, "bind address delta") + pointer_size;
                    break;
                case BIND_OPCODE_DO_BIND_ADD_ADDR_IMM_SCALED:
                    bind();
                    segment_offset += immediate * pointer_size + pointer_size;
                    break;
                case BIND_OPCODE_DO_BIND_ULEB_TIMES_SKIPPING_ULEB: {
                    uint64_t count = image_.readUleb128(cursor, end, "bind count");
                    uint64_t skip = image_.readUleb128(cursor, end, "bind skip");
                    if (count > MemoryConstants::MAX_TABLE_ENTRIES) {
                        throw BinaryFileError::invalidFormat(
                            "bind opcodes: repeat count " + std::to_string(count), filename_);
                    }
                    for (uint64_t i = 0; i < count; ++i) {
                        bind();
                        segment_offset += skip + pointer_size;
                    }
                    break;
                }
                case BIND_OPCODE_THREADED:
                    throw UnsupportedFormatError("Threaded bind opcodes are not supported",
                                                 filename_);
                default:
                    throw BinaryFileError::invalidFormat("bind opcode " + hex(byte), filename_);
            }
        }
    }

    /**
     * @brief Imports from undefined external nlist entries
     *
     * Used for images without dyld info, such as object files and images
     * that use chained fixups.
     */
    void readUndefinedSymbols() {
        for (const auto& symbol : model_.symbols) {
            if ((symbol.type & N_STAB) != 0 || (symbol.type & N_EXT) == 0 ||
                (symbol.type & N_TYPE) != N_UNDF || symbol.value != 0) {
                continue;
            }
            int library = getLibraryOrdinal(symbol.desc);
            int64_t ordinal = library;
            if (library == EXECUTABLE_ORDINAL) {
                ordinal = -1;
            } else if (library == DYNAMIC_LOOKUP_ORDINAL) {
                ordinal = -2;
            }

            MachOImport imported;
            imported.name = symbol.name;
            imported.dylib = dylibForOrdinal(ordinal);
            imported.weak = (symbol.desc & N_WEAK_REF) != 0;
            model_.imports.push_back(std::move(imported));
        }
    }
};

void rebase(MachOModel& model, uint64_t base) {
    model.slice_offset = base;
    for (auto& command : model.load_commands) {
        command.offset += base;
    }
    for (auto& segment : model.segments) {
        segment.fileoff += base;
        for (auto& section : segment.sections) {
            if (section.offset != 0) {
                section.offset += base;
            }
            if (section.nreloc != 0) {
                section.reloff += base;
            }
        }
    }
}

}  // namespace

// ============================================================================
// MachOReader Implementation
// ============================================================================

MachOModel MachOReader::read(const uint8_t* data, size_t size, const std::string& filename) {
    ImageDecoder decoder(data, size, filename);
    return decoder.decode();
}

std::vector<MachOFatArch> MachOReader::readFatArches(const uint8_t* data,
                                                     size_t size,
                                                     const std::string& filename) {
    BinMemoryValidator fat(data, size, filename, false);  // fat headers are big-endian
    uint32_t magic = fat.readU32(0, "fat_header.magic");
    if (magic != FAT_MAGIC && magic != FAT_MAGIC_64) {
        throw BinaryFileError::invalidFormat("fat header magic " + hex(magic), filename);
    }
    uint32_t nfat_arch = fat.readU32(4, "fat_header.nfat_arch");
    if (nfat_arch == 0 || nfat_arch >= MemoryConstants::MAX_FAT_ARCHES) {
        throw BinaryFileError::invalidFormat("fat arch count " + std::to_string(nfat_arch),
                                             filename);
    }

    const bool is_64 = magic == FAT_MAGIC_64;
    const size_t entry_size = is_64 ? FAT_ARCH_64_SIZE : FAT_ARCH_SIZE;
    fat.validateRange(FAT_HEADER_SIZE, nfat_arch * entry_size, "fat_arch table");

    std::vector<MachOFatArch> arches;
    arches.reserve(nfat_arch);
    for (uint32_t i = 0; i < nfat_arch; ++i) {
        uint64_t entry = FAT_HEADER_SIZE + static_cast<uint64_t>(i) * entry_size;
        MachOFatArch arch;
        arch.cputype = fat.readU32(entry);
        arch.cpusubtype = fat.readU32(entry + 4);
        if (is_64) {
            arch.offset = fat.readU64(entry + 8);
            arch.size = fat.readU64(entry + 16);
            arch.align = fat.readU32(entry + 24);
        } else {
            arch.offset = fat.readU32(entry + 8);
            arch.size = fat.readU32(entry + 12);
            arch.align = fat.readU32(entry + 16);
        }
        arches.push_back(arch);
    }
    return arches;
}

MachOModel MachOReader::readSlice(const uint8_t* data,
                                  size_t size,
                                  const MachOFatArch& arch,
                                  const std::string& filename) {
    if (arch.size == 0 || arch.offset > size || arch.size > size - arch.offset) {
        throw BinaryFileError::truncated("fat slice at offset " + hex(arch.offset), filename);
    }
    MachOModel model = read(data + arch.offset, static_cast<size_t>(arch.size), filename);
    rebase(model, arch.offset);
    return model;
}
