/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <elf.h>
#include <gtest/gtest.h>
#include <unistd.h>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <utility>
#include <vector>
#include "BinStructures.h"
#include "MachOFormat.h"

// ============================================================================
// BYTE HELPERS
// ============================================================================

inline void putU16(std::vector<uint8_t>& image, size_t offset, uint16_t value) {
    image.at(offset) = static_cast<uint8_t>(value);
    image.at(offset + 1) = static_cast<uint8_t>(value >> 8);
}

inline void putU32(std::vector<uint8_t>& image, size_t offset, uint32_t value) {
    for (size_t i = 0; i < 4; ++i) {
        image.at(offset + i) = static_cast<uint8_t>(value >> (8 * i));
    }
}

inline void putU64(std::vector<uint8_t>& image, size_t offset, uint64_t value) {
    for (size_t i = 0; i < 8; ++i) {
        image.at(offset + i) = static_cast<uint8_t>(value >> (8 * i));
    }
}

inline void putU32BE(std::vector<uint8_t>& image, size_t offset, uint32_t value) {
    for (size_t i = 0; i < 4; ++i) {
        image.at(offset + i) = static_cast<uint8_t>(value >> (8 * (3 - i)));
    }
}

/**
 * @brief Copy bytes into an image, growing nothing
 */
inline void putBytes(std::vector<uint8_t>& image, size_t offset, const std::vector<uint8_t>& bytes) {
    ASSERT_LE(offset + bytes.size(), image.size()) << "write past end of test image";
    std::copy(bytes.begin(), bytes.end(), image.begin() + static_cast<std::ptrdiff_t>(offset));
}

/**
 * @brief Write a NUL-terminated string
 */
inline void putString(std::vector<uint8_t>& image, size_t offset, const std::string& text) {
    std::vector<uint8_t> bytes(text.begin(), text.end());
    bytes.push_back(0);
    putBytes(image, offset, bytes);
}

inline std::vector<uint8_t> bytesOf(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

template <typename T>
std::vector<uint8_t> toBytes(const std::vector<T>& records) {
    std::vector<uint8_t> bytes(records.size() * sizeof(T));
    if (!records.empty()) {
        std::memcpy(bytes.data(), records.data(), bytes.size());
    }
    return bytes;
}

inline size_t alignUp(size_t value, size_t alignment) {
    return (value + alignment - 1) / alignment * alignment;
}

// ============================================================================
// TEMPORARY FILES
// ============================================================================

/**
 * @brief Scratch file removed when the fixture goes out of scope
 */
class TempFile {
public:
    explicit TempFile(const std::vector<uint8_t>& contents) {
        char pattern[] = "/tmp/bintk_test_XXXXXX";
        int fd = mkstemp(pattern);
        if (fd < 0) {
            ADD_FAILURE() << "mkstemp failed";
            return;
        }
        close(fd);
        path_ = pattern;
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(contents.data()),
                  static_cast<std::streamsize>(contents.size()));
    }

    ~TempFile() {
        if (!path_.empty()) {
            unlink(path_.c_str());
        }
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// ============================================================================
// STRING TABLES
// ============================================================================

/**
 * @brief NUL-separated string table with the customary empty string at 0
 */
class StringTableBuilder {
public:
    StringTableBuilder() : bytes_(1, 0) {}

    uint32_t add(const std::string& text) {
        uint32_t offset = static_cast<uint32_t>(bytes_.size());
        bytes_.insert(bytes_.end(), text.begin(), text.end());
        bytes_.push_back(0);
        return offset;
    }

    const std::vector<uint8_t>& bytes() const { return bytes_; }

private:
    std::vector<uint8_t> bytes_;
};

// ============================================================================
// ELF64 IMAGES
// ============================================================================

struct ElfSectionSpec {
    std::string name;
    uint32_t type = SHT_PROGBITS;
    uint64_t flags = 0;
    uint64_t addr = 0;
    std::vector<uint8_t> data;
    uint32_t link = 0;
    uint32_t info = 0;
    uint64_t entsize = 0;
};

/// Program header covering exactly the file bytes of one section
struct ElfSegmentSpec {
    uint32_t type = PT_LOAD;
    uint32_t flags = PF_R;
    size_t section = 0;  ///< Section header index
    uint64_t vaddr = 0;
};

/**
 * @brief Little-endian ELF64 image assembler
 *
 * Layout: ELF header, program headers, section data (8-byte aligned),
 * .shstrtab, section header table. Section index 0 is the null section and
 * .shstrtab is always last.
 */
class Elf64Builder {
public:
    uint16_t type = ET_EXEC;
    uint16_t machine = EM_X86_64;
    uint64_t entry = 0;

    /// @return Section header index of the new section
    size_t addSection(ElfSectionSpec section) {
        sections_.push_back(std::move(section));
        return sections_.size();
    }

    void addSegment(ElfSegmentSpec segment) { segments_.push_back(segment); }

    /// File offset of a section's data; valid after build()
    uint64_t offsetOf(size_t index) const { return offsets_.at(index); }

    std::vector<uint8_t> build() {
        StringTableBuilder names;
        std::vector<uint32_t> name_offsets;
        for (const auto& section : sections_) {
            name_offsets.push_back(names.add(section.name));
        }
        uint32_t shstrtab_name = names.add(".shstrtab");
        const std::vector<uint8_t>& shstrtab = names.bytes();

        const size_t section_count = sections_.size() + 2;
        const size_t phoff = sizeof(Elf64_Ehdr);
        size_t cursor = phoff + segments_.size() * sizeof(Elf64_Phdr);

        offsets_.assign(section_count, 0);
        for (size_t i = 0; i < sections_.size(); ++i) {
            cursor = alignUp(cursor, 8);
            offsets_[i + 1] = cursor;
            cursor += sections_[i].data.size();
        }
        offsets_[section_count - 1] = cursor;
        cursor += shstrtab.size();
        const size_t shoff = alignUp(cursor, 8);

        std::vector<uint8_t> image(shoff + section_count * sizeof(Elf64_Shdr), 0);

        Elf64_Ehdr ehdr;
        std::memset(&ehdr, 0, sizeof(ehdr));
        std::memcpy(ehdr.e_ident, ELFMAG, SELFMAG);
        ehdr.e_ident[EI_CLASS] = ELFCLASS64;
        ehdr.e_ident[EI_DATA] = ELFDATA2LSB;
        ehdr.e_ident[EI_VERSION] = EV_CURRENT;
        ehdr.e_type = type;
        ehdr.e_machine = machine;
        ehdr.e_version = EV_CURRENT;
        ehdr.e_entry = entry;
        ehdr.e_phoff = segments_.empty() ? 0 : phoff;
        ehdr.e_shoff = shoff;
        ehdr.e_ehsize = sizeof(Elf64_Ehdr);
        ehdr.e_phentsize = sizeof(Elf64_Phdr);
        ehdr.e_phnum = static_cast<Elf64_Half>(segments_.size());
        ehdr.e_shentsize = sizeof(Elf64_Shdr);
        ehdr.e_shnum = static_cast<Elf64_Half>(section_count);
        ehdr.e_shstrndx = static_cast<Elf64_Half>(section_count - 1);
        std::memcpy(image.data(), &ehdr, sizeof(ehdr));

        for (size_t i = 0; i < segments_.size(); ++i) {
            const ElfSegmentSpec& spec = segments_[i];
            Elf64_Phdr phdr;
            std::memset(&phdr, 0, sizeof(phdr));
            phdr.p_type = spec.type;
            phdr.p_flags = spec.flags;
            phdr.p_offset = offsets_.at(spec.section);
            phdr.p_vaddr = spec.vaddr;
            phdr.p_paddr = spec.vaddr;
            phdr.p_filesz = sections_.at(spec.section - 1).data.size();
            phdr.p_memsz = phdr.p_filesz;
            phdr.p_align = 8;
            std::memcpy(image.data() + phoff + i * sizeof(Elf64_Phdr), &phdr, sizeof(phdr));
        }

        for (size_t i = 0; i < sections_.size(); ++i) {
            std::copy(sections_[i].data.begin(), sections_[i].data.end(),
                      image.begin() + static_cast<std::ptrdiff_t>(offsets_[i + 1]));
        }
        std::copy(shstrtab.begin(), shstrtab.end(),
                  image.begin() + static_cast<std::ptrdiff_t>(offsets_[section_count - 1]));

        auto writeHeader = [&](size_t index, const Elf64_Shdr& shdr) {
            std::memcpy(image.data() + shoff + index * sizeof(Elf64_Shdr), &shdr, sizeof(shdr));
        };
        for (size_t i = 0; i < sections_.size(); ++i) {
            const ElfSectionSpec& spec = sections_[i];
            Elf64_Shdr shdr;
            std::memset(&shdr, 0, sizeof(shdr));
            shdr.sh_name = name_offsets[i];
            shdr.sh_type = spec.type;
            shdr.sh_flags = spec.flags;
            shdr.sh_addr = spec.addr;
            shdr.sh_offset = offsets_[i + 1];
            shdr.sh_size = spec.data.size();
            shdr.sh_link = spec.link;
            shdr.sh_info = spec.info;
            shdr.sh_addralign = 8;
            shdr.sh_entsize = spec.entsize;
            writeHeader(i + 1, shdr);
        }
        Elf64_Shdr names_header;
        std::memset(&names_header, 0, sizeof(names_header));
        names_header.sh_name = shstrtab_name;
        names_header.sh_type = SHT_STRTAB;
        names_header.sh_offset = offsets_[section_count - 1];
        names_header.sh_size = shstrtab.size();
        names_header.sh_addralign = 1;
        writeHeader(section_count - 1, names_header);

        return image;
    }

private:
    std::vector<ElfSectionSpec> sections_;
    std::vector<ElfSegmentSpec> segments_;
    std::vector<uint64_t> offsets_;
};

inline Elf64_Sym makeSymbol(uint32_t name, unsigned char bind, unsigned char type,
                            uint16_t shndx, uint64_t value = 0, uint64_t size = 0) {
    Elf64_Sym sym;
    std::memset(&sym, 0, sizeof(sym));
    sym.st_name = name;
    sym.st_info = static_cast<unsigned char>(ELF64_ST_INFO(bind, type));
    sym.st_shndx = shndx;
    sym.st_value = value;
    sym.st_size = size;
    return sym;
}

inline Elf64_Rela makeRela(uint64_t offset, uint32_t sym, uint32_t type, int64_t addend) {
    Elf64_Rela rela;
    rela.r_offset = offset;
    rela.r_info = ELF64_R_INFO(sym, type);
    rela.r_addend = addend;
    return rela;
}

// ============================================================================
// MACH-O IMAGES
// ============================================================================

struct MachOSectionSpec {
    std::string name;
    std::string segment;
    uint64_t addr = 0;
    uint64_t size = 0;
    uint32_t offset = 0;
    uint32_t flags = 0;
};

inline void putFixedName(std::vector<uint8_t>& bytes, size_t offset, const std::string& name) {
    std::copy(name.begin(), name.begin() + static_cast<std::ptrdiff_t>(std::min<size_t>(name.size(), 16)),
              bytes.begin() + static_cast<std::ptrdiff_t>(offset));
}

inline std::vector<uint8_t> machOSegment64(const std::string& name,
                                           uint64_t vmaddr,
                                           uint64_t vmsize,
                                           uint64_t fileoff,
                                           uint64_t filesize,
                                           const std::vector<MachOSectionSpec>& sections = {}) {
    using namespace MachOFormat;
    std::vector<uint8_t> cmd(SEGMENT_COMMAND_64_SIZE + sections.size() * SECTION_64_SIZE, 0);
    putU32(cmd, 0, LC_SEGMENT_64);
    putU32(cmd, 4, static_cast<uint32_t>(cmd.size()));
    putFixedName(cmd, 8, name);
    putU64(cmd, 24, vmaddr);
    putU64(cmd, 32, vmsize);
    putU64(cmd, 40, fileoff);
    putU64(cmd, 48, filesize);
    putU32(cmd, 56, 5);
    putU32(cmd, 60, 5);
    putU32(cmd, 64, static_cast<uint32_t>(sections.size()));
    for (size_t i = 0; i < sections.size(); ++i) {
        size_t s = SEGMENT_COMMAND_64_SIZE + i * SECTION_64_SIZE;
        putFixedName(cmd, s, sections[i].name);
        putFixedName(cmd, s + 16, sections[i].segment);
        putU64(cmd, s + 32, sections[i].addr);
        putU64(cmd, s + 40, sections[i].size);
        putU32(cmd, s + 48, sections[i].offset);
        putU32(cmd, s + 64, sections[i].flags);
    }
    return cmd;
}

inline std::vector<uint8_t> machOMain(uint64_t entryoff) {
    std::vector<uint8_t> cmd(24, 0);
    putU32(cmd, 0, MachOFormat::LC_MAIN);
    putU32(cmd, 4, 24);
    putU64(cmd, 8, entryoff);
    return cmd;
}

/// dylib_command with the install name stored after the fixed part
inline std::vector<uint8_t> machODylib(uint32_t cmd_type, const std::string& name) {
    std::vector<uint8_t> cmd(alignUp(24 + name.size() + 1, 8), 0);
    putU32(cmd, 0, cmd_type);
    putU32(cmd, 4, static_cast<uint32_t>(cmd.size()));
    putU32(cmd, 8, 24);
    putString(cmd, 24, name);
    return cmd;
}

inline std::vector<uint8_t> machOLinkedit(uint32_t cmd_type, uint32_t offset, uint32_t size) {
    std::vector<uint8_t> cmd(16, 0);
    putU32(cmd, 0, cmd_type);
    putU32(cmd, 4, 16);
    putU32(cmd, 8, offset);
    putU32(cmd, 12, size);
    return cmd;
}

/**
 * @brief Little-endian 64-bit Mach-O: header and load commands, zero padded
 */
inline std::vector<uint8_t> machOImage(uint32_t filetype,
                                       uint32_t cputype,
                                       const std::vector<std::vector<uint8_t>>& commands,
                                       size_t total_size) {
    using namespace MachOFormat;
    size_t sizeofcmds = 0;
    for (const auto& cmd : commands) {
        sizeofcmds += cmd.size();
    }
    std::vector<uint8_t> image(std::max(total_size, MACH_HEADER_64_SIZE + sizeofcmds), 0);
    putU32(image, 0, MH_MAGIC_64);
    putU32(image, 4, cputype);
    putU32(image, 8, 0);
    putU32(image, 12, filetype);
    putU32(image, 16, static_cast<uint32_t>(commands.size()));
    putU32(image, 20, static_cast<uint32_t>(sizeofcmds));
    size_t cursor = MACH_HEADER_64_SIZE;
    for (const auto& cmd : commands) {
        putBytes(image, cursor, cmd);
        cursor += cmd.size();
    }
    return image;
}

/**
 * @brief Universal binary with each slice aligned to 0x1000
 */
inline std::vector<uint8_t> fatImage(const std::vector<std::pair<uint32_t, std::vector<uint8_t>>>& slices) {
    using namespace MachOFormat;
    constexpr size_t SLICE_ALIGN = 0x1000;
    std::vector<size_t> offsets;
    size_t cursor = SLICE_ALIGN;
    for (const auto& slice : slices) {
        offsets.push_back(cursor);
        cursor = alignUp(cursor + slice.second.size(), SLICE_ALIGN);
    }
    std::vector<uint8_t> image(offsets.empty() ? SLICE_ALIGN : offsets.back() + slices.back().second.size(), 0);
    putU32BE(image, 0, FAT_MAGIC);
    putU32BE(image, 4, static_cast<uint32_t>(slices.size()));
    for (size_t i = 0; i < slices.size(); ++i) {
        size_t entry = FAT_HEADER_SIZE + i * FAT_ARCH_SIZE;
        putU32BE(image, entry, slices[i].first);
        putU32BE(image, entry + 4, 0);
        putU32BE(image, entry + 8, static_cast<uint32_t>(offsets[i]));
        putU32BE(image, entry + 12, static_cast<uint32_t>(slices[i].second.size()));
        putU32BE(image, entry + 16, 12);
        putBytes(image, offsets[i], slices[i].second);
    }
    return image;
}

// ============================================================================
// SAMPLE MODELS
// ============================================================================

/**
 * @brief Mach-O executable used across the reader, adapter and inspector tests
 *
 * __TEXT maps file [0, 0x400) at 0x100000000 and holds __text at file 0x300.
 * The export trie at 0x380 exports _main at the entry point.
 */
namespace SampleMachO {

constexpr uint64_t TEXT_VMADDR = 0x100000000ull;
constexpr uint64_t TEXT_SECTION_OFFSET = 0x300;
constexpr uint64_t TEXT_SECTION_SIZE = 0x40;
constexpr uint32_t TRIE_OFFSET = 0x380;
constexpr size_t IMAGE_SIZE = 0x400;
constexpr const char* LIBSYSTEM = "/usr/lib/libSystem.B.dylib";

/// Root edge "_main" to a terminal node at trie offset 9 holding address 0x300
inline std::vector<uint8_t> exportTrie() {
    std::vector<uint8_t> trie = {0x00, 0x01};
    for (char c : std::string("_main")) {
        trie.push_back(static_cast<uint8_t>(c));
    }
    trie.push_back(0x00);
    trie.push_back(0x09);
    std::vector<uint8_t> terminal = {0x03, 0x00, 0x80, 0x06, 0x00};
    trie.insert(trie.end(), terminal.begin(), terminal.end());
    return trie;
}

inline std::vector<uint8_t> image(const std::vector<uint8_t>& trie = exportTrie()) {
    using namespace MachOFormat;
    std::vector<std::vector<uint8_t>> commands = {
        machOSegment64("__TEXT", TEXT_VMADDR, 0x1000, 0, IMAGE_SIZE,
                       {{"__text", "__TEXT", TEXT_VMADDR + TEXT_SECTION_OFFSET, TEXT_SECTION_SIZE,
                         static_cast<uint32_t>(TEXT_SECTION_OFFSET), 0x80000400}}),
        machOMain(TEXT_SECTION_OFFSET),
        machODylib(LC_LOAD_DYLIB, LIBSYSTEM),
        machOLinkedit(LC_DYLD_EXPORTS_TRIE, TRIE_OFFSET, static_cast<uint32_t>(trie.size())),
    };
    std::vector<uint8_t> bytes = machOImage(MH_EXECUTE, CPU_TYPE_ARM64, commands, IMAGE_SIZE);
    putBytes(bytes, TRIE_OFFSET, trie);
    // A recognizable payload inside __text
    putString(bytes, TEXT_SECTION_OFFSET + 0x10, "needle");
    return bytes;
}

}  // namespace SampleMachO
