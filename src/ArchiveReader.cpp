/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "ArchiveReader.h"
#include <libelf.h>
#include <vector>
#include "BinExceptions.h"
#include "LibElfRAII.h"

using BinReaderExceptions::BinaryFileError;
using LibElfRAII::ElfHandle;

namespace {

/// Size of struct ar_hdr preceding every member
constexpr int64_t AR_HEADER_SIZE = 60;

bool isSpecialMember(const std::string& name) {
    return name == "/" || name == "//" || name == "/SYM64/";
}

}  // namespace

ArchiveModel ArchiveReader::read(const uint8_t* data, size_t size, const std::string& filename) {
    if (!LibElfRAII::ensureLibElfVersion()) {
        throw BinaryFileError::libraryFailure(
            std::string("libelf initialization failed: ") + elf_errmsg(-1), filename);
    }

    std::vector<char> image(reinterpret_cast<const char*>(data),
                            reinterpret_cast<const char*>(data) + size);
    ElfHandle archive(elf_memory(image.data(), image.size()));
    if (!archive) {
        throw BinaryFileError::libraryFailure(
            std::string("elf_memory failed: ") + elf_errmsg(-1), filename);
    }
    if (elf_kind(archive.get()) != ELF_K_AR) {
        throw BinaryFileError::invalidFormat("ar archive", filename);
    }

    ArchiveModel model;

    // Symbol index; the last entry is a null terminator
    size_t symbol_count = 0;
    Elf_Arsym* symbols = elf_getarsym(archive.get(), &symbol_count);
    if (symbols != nullptr) {
        for (size_t i = 0; i < symbol_count && symbols[i].as_name != nullptr; ++i) {
            model.symbols.push_back({symbols[i].as_name, static_cast<uint64_t>(symbols[i].as_off)});
        }
    }

    // Members of an elf_memory archive are opened with the command that created it
    Elf_Cmd command = ELF_C_READ_MMAP;
    ElfHandle member(elf_begin(-1, command, archive.get()));
    while (member) {
        Elf_Arhdr* header = elf_getarhdr(member.get());
        if (header != nullptr && header->ar_name != nullptr && !isSpecialMember(header->ar_name)) {
            int64_t base = elf_getbase(member.get());
            ArchiveMember entry;
            entry.name = header->ar_name;
            entry.data_offset = base < 0 ? 0 : static_cast<uint64_t>(base);
            entry.header_offset = base < AR_HEADER_SIZE ? 0 : static_cast<uint64_t>(base - AR_HEADER_SIZE);
            entry.size = static_cast<uint64_t>(header->ar_size);
            entry.date = static_cast<int64_t>(header->ar_date);
            entry.uid = static_cast<uint32_t>(header->ar_uid);
            entry.gid = static_cast<uint32_t>(header->ar_gid);
            entry.mode = static_cast<uint32_t>(header->ar_mode);
            model.members.push_back(std::move(entry));
        }
        command = elf_next(member.get());
        member.reset(elf_begin(-1, command, archive.get()));
    }

    return model;
}
