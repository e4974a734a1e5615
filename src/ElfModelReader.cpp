/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "ElfModelReader.h"
#include <gelf.h>
#include <libelf.h>
#include <cstring>
#include <map>
#include <vector>
#include "BinExceptions.h"
#include "LibElfRAII.h"

using BinReaderExceptions::BinaryFileError;
using LibElfRAII::ElfHandle;

namespace {

/**
 * @brief Copy a section's bytes into a string table arena
 * @return Empty table if the section is missing or has no file data
 */
StringTable loadStringTable(Elf* elf, size_t index) {
    Elf_Scn* scn = elf_getscn(elf, index);
    if (scn == nullptr) {
        return {};
    }
    Elf_Data* data = elf_getdata(scn, nullptr);
    if (data == nullptr || data->d_buf == nullptr || data->d_size == 0) {
        return {};
    }
    const char* bytes = static_cast<const char*>(data->d_buf);
    return StringTable(std::vector<char>(bytes, bytes + data->d_size));
}

size_t entryCount(Elf* elf, Elf_Data* data, Elf_Type type) {
    size_t entry_size = gelf_fsize(elf, type, 1, EV_CURRENT);
    if (data == nullptr || data->d_buf == nullptr || entry_size == 0) {
        return 0;
    }
    return data->d_size / entry_size;
}

/**
 * @brief Read a symbol table, keeping one entry per table slot
 *
 * Slots that libelf cannot convert are kept as null symbols so relocation
 * symbol indices still line up with the table.
 */
std::vector<ElfSymbol> loadSymbols(Elf* elf, Elf_Scn* scn, Elf_Data* shndx_data) {
    std::vector<ElfSymbol> symbols;
    Elf_Data* data = elf_getdata(scn, nullptr);
    size_t count = entryCount(elf, data, ELF_T_SYM);
    symbols.reserve(count);

    for (size_t i = 0; i < count; ++i) {
        GElf_Sym sym;
        Elf32_Word extended_index = 0;
        ElfSymbol symbol;
        if (gelf_getsymshndx(data, shndx_data, static_cast<int>(i), &sym, &extended_index)) {
            symbol.name = sym.st_name;
            symbol.info = sym.st_info;
            symbol.other = sym.st_other;
            symbol.shndx = (sym.st_shndx == SHN_XINDEX && shndx_data != nullptr)
                               ? extended_index
                               : sym.st_shndx;
            symbol.value = sym.st_value;
            symbol.size = sym.st_size;
        }
        symbols.push_back(symbol);
    }
    return symbols;
}

std::vector<ElfRelocation> loadRelocations(Elf* elf, Elf_Scn* scn, bool is_rela) {
    std::vector<ElfRelocation> relocations;
    Elf_Data* data = elf_getdata(scn, nullptr);
    size_t count = entryCount(elf, data, is_rela ? ELF_T_RELA : ELF_T_REL);
    relocations.reserve(count);

    for (size_t i = 0; i < count; ++i) {
        ElfRelocation relocation;
        relocation.is_rela = is_rela;
        if (is_rela) {
            GElf_Rela rela;
            if (!gelf_getrela(data, static_cast<int>(i), &rela)) {
                continue;
            }
            relocation.offset = rela.r_offset;
            relocation.sym = static_cast<uint32_t>(GELF_R_SYM(rela.r_info));
            relocation.type = static_cast<uint32_t>(GELF_R_TYPE(rela.r_info));
            relocation.addend = rela.r_addend;
        } else {
            GElf_Rel rel;
            if (!gelf_getrel(data, static_cast<int>(i), &rel)) {
                continue;
            }
            relocation.offset = rel.r_offset;
            relocation.sym = static_cast<uint32_t>(GELF_R_SYM(rel.r_info));
            relocation.type = static_cast<uint32_t>(GELF_R_TYPE(rel.r_info));
        }
        relocations.push_back(relocation);
    }
    return relocations;
}

std::vector<ElfDynamicEntry> loadDynamic(Elf* elf, Elf_Scn* scn) {
    std::vector<ElfDynamicEntry> entries;
    Elf_Data* data = elf_getdata(scn, nullptr);
    size_t count = entryCount(elf, data, ELF_T_DYN);

    for (size_t i = 0; i < count; ++i) {
        GElf_Dyn dyn;
        if (!gelf_getdyn(data, static_cast<int>(i), &dyn)) {
            break;
        }
        if (dyn.d_tag == DT_NULL) {
            break;
        }
        entries.push_back({dyn.d_tag, dyn.d_un.d_val});
    }
    return entries;
}

bool isPltRelocationSection(const ElfSectionHeader& shdr, std::optional<uint64_t> jmprel) {
    if (shdr.name == ".rela.plt" || shdr.name == ".rel.plt") {
        return true;
    }
    return jmprel && shdr.addr != 0 && shdr.addr == *jmprel;
}

}  // namespace

// ============================================================================
// ElfModelReader Implementation
// ============================================================================

ElfModel ElfModelReader::read(const uint8_t* data, size_t size, const std::string& filename) {
    if (!LibElfRAII::ensureLibElfVersion()) {
        throw BinaryFileError::libraryFailure(
            std::string("libelf initialization failed: ") + elf_errmsg(-1), filename);
    }

    // libelf takes a mutable image; keep a private copy for the descriptor's lifetime
    std::vector<char> image(reinterpret_cast<const char*>(data),
                            reinterpret_cast<const char*>(data) + size);
    ElfHandle elf(elf_memory(image.data(), image.size()));
    if (!elf) {
        throw BinaryFileError::libraryFailure(
            std::string("elf_memory failed: ") + elf_errmsg(-1), filename);
    }
    if (elf_kind(elf.get()) != ELF_K_ELF) {
        throw BinaryFileError::invalidFormat("ELF image", filename);
    }

    ElfModel model;

    // ------------------------------------------------------------------
    // Header
    // ------------------------------------------------------------------
    GElf_Ehdr ehdr;
    if (gelf_getehdr(elf.get(), &ehdr) == nullptr) {
        throw BinaryFileError::invalidFormat(
            std::string("ELF header: ") + elf_errmsg(-1), filename);
    }

    model.header.elf_class = ehdr.e_ident[EI_CLASS];
    model.header.data = ehdr.e_ident[EI_DATA];
    model.header.type = ehdr.e_type;
    model.header.machine = ehdr.e_machine;
    model.header.version = ehdr.e_version;
    model.header.entry = ehdr.e_entry;
    model.header.phoff = ehdr.e_phoff;
    model.header.shoff = ehdr.e_shoff;
    model.header.flags = ehdr.e_flags;
    model.header.ehsize = ehdr.e_ehsize;
    model.header.phentsize = ehdr.e_phentsize;
    model.header.shentsize = ehdr.e_shentsize;

    size_t phnum = 0;
    size_t shnum = 0;
    size_t shstrndx = 0;
    if (elf_getphdrnum(elf.get(), &phnum) != 0) {
        throw BinaryFileError::truncated("the program header table", filename);
    }
    if (elf_getshdrnum(elf.get(), &shnum) != 0) {
        throw BinaryFileError::truncated("the section header table", filename);
    }
    if (elf_getshdrstrndx(elf.get(), &shstrndx) != 0) {
        shstrndx = 0;
    }
    model.header.phnum = phnum;
    model.header.shnum = shnum;
    model.header.shstrndx = shstrndx;

    model.is_64 = gelf_getclass(elf.get()) == ELFCLASS64;
    model.little_endian = ehdr.e_ident[EI_DATA] == ELFDATA2LSB;
    model.is_lib = ehdr.e_type == ET_DYN;
    model.entry = ehdr.e_entry;

    // ------------------------------------------------------------------
    // Program headers
    // ------------------------------------------------------------------
    model.program_headers.reserve(phnum);
    for (size_t i = 0; i < phnum; ++i) {
        GElf_Phdr phdr;
        if (gelf_getphdr(elf.get(), static_cast<int>(i), &phdr) == nullptr) {
            throw BinaryFileError::truncated("program header " + std::to_string(i), filename);
        }
        ElfProgramHeader header;
        header.type = phdr.p_type;
        header.flags = phdr.p_flags;
        header.offset = phdr.p_offset;
        header.vaddr = phdr.p_vaddr;
        header.paddr = phdr.p_paddr;
        header.filesz = phdr.p_filesz;
        header.memsz = phdr.p_memsz;
        header.align = phdr.p_align;
        model.program_headers.push_back(header);

        if (phdr.p_type == PT_INTERP && phdr.p_filesz > 0 && phdr.p_offset < size &&
            phdr.p_filesz <= size - phdr.p_offset) {
            const char* begin = reinterpret_cast<const char*>(data) + phdr.p_offset;
            model.interpreter = std::string(begin, strnlen(begin, phdr.p_filesz));
        }
    }

    // ------------------------------------------------------------------
    // Section headers
    // ------------------------------------------------------------------
    StringTable section_names;
    if (shstrndx != 0) {
        section_names = loadStringTable(elf.get(), shstrndx);
    }

    model.section_headers.reserve(shnum);
    for (size_t i = 0; i < shnum; ++i) {
        Elf_Scn* scn = elf_getscn(elf.get(), i);
        GElf_Shdr shdr;
        if (scn == nullptr || gelf_getshdr(scn, &shdr) == nullptr) {
            throw BinaryFileError::truncated("section header " + std::to_string(i), filename);
        }
        ElfSectionHeader header;
        header.name_offset = shdr.sh_name;
        header.name = shstrndx != 0 ? section_names.nameAt(shdr.sh_name) : std::string();
        header.type = shdr.sh_type;
        header.flags = shdr.sh_flags;
        header.addr = shdr.sh_addr;
        header.offset = shdr.sh_offset;
        header.size = shdr.sh_size;
        header.link = shdr.sh_link;
        header.info = shdr.sh_info;
        header.addralign = shdr.sh_addralign;
        header.entsize = shdr.sh_entsize;
        model.section_headers.push_back(header);
    }

    // Extended section index tables, keyed by the symbol table they extend
    std::map<size_t, Elf_Data*> shndx_tables;
    for (size_t i = 0; i < shnum; ++i) {
        if (model.section_headers[i].type == SHT_SYMTAB_SHNDX) {
            shndx_tables[model.section_headers[i].link] =
                elf_getdata(elf_getscn(elf.get(), i), nullptr);
        }
    }

    // ------------------------------------------------------------------
    // Symbol tables and dynamic table
    // ------------------------------------------------------------------
    std::optional<size_t> dynsym_index;
    for (size_t i = 0; i < shnum; ++i) {
        const ElfSectionHeader& header = model.section_headers[i];
        Elf_Scn* scn = elf_getscn(elf.get(), i);
        auto shndx = shndx_tables.find(i);
        Elf_Data* shndx_data = shndx != shndx_tables.end() ? shndx->second : nullptr;

        if (header.type == SHT_SYMTAB && model.symbols.empty()) {
            model.symbols = loadSymbols(elf.get(), scn, shndx_data);
            model.symbol_strings = loadStringTable(elf.get(), header.link);
        } else if (header.type == SHT_DYNSYM && !dynsym_index) {
            dynsym_index = i;
            model.dynamic_symbols = loadSymbols(elf.get(), scn, shndx_data);
            model.dynamic_strings = loadStringTable(elf.get(), header.link);
        } else if (header.type == SHT_DYNAMIC && !model.dynamic) {
            model.dynamic = loadDynamic(elf.get(), scn);
            if (model.dynamic_strings.empty()) {
                model.dynamic_strings = loadStringTable(elf.get(), header.link);
            }
        }
    }

    std::optional<uint64_t> jmprel;
    if (model.dynamic) {
        for (const auto& entry : *model.dynamic) {
            if (entry.tag == DT_NEEDED) {
                model.libraries.push_back(model.dynamic_strings.nameAt(entry.value));
            } else if (entry.tag == DT_SONAME) {
                model.soname = model.dynamic_strings.nameAt(entry.value);
            } else if (entry.tag == DT_JMPREL) {
                jmprel = entry.value;
            }
        }
    }

    // ------------------------------------------------------------------
    // Relocations
    // ------------------------------------------------------------------
    for (size_t i = 0; i < shnum; ++i) {
        const ElfSectionHeader& header = model.section_headers[i];
        if (header.type != SHT_RELA && header.type != SHT_REL) {
            continue;
        }
        bool is_rela = header.type == SHT_RELA;
        auto relocations = loadRelocations(elf.get(), elf_getscn(elf.get(), i), is_rela);

        if (dynsym_index && header.link == *dynsym_index) {
            auto& destination = isPltRelocationSection(header, jmprel)
                                    ? model.plt_relocations
                                    : (is_rela ? model.dynamic_relas : model.dynamic_rels);
            destination.insert(destination.end(), relocations.begin(), relocations.end());
        } else {
            ElfSectionRelocations group;
            group.section_index = i;
            group.target_index = header.info;
            group.relocations = std::move(relocations);
            model.section_relocations.push_back(std::move(group));
        }
    }

    return model;
}
