/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "FormatNames.h"
#include <elf.h>
#include <iomanip>
#include <sstream>
#include "MachOFormat.h"
#include "PeFormat.h"

#define NAME_CASE(value) \
    case value:          \
        return #value

namespace {

std::string hexName(uint64_t value) {
    std::ostringstream oss;
    oss << "0x" << std::hex << value;
    return oss.str();
}

std::string numericName(const char* prefix, uint64_t value) {
    return std::string(prefix) + "(" + std::to_string(value) + ")";
}

}  // namespace

// ============================================================================
// ELF
// ============================================================================

namespace ElfNames {

std::string fileType(uint16_t e_type) {
    switch (e_type) {
        case ET_NONE:
            return "NONE";
        case ET_REL:
            return "REL";
        case ET_EXEC:
            return "EXEC";
        case ET_DYN:
            return "DYN";
        case ET_CORE:
            return "CORE";
        default:
            return numericName("ET", e_type);
    }
}

std::string machine(uint16_t e_machine) {
    switch (e_machine) {
        case EM_NONE:
            return "NONE";
        case EM_386:
            return "386";
        case EM_68K:
            return "68K";
        case EM_MIPS:
            return "MIPS";
        case EM_PPC:
            return "PPC";
        case EM_PPC64:
            return "PPC64";
        case EM_S390:
            return "S390";
        case EM_ARM:
            return "ARM";
        case EM_SH:
            return "SH";
        case EM_SPARCV9:
            return "SPARCV9";
        case EM_IA_64:
            return "IA_64";
        case EM_X86_64:
            return "X86_64";
        case EM_AARCH64:
            return "AARCH64";
        case EM_RISCV:
            return "RISCV";
        case EM_BPF:
            return "BPF";
        default:
            return numericName("EM", e_machine);
    }
}

std::string programHeaderType(uint32_t p_type) {
    switch (p_type) {
        NAME_CASE(PT_NULL);
        NAME_CASE(PT_LOAD);
        NAME_CASE(PT_DYNAMIC);
        NAME_CASE(PT_INTERP);
        NAME_CASE(PT_NOTE);
        NAME_CASE(PT_SHLIB);
        NAME_CASE(PT_PHDR);
        NAME_CASE(PT_TLS);
        NAME_CASE(PT_GNU_EH_FRAME);
        NAME_CASE(PT_GNU_STACK);
        NAME_CASE(PT_GNU_RELRO);
        case 0x6474e553:
            return "PT_GNU_PROPERTY";
        case 0x70000001:
            return "PT_ARM_EXIDX";
        default:
            return numericName("PT", p_type);
    }
}

std::string programHeaderFlags(uint32_t p_flags) {
    switch (p_flags) {
        case PF_R | PF_W | PF_X:
            return "RW+X";
        case PF_R | PF_W:
            return "RW";
        case PF_R | PF_X:
            return "R+X";
        case PF_W | PF_X:
            return "W+X";
        case PF_R:
            return "R";
        case PF_W:
            return "W";
        default:
            return hexName(p_flags);
    }
}

std::string sectionType(uint32_t sh_type) {
    switch (sh_type) {
        NAME_CASE(SHT_NULL);
        NAME_CASE(SHT_PROGBITS);
        NAME_CASE(SHT_SYMTAB);
        NAME_CASE(SHT_STRTAB);
        NAME_CASE(SHT_RELA);
        NAME_CASE(SHT_HASH);
        NAME_CASE(SHT_DYNAMIC);
        NAME_CASE(SHT_NOTE);
        NAME_CASE(SHT_NOBITS);
        NAME_CASE(SHT_REL);
        NAME_CASE(SHT_SHLIB);
        NAME_CASE(SHT_DYNSYM);
        NAME_CASE(SHT_INIT_ARRAY);
        NAME_CASE(SHT_FINI_ARRAY);
        NAME_CASE(SHT_PREINIT_ARRAY);
        NAME_CASE(SHT_GROUP);
        NAME_CASE(SHT_SYMTAB_SHNDX);
        NAME_CASE(SHT_GNU_ATTRIBUTES);
        NAME_CASE(SHT_GNU_HASH);
        NAME_CASE(SHT_GNU_LIBLIST);
        NAME_CASE(SHT_GNU_verdef);
        NAME_CASE(SHT_GNU_verneed);
        NAME_CASE(SHT_GNU_versym);
        default:
            return numericName("SHT", sh_type);
    }
}

std::string sectionFlags(uint64_t sh_flags) {
    struct FlagName {
        uint64_t flag;
        const char* name;
    };
    static const FlagName flag_names[] = {
        {SHF_WRITE, "WRITE"},
        {SHF_ALLOC, "ALLOC"},
        {SHF_EXECINSTR, "EXECINSTR"},
        {SHF_MERGE, "MERGE"},
        {SHF_STRINGS, "STRINGS"},
        {SHF_INFO_LINK, "INFO_LINK"},
        {SHF_LINK_ORDER, "LINK_ORDER"},
        {SHF_OS_NONCONFORMING, "OS_NONCONFORMING"},
        {SHF_GROUP, "GROUP"},
        {SHF_TLS, "TLS"},
        {SHF_COMPRESSED, "COMPRESSED"},
    };

    std::string result;
    for (const auto& entry : flag_names) {
        if ((sh_flags & entry.flag) == entry.flag) {
            if (!result.empty()) {
                result += ' ';
            }
            result += entry.name;
        }
    }
    return result;
}

std::string symbolBinding(uint8_t bind) {
    switch (bind) {
        case STB_LOCAL:
            return "LOCAL";
        case STB_GLOBAL:
            return "GLOBAL";
        case STB_WEAK:
            return "WEAK";
        case STB_GNU_UNIQUE:
            return "UNIQUE";
        default:
            return numericName("STB", bind);
    }
}

std::string symbolType(uint8_t type) {
    switch (type) {
        case STT_NOTYPE:
            return "NOTYPE";
        case STT_OBJECT:
            return "OBJECT";
        case STT_FUNC:
            return "FUNC";
        case STT_SECTION:
            return "SECTION";
        case STT_FILE:
            return "FILE";
        case STT_COMMON:
            return "COMMON";
        case STT_TLS:
            return "TLS";
        case STT_GNU_IFUNC:
            return "GNU_IFUNC";
        default:
            return numericName("STT", type);
    }
}

std::string dynamicTag(int64_t d_tag) {
    switch (d_tag) {
        NAME_CASE(DT_NULL);
        NAME_CASE(DT_NEEDED);
        NAME_CASE(DT_PLTRELSZ);
        NAME_CASE(DT_PLTGOT);
        NAME_CASE(DT_HASH);
        NAME_CASE(DT_STRTAB);
        NAME_CASE(DT_SYMTAB);
        NAME_CASE(DT_RELA);
        NAME_CASE(DT_RELASZ);
        NAME_CASE(DT_RELAENT);
        NAME_CASE(DT_STRSZ);
        NAME_CASE(DT_SYMENT);
        NAME_CASE(DT_INIT);
        NAME_CASE(DT_FINI);
        NAME_CASE(DT_SONAME);
        NAME_CASE(DT_RPATH);
        NAME_CASE(DT_SYMBOLIC);
        NAME_CASE(DT_REL);
        NAME_CASE(DT_RELSZ);
        NAME_CASE(DT_RELENT);
        NAME_CASE(DT_PLTREL);
        NAME_CASE(DT_DEBUG);
        NAME_CASE(DT_TEXTREL);
        NAME_CASE(DT_JMPREL);
        NAME_CASE(DT_BIND_NOW);
        NAME_CASE(DT_INIT_ARRAY);
        NAME_CASE(DT_FINI_ARRAY);
        NAME_CASE(DT_INIT_ARRAYSZ);
        NAME_CASE(DT_FINI_ARRAYSZ);
        NAME_CASE(DT_RUNPATH);
        NAME_CASE(DT_FLAGS);
        NAME_CASE(DT_PREINIT_ARRAY);
        NAME_CASE(DT_PREINIT_ARRAYSZ);
        NAME_CASE(DT_GNU_HASH);
        NAME_CASE(DT_VERSYM);
        NAME_CASE(DT_RELACOUNT);
        NAME_CASE(DT_RELCOUNT);
        NAME_CASE(DT_FLAGS_1);
        NAME_CASE(DT_VERDEF);
        NAME_CASE(DT_VERDEFNUM);
        NAME_CASE(DT_VERNEED);
        NAME_CASE(DT_VERNEEDNUM);
        default:
            return hexName(static_cast<uint64_t>(d_tag));
    }
}

namespace {

std::string x86_64Relocation(uint32_t r_type) {
    switch (r_type) {
        NAME_CASE(R_X86_64_NONE);
        NAME_CASE(R_X86_64_64);
        NAME_CASE(R_X86_64_PC32);
        NAME_CASE(R_X86_64_GOT32);
        NAME_CASE(R_X86_64_PLT32);
        NAME_CASE(R_X86_64_COPY);
        NAME_CASE(R_X86_64_GLOB_DAT);
        NAME_CASE(R_X86_64_JUMP_SLOT);
        NAME_CASE(R_X86_64_RELATIVE);
        NAME_CASE(R_X86_64_GOTPCREL);
        NAME_CASE(R_X86_64_32);
        NAME_CASE(R_X86_64_32S);
        NAME_CASE(R_X86_64_16);
        NAME_CASE(R_X86_64_PC16);
        NAME_CASE(R_X86_64_8);
        NAME_CASE(R_X86_64_PC8);
        NAME_CASE(R_X86_64_DTPMOD64);
        NAME_CASE(R_X86_64_DTPOFF64);
        NAME_CASE(R_X86_64_TPOFF64);
        NAME_CASE(R_X86_64_TLSGD);
        NAME_CASE(R_X86_64_TLSLD);
        NAME_CASE(R_X86_64_DTPOFF32);
        NAME_CASE(R_X86_64_GOTTPOFF);
        NAME_CASE(R_X86_64_TPOFF32);
        NAME_CASE(R_X86_64_PC64);
        NAME_CASE(R_X86_64_GOTOFF64);
        NAME_CASE(R_X86_64_GOTPC32);
        NAME_CASE(R_X86_64_SIZE32);
        NAME_CASE(R_X86_64_SIZE64);
        NAME_CASE(R_X86_64_IRELATIVE);
        case 41:
            return "R_X86_64_GOTPCRELX";
        case 42:
            return "R_X86_64_REX_GOTPCRELX";
        default:
            return std::to_string(r_type);
    }
}

std::string i386Relocation(uint32_t r_type) {
    switch (r_type) {
        NAME_CASE(R_386_NONE);
        NAME_CASE(R_386_32);
        NAME_CASE(R_386_PC32);
        NAME_CASE(R_386_GOT32);
        NAME_CASE(R_386_PLT32);
        NAME_CASE(R_386_COPY);
        NAME_CASE(R_386_GLOB_DAT);
        NAME_CASE(R_386_JMP_SLOT);
        NAME_CASE(R_386_RELATIVE);
        NAME_CASE(R_386_GOTOFF);
        NAME_CASE(R_386_GOTPC);
        NAME_CASE(R_386_TLS_TPOFF);
        NAME_CASE(R_386_TLS_DTPMOD32);
        NAME_CASE(R_386_TLS_DTPOFF32);
        NAME_CASE(R_386_IRELATIVE);
        default:
            return std::to_string(r_type);
    }
}

std::string aarch64Relocation(uint32_t r_type) {
    switch (r_type) {
        NAME_CASE(R_AARCH64_NONE);
        NAME_CASE(R_AARCH64_ABS64);
        NAME_CASE(R_AARCH64_ABS32);
        NAME_CASE(R_AARCH64_PREL64);
        NAME_CASE(R_AARCH64_PREL32);
        NAME_CASE(R_AARCH64_ADR_PREL_PG_HI21);
        NAME_CASE(R_AARCH64_ADD_ABS_LO12_NC);
        NAME_CASE(R_AARCH64_LDST8_ABS_LO12_NC);
        NAME_CASE(R_AARCH64_LDST64_ABS_LO12_NC);
        NAME_CASE(R_AARCH64_JUMP26);
        NAME_CASE(R_AARCH64_CALL26);
        NAME_CASE(R_AARCH64_ADR_GOT_PAGE);
        NAME_CASE(R_AARCH64_LD64_GOT_LO12_NC);
        NAME_CASE(R_AARCH64_COPY);
        NAME_CASE(R_AARCH64_GLOB_DAT);
        NAME_CASE(R_AARCH64_JUMP_SLOT);
        NAME_CASE(R_AARCH64_RELATIVE);
        NAME_CASE(R_AARCH64_TLS_DTPMOD);
        NAME_CASE(R_AARCH64_TLS_DTPREL);
        NAME_CASE(R_AARCH64_TLS_TPREL);
        NAME_CASE(R_AARCH64_TLSDESC);
        NAME_CASE(R_AARCH64_IRELATIVE);
        default:
            return std::to_string(r_type);
    }
}

std::string armRelocation(uint32_t r_type) {
    switch (r_type) {
        NAME_CASE(R_ARM_NONE);
        NAME_CASE(R_ARM_PC24);
        NAME_CASE(R_ARM_ABS32);
        NAME_CASE(R_ARM_REL32);
        NAME_CASE(R_ARM_CALL);
        NAME_CASE(R_ARM_JUMP24);
        NAME_CASE(R_ARM_COPY);
        NAME_CASE(R_ARM_GLOB_DAT);
        NAME_CASE(R_ARM_JUMP_SLOT);
        NAME_CASE(R_ARM_RELATIVE);
        NAME_CASE(R_ARM_GOTOFF);
        NAME_CASE(R_ARM_GOTPC);
        NAME_CASE(R_ARM_GOT32);
        NAME_CASE(R_ARM_PLT32);
        NAME_CASE(R_ARM_TLS_DTPMOD32);
        NAME_CASE(R_ARM_TLS_DTPOFF32);
        NAME_CASE(R_ARM_TLS_TPOFF32);
        NAME_CASE(R_ARM_IRELATIVE);
        default:
            return std::to_string(r_type);
    }
}

}  // namespace

std::string relocationType(uint32_t r_type, uint16_t e_machine) {
    switch (e_machine) {
        case EM_X86_64:
            return x86_64Relocation(r_type);
        case EM_386:
            return i386Relocation(r_type);
        case EM_AARCH64:
            return aarch64Relocation(r_type);
        case EM_ARM:
            return armRelocation(r_type);
        default:
            return std::to_string(r_type);
    }
}

}  // namespace ElfNames

// ============================================================================
// Mach-O
// ============================================================================

namespace MachONames {

using namespace MachOFormat;

std::string loadCommand(uint32_t cmd) {
    switch (cmd) {
        NAME_CASE(LC_SEGMENT);
        NAME_CASE(LC_SYMTAB);
        NAME_CASE(LC_SYMSEG);
        NAME_CASE(LC_THREAD);
        NAME_CASE(LC_UNIXTHREAD);
        NAME_CASE(LC_LOADFVMLIB);
        NAME_CASE(LC_IDFVMLIB);
        NAME_CASE(LC_IDENT);
        NAME_CASE(LC_FVMFILE);
        NAME_CASE(LC_PREPAGE);
        NAME_CASE(LC_DYSYMTAB);
        NAME_CASE(LC_LOAD_DYLIB);
        NAME_CASE(LC_ID_DYLIB);
        NAME_CASE(LC_LOAD_DYLINKER);
        NAME_CASE(LC_ID_DYLINKER);
        NAME_CASE(LC_PREBOUND_DYLIB);
        NAME_CASE(LC_ROUTINES);
        NAME_CASE(LC_SUB_FRAMEWORK);
        NAME_CASE(LC_SUB_UMBRELLA);
        NAME_CASE(LC_SUB_CLIENT);
        NAME_CASE(LC_SUB_LIBRARY);
        NAME_CASE(LC_TWOLEVEL_HINTS);
        NAME_CASE(LC_PREBIND_CKSUM);
        NAME_CASE(LC_LOAD_WEAK_DYLIB);
        NAME_CASE(LC_SEGMENT_64);
        NAME_CASE(LC_ROUTINES_64);
        NAME_CASE(LC_UUID);
        NAME_CASE(LC_RPATH);
        NAME_CASE(LC_CODE_SIGNATURE);
        NAME_CASE(LC_SEGMENT_SPLIT_INFO);
        NAME_CASE(LC_REEXPORT_DYLIB);
        NAME_CASE(LC_LAZY_LOAD_DYLIB);
        NAME_CASE(LC_ENCRYPTION_INFO);
        NAME_CASE(LC_DYLD_INFO);
        NAME_CASE(LC_DYLD_INFO_ONLY);
        NAME_CASE(LC_LOAD_UPWARD_DYLIB);
        NAME_CASE(LC_VERSION_MIN_MACOSX);
        NAME_CASE(LC_VERSION_MIN_IPHONEOS);
        NAME_CASE(LC_FUNCTION_STARTS);
        NAME_CASE(LC_DYLD_ENVIRONMENT);
        NAME_CASE(LC_MAIN);
        NAME_CASE(LC_DATA_IN_CODE);
        NAME_CASE(LC_SOURCE_VERSION);
        NAME_CASE(LC_DYLIB_CODE_SIGN_DRS);
        NAME_CASE(LC_ENCRYPTION_INFO_64);
        NAME_CASE(LC_LINKER_OPTION);
        NAME_CASE(LC_LINKER_OPTIMIZATION_HINT);
        NAME_CASE(LC_VERSION_MIN_TVOS);
        NAME_CASE(LC_VERSION_MIN_WATCHOS);
        NAME_CASE(LC_NOTE);
        NAME_CASE(LC_BUILD_VERSION);
        NAME_CASE(LC_DYLD_EXPORTS_TRIE);
        NAME_CASE(LC_DYLD_CHAINED_FIXUPS);
        NAME_CASE(LC_FILESET_ENTRY);
        default:
            return hexName(cmd);
    }
}

std::string fileType(uint32_t filetype) {
    switch (filetype) {
        case MH_OBJECT:
            return "OBJECT";
        case MH_EXECUTE:
            return "EXECUTE";
        case MH_FVMLIB:
            return "FVMLIB";
        case MH_CORE:
            return "CORE";
        case MH_PRELOAD:
            return "PRELOAD";
        case MH_DYLIB:
            return "DYLIB";
        case MH_DYLINKER:
            return "DYLINKER";
        case MH_BUNDLE:
            return "BUNDLE";
        case MH_DYLIB_STUB:
            return "DYLIB_STUB";
        case MH_DSYM:
            return "DSYM";
        case MH_KEXT_BUNDLE:
            return "KEXT_BUNDLE";
        case MH_FILESET:
            return "FILESET";
        default:
            return numericName("MH", filetype);
    }
}

std::string cpuType(uint32_t cputype) {
    switch (cputype) {
        case CPU_TYPE_X86:
            return "x86";
        case CPU_TYPE_X86_64:
            return "x86_64";
        case CPU_TYPE_ARM:
            return "arm";
        case CPU_TYPE_ARM64:
            return "arm64";
        case CPU_TYPE_ARM64_32:
            return "arm64_32";
        case CPU_TYPE_POWERPC:
            return "powerpc";
        case CPU_TYPE_POWERPC64:
            return "powerpc64";
        default:
            return numericName("cpu", cputype);
    }
}

}  // namespace MachONames

// ============================================================================
// PE
// ============================================================================

namespace PeNames {

std::string machine(uint16_t machine) {
    switch (machine) {
        case PeFormat::IMAGE_FILE_MACHINE_UNKNOWN:
            return "UNKNOWN";
        case PeFormat::IMAGE_FILE_MACHINE_I386:
            return "I386";
        case PeFormat::IMAGE_FILE_MACHINE_ARM:
            return "ARM";
        case PeFormat::IMAGE_FILE_MACHINE_ARMNT:
            return "ARMNT";
        case PeFormat::IMAGE_FILE_MACHINE_IA64:
            return "IA64";
        case PeFormat::IMAGE_FILE_MACHINE_AMD64:
            return "AMD64";
        case PeFormat::IMAGE_FILE_MACHINE_ARM64:
            return "ARM64";
        case PeFormat::IMAGE_FILE_MACHINE_RISCV64:
            return "RISCV64";
        default:
            return hexName(machine);
    }
}

std::string subsystem(uint16_t subsystem) {
    switch (subsystem) {
        case 1:
            return "NATIVE";
        case 2:
            return "WINDOWS_GUI";
        case 3:
            return "WINDOWS_CUI";
        case 9:
            return "WINDOWS_CE_GUI";
        case 10:
            return "EFI_APPLICATION";
        case 11:
            return "EFI_BOOT_SERVICE_DRIVER";
        case 12:
            return "EFI_RUNTIME_DRIVER";
        default:
            return std::to_string(subsystem);
    }
}

}  // namespace PeNames

#undef NAME_CASE
