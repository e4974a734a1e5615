/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/**
 * @file MachOFormat.h
 * @brief Mach-O on-disk constants and record layouts
 *
 * Values follow <mach-o/loader.h>, <mach-o/fat.h> and <mach-o/nlist.h>. They are
 * defined here because those headers are not available outside Apple SDKs.
 * Record layouts are given as byte offsets; MachOReader decodes every field
 * through BinMemoryValidator so both byte orders are handled.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace MachOFormat {

// ============================================================================
// Magic Numbers
// ============================================================================

constexpr uint32_t MH_MAGIC = 0xfeedface;     ///< 32-bit, host order
constexpr uint32_t MH_CIGAM = 0xcefaedfe;     ///< 32-bit, swapped
constexpr uint32_t MH_MAGIC_64 = 0xfeedfacf;  ///< 64-bit, host order
constexpr uint32_t MH_CIGAM_64 = 0xcffaedfe;  ///< 64-bit, swapped
constexpr uint32_t FAT_MAGIC = 0xcafebabe;    ///< Fat header, always big-endian
constexpr uint32_t FAT_MAGIC_64 = 0xcafebabf;

// ============================================================================
// File Types
// ============================================================================

constexpr uint32_t MH_OBJECT = 0x1;
constexpr uint32_t MH_EXECUTE = 0x2;
constexpr uint32_t MH_FVMLIB = 0x3;
constexpr uint32_t MH_CORE = 0x4;
constexpr uint32_t MH_PRELOAD = 0x5;
constexpr uint32_t MH_DYLIB = 0x6;
constexpr uint32_t MH_DYLINKER = 0x7;
constexpr uint32_t MH_BUNDLE = 0x8;
constexpr uint32_t MH_DYLIB_STUB = 0x9;
constexpr uint32_t MH_DSYM = 0xa;
constexpr uint32_t MH_KEXT_BUNDLE = 0xb;
constexpr uint32_t MH_FILESET = 0xc;

// ============================================================================
// CPU Types
// ============================================================================

constexpr uint32_t CPU_ARCH_ABI64 = 0x01000000;
constexpr uint32_t CPU_ARCH_ABI64_32 = 0x02000000;
constexpr uint32_t CPU_TYPE_X86 = 7;
constexpr uint32_t CPU_TYPE_X86_64 = CPU_TYPE_X86 | CPU_ARCH_ABI64;
constexpr uint32_t CPU_TYPE_ARM = 12;
constexpr uint32_t CPU_TYPE_ARM64 = CPU_TYPE_ARM | CPU_ARCH_ABI64;
constexpr uint32_t CPU_TYPE_ARM64_32 = CPU_TYPE_ARM | CPU_ARCH_ABI64_32;
constexpr uint32_t CPU_TYPE_POWERPC = 18;
constexpr uint32_t CPU_TYPE_POWERPC64 = CPU_TYPE_POWERPC | CPU_ARCH_ABI64;

// ============================================================================
// Load Commands
// ============================================================================

constexpr uint32_t LC_REQ_DYLD = 0x80000000;
constexpr uint32_t LC_SEGMENT = 0x1;
constexpr uint32_t LC_SYMTAB = 0x2;
constexpr uint32_t LC_SYMSEG = 0x3;
constexpr uint32_t LC_THREAD = 0x4;
constexpr uint32_t LC_UNIXTHREAD = 0x5;
constexpr uint32_t LC_LOADFVMLIB = 0x6;
constexpr uint32_t LC_IDFVMLIB = 0x7;
constexpr uint32_t LC_IDENT = 0x8;
constexpr uint32_t LC_FVMFILE = 0x9;
constexpr uint32_t LC_PREPAGE = 0xa;
constexpr uint32_t LC_DYSYMTAB = 0xb;
constexpr uint32_t LC_LOAD_DYLIB = 0xc;
constexpr uint32_t LC_ID_DYLIB = 0xd;
constexpr uint32_t LC_LOAD_DYLINKER = 0xe;
constexpr uint32_t LC_ID_DYLINKER = 0xf;
constexpr uint32_t LC_PREBOUND_DYLIB = 0x10;
constexpr uint32_t LC_ROUTINES = 0x11;
constexpr uint32_t LC_SUB_FRAMEWORK = 0x12;
constexpr uint32_t LC_SUB_UMBRELLA = 0x13;
constexpr uint32_t LC_SUB_CLIENT = 0x14;
constexpr uint32_t LC_SUB_LIBRARY = 0x15;
constexpr uint32_t LC_TWOLEVEL_HINTS = 0x16;
constexpr uint32_t LC_PREBIND_CKSUM = 0x17;
constexpr uint32_t LC_LOAD_WEAK_DYLIB = 0x18 | LC_REQ_DYLD;
constexpr uint32_t LC_SEGMENT_64 = 0x19;
constexpr uint32_t LC_ROUTINES_64 = 0x1a;
constexpr uint32_t LC_UUID = 0x1b;
constexpr uint32_t LC_RPATH = 0x1c | LC_REQ_DYLD;
constexpr uint32_t LC_CODE_SIGNATURE = 0x1d;
constexpr uint32_t LC_SEGMENT_SPLIT_INFO = 0x1e;
constexpr uint32_t LC_REEXPORT_DYLIB = 0x1f | LC_REQ_DYLD;
constexpr uint32_t LC_LAZY_LOAD_DYLIB = 0x20;
constexpr uint32_t LC_ENCRYPTION_INFO = 0x21;
constexpr uint32_t LC_DYLD_INFO = 0x22;
constexpr uint32_t LC_DYLD_INFO_ONLY = 0x22 | LC_REQ_DYLD;
constexpr uint32_t LC_LOAD_UPWARD_DYLIB = 0x23 | LC_REQ_DYLD;
constexpr uint32_t LC_VERSION_MIN_MACOSX = 0x24;
constexpr uint32_t LC_VERSION_MIN_IPHONEOS = 0x25;
constexpr uint32_t LC_FUNCTION_STARTS = 0x26;
constexpr uint32_t LC_DYLD_ENVIRONMENT = 0x27;
constexpr uint32_t LC_MAIN = 0x28 | LC_REQ_DYLD;
constexpr uint32_t LC_DATA_IN_CODE = 0x29;
constexpr uint32_t LC_SOURCE_VERSION = 0x2a;
constexpr uint32_t LC_DYLIB_CODE_SIGN_DRS = 0x2b;
constexpr uint32_t LC_ENCRYPTION_INFO_64 = 0x2c;
constexpr uint32_t LC_LINKER_OPTION = 0x2d;
constexpr uint32_t LC_LINKER_OPTIMIZATION_HINT = 0x2e;
constexpr uint32_t LC_VERSION_MIN_TVOS = 0x2f;
constexpr uint32_t LC_VERSION_MIN_WATCHOS = 0x30;
constexpr uint32_t LC_NOTE = 0x31;
constexpr uint32_t LC_BUILD_VERSION = 0x32;
constexpr uint32_t LC_DYLD_EXPORTS_TRIE = 0x33 | LC_REQ_DYLD;
constexpr uint32_t LC_DYLD_CHAINED_FIXUPS = 0x34 | LC_REQ_DYLD;
constexpr uint32_t LC_FILESET_ENTRY = 0x35 | LC_REQ_DYLD;

// ============================================================================
// Record Sizes and Field Offsets
// ============================================================================

constexpr size_t MACH_HEADER_SIZE = 28;
constexpr size_t MACH_HEADER_64_SIZE = 32;
constexpr size_t LOAD_COMMAND_SIZE = 8;  ///< cmd + cmdsize
constexpr size_t FAT_HEADER_SIZE = 8;
constexpr size_t FAT_ARCH_SIZE = 20;
constexpr size_t FAT_ARCH_64_SIZE = 32;

constexpr size_t SEGMENT_COMMAND_SIZE = 56;
constexpr size_t SEGMENT_COMMAND_64_SIZE = 72;
constexpr size_t SECTION_SIZE = 68;
constexpr size_t SECTION_64_SIZE = 80;
constexpr size_t NAME_FIELD_SIZE = 16;  ///< segname / sectname width

constexpr size_t NLIST_SIZE = 12;
constexpr size_t NLIST_64_SIZE = 16;

// ============================================================================
// Symbol Table (nlist)
// ============================================================================

constexpr uint8_t N_STAB = 0xe0;
constexpr uint8_t N_PEXT = 0x10;
constexpr uint8_t N_TYPE = 0x0e;
constexpr uint8_t N_EXT = 0x01;
constexpr uint8_t N_UNDF = 0x0;
constexpr uint8_t N_ABS = 0x2;
constexpr uint8_t N_SECT = 0xe;
constexpr uint8_t N_PBUD = 0xc;
constexpr uint8_t N_INDR = 0xa;
constexpr uint16_t N_WEAK_REF = 0x0040;  ///< n_desc: weak undefined reference

/// Library ordinal stored in the high byte of n_desc for two-level namespaces
inline int getLibraryOrdinal(uint16_t n_desc) {
    return (n_desc >> 8) & 0xff;
}

constexpr int SELF_LIBRARY_ORDINAL = 0x0;
constexpr int DYNAMIC_LOOKUP_ORDINAL = 0xfe;
constexpr int EXECUTABLE_ORDINAL = 0xff;

// ============================================================================
// dyld Bind Opcodes
// ============================================================================

constexpr uint8_t BIND_TYPE_POINTER = 1;
constexpr uint8_t BIND_SPECIAL_DYLIB_SELF = 0;
constexpr uint8_t BIND_SPECIAL_DYLIB_MAIN_EXECUTABLE = 0xff;  // -1
constexpr uint8_t BIND_SPECIAL_DYLIB_FLAT_LOOKUP = 0xfe;      // -2
constexpr uint8_t BIND_SYMBOL_FLAGS_WEAK_IMPORT = 0x1;
constexpr uint8_t BIND_OPCODE_MASK = 0xF0;
constexpr uint8_t BIND_IMMEDIATE_MASK = 0x0F;
constexpr uint8_t BIND_OPCODE_DONE = 0x00;
constexpr uint8_t BIND_OPCODE_SET_DYLIB_ORDINAL_IMM = 0x10;
constexpr uint8_t BIND_OPCODE_SET_DYLIB_ORDINAL_ULEB = 0x20;
constexpr uint8_t BIND_OPCODE_SET_DYLIB_SPECIAL_IMM = 0x30;
constexpr uint8_t BIND_OPCODE_SET_SYMBOL_TRAILING_FLAGS_IMM = 0x40;
constexpr uint8_t BIND_OPCODE_SET_TYPE_IMM = 0x50;
constexpr uint8_t BIND_OPCODE_SET_ADDEND_SLEB = 0x60;
constexpr uint8_t BIND_OPCODE_SET_SEGMENT_AND_OFFSET_ULEB = 0x70;
constexpr uint8_t BIND_OPCODE_ADD_ADDR_ULEB = 0x80;
constexpr uint8_t BIND_OPCODE_DO_BIND = 0x90;
constexpr uint8_t BIND_OPCODE_DO_BIND_ADD_ADDR_ULEB = 0xA0;
constexpr uint8_t BIND_OPCODE_DO_BIND_ADD_ADDR_IMM_SCALED = 0xB0;
constexpr uint8_t BIND_OPCODE_DO_BIND_ULEB_TIMES_SKIPPING_ULEB = 0xC0;
constexpr uint8_t BIND_OPCODE_THREADED = 0xD0;

// ============================================================================
// Export Trie
// ============================================================================

constexpr uint64_t EXPORT_SYMBOL_FLAGS_KIND_MASK = 0x03;
constexpr uint64_t EXPORT_SYMBOL_FLAGS_KIND_REGULAR = 0x00;
constexpr uint64_t EXPORT_SYMBOL_FLAGS_KIND_THREAD_LOCAL = 0x01;
constexpr uint64_t EXPORT_SYMBOL_FLAGS_KIND_ABSOLUTE = 0x02;
constexpr uint64_t EXPORT_SYMBOL_FLAGS_WEAK_DEFINITION = 0x04;
constexpr uint64_t EXPORT_SYMBOL_FLAGS_REEXPORT = 0x08;
constexpr uint64_t EXPORT_SYMBOL_FLAGS_STUB_AND_RESOLVER = 0x10;

// ============================================================================
// Thread State Flavors (LC_UNIXTHREAD entry point)
// ============================================================================

constexpr uint32_t x86_THREAD_STATE32 = 1;
constexpr uint32_t x86_THREAD_STATE64 = 4;
constexpr uint32_t ARM_THREAD_STATE = 1;
constexpr uint32_t ARM_THREAD_STATE64 = 6;

}  // namespace MachOFormat
