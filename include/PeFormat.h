/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/**
 * @file PeFormat.h
 * @brief PE/COFF on-disk constants and record layouts
 *
 * Values follow the Microsoft PE/COFF specification (winnt.h naming). Layouts
 * are byte offsets decoded little-endian through BinMemoryValidator.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace PeFormat {

constexpr uint16_t IMAGE_DOS_SIGNATURE = 0x5A4D;     ///< "MZ"
constexpr uint32_t IMAGE_NT_SIGNATURE = 0x00004550;  ///< "PE\0\0"
constexpr uint16_t IMAGE_NT_OPTIONAL_HDR32_MAGIC = 0x10b;
constexpr uint16_t IMAGE_NT_OPTIONAL_HDR64_MAGIC = 0x20b;

constexpr size_t DOS_E_LFANEW_OFFSET = 0x3c;
constexpr size_t FILE_HEADER_SIZE = 20;
constexpr size_t SECTION_HEADER_SIZE = 40;
constexpr size_t SECTION_NAME_SIZE = 8;
constexpr size_t IMPORT_DESCRIPTOR_SIZE = 20;
constexpr size_t EXPORT_DIRECTORY_SIZE = 40;

// Optional header field offsets (relative to the optional header start)
constexpr size_t OPT_ADDRESS_OF_ENTRY_POINT = 16;
constexpr size_t OPT32_IMAGE_BASE = 28;
constexpr size_t OPT64_IMAGE_BASE = 24;
constexpr size_t OPT_SUBSYSTEM = 68;
constexpr size_t OPT32_NUMBER_OF_RVA_AND_SIZES = 92;
constexpr size_t OPT64_NUMBER_OF_RVA_AND_SIZES = 108;
constexpr size_t OPT32_DATA_DIRECTORIES = 96;
constexpr size_t OPT64_DATA_DIRECTORIES = 112;

constexpr uint32_t IMAGE_DIRECTORY_ENTRY_EXPORT = 0;
constexpr uint32_t IMAGE_DIRECTORY_ENTRY_IMPORT = 1;

constexpr uint16_t IMAGE_FILE_DLL = 0x2000;
constexpr uint32_t IMAGE_ORDINAL_FLAG32 = 0x80000000u;
constexpr uint64_t IMAGE_ORDINAL_FLAG64 = 0x8000000000000000ull;

// Machine types
constexpr uint16_t IMAGE_FILE_MACHINE_UNKNOWN = 0x0;
constexpr uint16_t IMAGE_FILE_MACHINE_I386 = 0x14c;
constexpr uint16_t IMAGE_FILE_MACHINE_ARM = 0x1c0;
constexpr uint16_t IMAGE_FILE_MACHINE_ARMNT = 0x1c4;
constexpr uint16_t IMAGE_FILE_MACHINE_IA64 = 0x200;
constexpr uint16_t IMAGE_FILE_MACHINE_AMD64 = 0x8664;
constexpr uint16_t IMAGE_FILE_MACHINE_ARM64 = 0xaa64;
constexpr uint16_t IMAGE_FILE_MACHINE_RISCV64 = 0x5064;

// Section characteristics
constexpr uint32_t IMAGE_SCN_CNT_CODE = 0x00000020;
constexpr uint32_t IMAGE_SCN_CNT_INITIALIZED_DATA = 0x00000040;
constexpr uint32_t IMAGE_SCN_CNT_UNINITIALIZED_DATA = 0x00000080;
constexpr uint32_t IMAGE_SCN_MEM_DISCARDABLE = 0x02000000;
constexpr uint32_t IMAGE_SCN_MEM_SHARED = 0x10000000;
constexpr uint32_t IMAGE_SCN_MEM_EXECUTE = 0x20000000;
constexpr uint32_t IMAGE_SCN_MEM_READ = 0x40000000;
constexpr uint32_t IMAGE_SCN_MEM_WRITE = 0x80000000;

}  // namespace PeFormat
