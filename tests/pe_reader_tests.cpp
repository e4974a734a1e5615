/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/**
 * @file pe_reader_tests.cpp
 * @brief PE/COFF header, section, import and export decoding
 */

#include <gtest/gtest.h>
#include "BinExceptions.h"
#include "PeFormat.h"
#include "PeReader.h"
#include "test_helpers.hpp"

using BinReaderExceptions::BinaryFileError;
using namespace PeFormat;

namespace {

constexpr size_t NT_OFFSET = 0x80;
constexpr size_t COFF_OFFSET = NT_OFFSET + 4;
constexpr size_t OPTIONAL_OFFSET = COFF_OFFSET + FILE_HEADER_SIZE;
constexpr uint16_t OPTIONAL_SIZE_64 = 240;
constexpr size_t SECTION_TABLE = OPTIONAL_OFFSET + OPTIONAL_SIZE_64;

// .rdata: RVA 0x2000 at file offset 0x400
constexpr uint32_t RDATA_RVA = 0x2000;
constexpr size_t RDATA_FILE = 0x400;

size_t rdata(uint32_t rva) {
    return RDATA_FILE + (rva - RDATA_RVA);
}

void putSection(std::vector<uint8_t>& image, size_t index, const std::string& name,
                uint32_t rva, uint32_t size, uint32_t raw_offset, uint32_t characteristics) {
    size_t header = SECTION_TABLE + index * SECTION_HEADER_SIZE;
    std::copy(name.begin(), name.end(), image.begin() + static_cast<std::ptrdiff_t>(header));
    putU32(image, header + 8, size);
    putU32(image, header + 12, rva);
    putU32(image, header + 16, size);
    putU32(image, header + 20, raw_offset);
    putU32(image, header + 36, characteristics);
}

/**
 * @brief PE32+ DLL with one import DLL and two exports
 *
 * Imports: KERNEL32.dll!ExitProcess (hint 0x123) and ordinal 5.
 * Exports: DoWork (ordinal 1) and an unnamed forwarder to NTDLL.RtlFoo (ordinal 2).
 */
std::vector<uint8_t> sampleDll() {
    std::vector<uint8_t> image(0x600, 0);

    putU16(image, 0, IMAGE_DOS_SIGNATURE);
    putU32(image, DOS_E_LFANEW_OFFSET, NT_OFFSET);
    putU32(image, NT_OFFSET, IMAGE_NT_SIGNATURE);

    putU16(image, COFF_OFFSET, IMAGE_FILE_MACHINE_AMD64);
    putU16(image, COFF_OFFSET + 2, 2);
    putU32(image, COFF_OFFSET + 4, 0x5f000000);
    putU16(image, COFF_OFFSET + 16, OPTIONAL_SIZE_64);
    putU16(image, COFF_OFFSET + 18, 0x2022);  // EXECUTABLE_IMAGE | LARGE_ADDRESS_AWARE | DLL

    putU16(image, OPTIONAL_OFFSET, IMAGE_NT_OPTIONAL_HDR64_MAGIC);
    putU32(image, OPTIONAL_OFFSET + OPT_ADDRESS_OF_ENTRY_POINT, 0x1010);
    putU64(image, OPTIONAL_OFFSET + OPT64_IMAGE_BASE, 0x180000000ull);
    putU16(image, OPTIONAL_OFFSET + OPT_SUBSYSTEM, 3);
    putU32(image, OPTIONAL_OFFSET + OPT64_NUMBER_OF_RVA_AND_SIZES, 16);
    putU32(image, OPTIONAL_OFFSET + OPT64_DATA_DIRECTORIES, 0x2100);      // export
    putU32(image, OPTIONAL_OFFSET + OPT64_DATA_DIRECTORIES + 4, 0x100);
    putU32(image, OPTIONAL_OFFSET + OPT64_DATA_DIRECTORIES + 8, 0x2000);  // import
    putU32(image, OPTIONAL_OFFSET + OPT64_DATA_DIRECTORIES + 12, 0x28);

    putSection(image, 0, ".text", 0x1000, 0x200, 0x200, IMAGE_SCN_CNT_CODE | IMAGE_SCN_MEM_EXECUTE);
    putSection(image, 1, ".rdata", RDATA_RVA, 0x200, RDATA_FILE, IMAGE_SCN_CNT_INITIALIZED_DATA);

    // Import descriptor followed by the null descriptor
    putU32(image, rdata(0x2000), 0x2040);       // OriginalFirstThunk
    putU32(image, rdata(0x2000) + 12, 0x2080);  // Name
    putU32(image, rdata(0x2000) + 16, 0x2060);  // FirstThunk
    for (uint32_t table : {0x2040u, 0x2060u}) {
        putU64(image, rdata(table), 0x2090);
        putU64(image, rdata(table) + 8, IMAGE_ORDINAL_FLAG64 | 5);
    }
    putString(image, rdata(0x2080), "KERNEL32.dll");
    putU16(image, rdata(0x2090), 0x123);
    putString(image, rdata(0x2092), "ExitProcess");

    // Export directory
    size_t exports = rdata(0x2100);
    putU32(image, exports + 12, 0x2180);  // Name
    putU32(image, exports + 16, 1);       // Base
    putU32(image, exports + 20, 2);       // NumberOfFunctions
    putU32(image, exports + 24, 1);       // NumberOfNames
    putU32(image, exports + 28, 0x2140);  // AddressOfFunctions
    putU32(image, exports + 32, 0x2150);  // AddressOfNames
    putU32(image, exports + 36, 0x2160);  // AddressOfNameOrdinals
    putU32(image, rdata(0x2140), 0x1010);
    putU32(image, rdata(0x2140) + 4, 0x21a0);
    putU32(image, rdata(0x2150), 0x2190);
    putU16(image, rdata(0x2160), 0);
    putString(image, rdata(0x2180), "test.dll");
    putString(image, rdata(0x2190), "DoWork");
    putString(image, rdata(0x21a0), "NTDLL.RtlFoo");
    return image;
}

}  // namespace

// ============================================================================
// Headers and sections
// ============================================================================

TEST(PeReader, DecodesHeaders) {
    std::vector<uint8_t> image = sampleDll();
    PeModel model = PeReader::read(image.data(), image.size());
    EXPECT_EQ(model.machine, IMAGE_FILE_MACHINE_AMD64);
    EXPECT_EQ(model.timestamp, 0x5f000000u);
    EXPECT_TRUE(model.is_64);
    EXPECT_TRUE(model.is_lib);
    EXPECT_EQ(model.image_base, 0x180000000ull);
    EXPECT_EQ(model.entry_rva, 0x1010u);
    EXPECT_EQ(model.subsystem, 3);
}

TEST(PeReader, DecodesSectionTable) {
    std::vector<uint8_t> image = sampleDll();
    PeModel model = PeReader::read(image.data(), image.size());
    ASSERT_EQ(model.sections.size(), 2u);
    EXPECT_EQ(model.sections[0].name, ".text");
    EXPECT_EQ(model.sections[1].name, ".rdata");
    EXPECT_EQ(model.sections[1].virtual_address, RDATA_RVA);
    EXPECT_EQ(model.sections[1].raw_offset, RDATA_FILE);
}

TEST(PeReader, TranslatesRvas) {
    std::vector<uint8_t> image = sampleDll();
    PeModel model = PeReader::read(image.data(), image.size());
    EXPECT_EQ(PeReader::rvaToOffset(model, 0x2010), std::optional<uint64_t>(0x410));
    EXPECT_EQ(PeReader::rvaToOffset(model, 0x100), std::optional<uint64_t>(0x100));
    EXPECT_FALSE(PeReader::rvaToOffset(model, 0x9000).has_value());
}

// ============================================================================
// Imports and exports
// ============================================================================

TEST(PeReader, DecodesImportsByNameAndOrdinal) {
    std::vector<uint8_t> image = sampleDll();
    PeModel model = PeReader::read(image.data(), image.size());
    ASSERT_EQ(model.libraries, std::vector<std::string>{"KERNEL32.dll"});
    ASSERT_EQ(model.imports.size(), 2u);

    EXPECT_EQ(model.imports[0].dll, "KERNEL32.dll");
    EXPECT_EQ(model.imports[0].name, "ExitProcess");
    EXPECT_EQ(model.imports[0].hint, 0x123);
    EXPECT_FALSE(model.imports[0].by_ordinal);
    EXPECT_EQ(model.imports[0].iat_rva, 0x2060u);

    EXPECT_TRUE(model.imports[1].by_ordinal);
    EXPECT_EQ(model.imports[1].ordinal, 5);
    EXPECT_TRUE(model.imports[1].name.empty());
    EXPECT_EQ(model.imports[1].iat_rva, 0x2068u);
}

TEST(PeReader, DecodesExportsAndForwarders) {
    std::vector<uint8_t> image = sampleDll();
    PeModel model = PeReader::read(image.data(), image.size());
    EXPECT_EQ(model.export_name, std::optional<std::string>("test.dll"));
    ASSERT_EQ(model.exports.size(), 2u);

    EXPECT_EQ(model.exports[0].name, "DoWork");
    EXPECT_EQ(model.exports[0].ordinal, 1u);
    EXPECT_EQ(model.exports[0].rva, 0x1010u);
    EXPECT_FALSE(model.exports[0].forwarder.has_value());

    EXPECT_TRUE(model.exports[1].name.empty());
    EXPECT_EQ(model.exports[1].ordinal, 2u);
    EXPECT_EQ(model.exports[1].forwarder, std::optional<std::string>("NTDLL.RtlFoo"));
}

// ============================================================================
// Malformed images
// ============================================================================

TEST(PeReader, RejectsMissingDosSignature) {
    std::vector<uint8_t> image = sampleDll();
    image[0] = 'X';
    EXPECT_THROW(PeReader::read(image.data(), image.size()), BinaryFileError);
}

TEST(PeReader, RejectsMissingPeSignature) {
    std::vector<uint8_t> image = sampleDll();
    putU32(image, NT_OFFSET, 0);
    EXPECT_THROW(PeReader::read(image.data(), image.size()), BinaryFileError);
}

TEST(PeReader, RejectsUnmappableImportDirectory) {
    std::vector<uint8_t> image = sampleDll();
    putU32(image, OPTIONAL_OFFSET + OPT64_DATA_DIRECTORIES + 8, 0x9000);
    EXPECT_THROW(PeReader::read(image.data(), image.size()), BinaryFileError);
}
