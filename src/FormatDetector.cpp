/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "FormatDetector.h"
#include <algorithm>
#include <cstring>
#include "BinMemoryValidator.h"
#include "MachOFormat.h"

namespace {
constexpr char ARCHIVE_MAGIC[] = "!<arch>\n";
constexpr size_t ARCHIVE_MAGIC_SIZE = 8;

/// Smallest class file major version; a fat header never has this many arches
constexpr uint32_t JAVA_MIN_CLASS_VERSION = 43;
}  // namespace

BinaryFormat FormatDetector::detect(const uint8_t* data, size_t size) {
    if (data == nullptr || size < 4) {
        return BinaryFormat::Unknown;
    }

    if (data[0] == 0x7f && data[1] == 'E' && data[2] == 'L' && data[3] == 'F') {
        return BinaryFormat::Elf;
    }

    if (size >= ARCHIVE_MAGIC_SIZE && std::memcmp(data, ARCHIVE_MAGIC, ARCHIVE_MAGIC_SIZE) == 0) {
        return BinaryFormat::Archive;
    }

    BinReaderUtils::BinMemoryValidator big_endian(data, size, "", false);
    uint32_t magic_be = big_endian.readU32(0, "magic");

    // Java class files share 0xcafebabe; their version word is always >= 43
    if (magic_be == MachOFormat::FAT_MAGIC || magic_be == MachOFormat::FAT_MAGIC_64) {
        if (size >= MachOFormat::FAT_HEADER_SIZE) {
            uint32_t nfat_arch = big_endian.readU32(4, "nfat_arch");
            if (nfat_arch > 0 && nfat_arch < JAVA_MIN_CLASS_VERSION) {
                return BinaryFormat::MachFat;
            }
        }
        return BinaryFormat::Unknown;
    }

    switch (magic_be) {
        case MachOFormat::MH_MAGIC:
        case MachOFormat::MH_CIGAM:
        case MachOFormat::MH_MAGIC_64:
        case MachOFormat::MH_CIGAM_64:
            return BinaryFormat::MachO;
        default:
            break;
    }

    if (data[0] == 'M' && data[1] == 'Z') {
        return BinaryFormat::PE;
    }

    return BinaryFormat::Unknown;
}

uint64_t FormatDetector::peekMagic(const uint8_t* data, size_t size) {
    uint64_t magic = 0;
    size_t count = std::min<size_t>(size, 8);
    for (size_t i = 0; i < count; ++i) {
        magic |= static_cast<uint64_t>(data[i]) << (8 * i);
    }
    return magic;
}

const char* FormatDetector::formatName(BinaryFormat format) {
    switch (format) {
        case BinaryFormat::Elf:
            return "ELF";
        case BinaryFormat::MachO:
            return "Mach-O";
        case BinaryFormat::MachFat:
            return "Mach-O (fat)";
        case BinaryFormat::PE:
            return "PE";
        case BinaryFormat::Archive:
            return "Archive";
        case BinaryFormat::Unknown:
            break;
    }
    return "Unknown";
}
