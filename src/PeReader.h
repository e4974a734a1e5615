/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include "BinStructures.h"

/**
 * @file PeReader.h
 * @brief PE/COFF image decoding
 *
 * Reads the DOS stub pointer, COFF header, PE32/PE32+ optional header,
 * section table, and the import and export directories. RVAs are mapped to
 * file offsets through the section table.
 *
 * Header structures that cannot be read are fatal. Individual import or
 * export entries whose RVAs do not map into the file are skipped.
 */

class PeReader {
public:
    /**
     * @brief Decode a PE image
     * @throws BinaryFileError on bad signatures or an unmappable directory
     * @throws MemoryAccessError on truncated headers
     */
    static PeModel read(const uint8_t* data, size_t size, const std::string& filename = "");

    /**
     * @brief Translate an RVA to a file offset
     * @return Offset, or std::nullopt if no section holds file data for the RVA
     */
    static std::optional<uint64_t> rvaToOffset(const PeModel& model, uint32_t rva);
};
