/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "BinStructures.h"

/**
 * @file MachOReader.h
 * @brief Mach-O and universal (fat) binary decoding
 *
 * MachOReader decodes 32- and 64-bit Mach-O images of either byte order
 * directly from the file bytes. All reads go through BinMemoryValidator.
 *
 * ## Decoded content:
 * - Header and load command table (cmd, cmdsize, file offset)
 * - LC_SEGMENT / LC_SEGMENT_64 with their sections
 * - LC_SYMTAB nlist entries
 * - Dependent dylibs, LC_ID_DYLIB install name
 * - Entry point from LC_MAIN or LC_UNIXTHREAD
 * - Exports from the dyld export trie
 * - Imports from the bind / lazy bind opcode streams, or from undefined
 *   external nlist entries when no dyld info is present
 *
 * A load command whose cmdsize overruns the command area is fatal. A malformed
 * export trie or bind stream only empties that list and is recorded in
 * MachOModel::warnings.
 *
 * Fat slices are decoded against their own bytes, then every file offset in
 * the model is rebased by the slice offset so the model correlates against the
 * whole fat file.
 */

class MachOReader {
public:
    /**
     * @brief Decode a single-architecture Mach-O image
     * @throws BinaryFileError on a bad magic or a malformed load command table
     * @throws MemoryAccessError on truncated structures
     */
    static MachOModel read(const uint8_t* data, size_t size, const std::string& filename = "");

    /**
     * @brief Read the fat_arch table of a universal binary
     * @throws BinaryFileError if the header or arch table is malformed
     */
    static std::vector<MachOFatArch> readFatArches(const uint8_t* data,
                                                   size_t size,
                                                   const std::string& filename = "");

    /**
     * @brief Decode one fat slice with offsets absolute to the fat file
     * @throws BinaryFileError if the slice lies outside the file
     */
    static MachOModel readSlice(const uint8_t* data,
                                size_t size,
                                const MachOFatArch& arch,
                                const std::string& filename = "");
};
