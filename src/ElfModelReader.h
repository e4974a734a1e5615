/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include "BinStructures.h"

/**
 * @file ElfModelReader.h
 * @brief ELF decoding through libelf into an ElfModel
 *
 * ElfModelReader uses libelf's class- and byte-order-independent GElf API to
 * read headers, symbol tables, relocation sections and the dynamic table of a
 * file image already held in memory. The result is a self-contained ElfModel:
 * all names and string tables are copied out, so the model does not borrow
 * from libelf or from the input buffer.
 *
 * ## Relocation grouping:
 * - SHT_REL/SHT_RELA linked to .dynsym named .rel(a).plt, or located at
 *   DT_JMPREL: PLT relocations
 * - other SHT_RELA/SHT_REL linked to .dynsym: dynamic relas / rels
 * - everything else: section relocations grouped by target section (sh_info)
 *
 * @see ElfRangeAdapter for the Range view of the decoded headers
 */

class ElfModelReader {
public:
    /**
     * @brief Decode an ELF image
     * @param data File bytes
     * @param size Number of bytes
     * @param filename Name used in error context
     * @return Decoded model
     * @throws BinaryFileError if libelf rejects the image or it is not an ELF object
     */
    static ElfModel read(const uint8_t* data, size_t size, const std::string& filename = "");
};
