/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include "BinStructures.h"

/**
 * @file ArchiveReader.h
 * @brief Unix ar archive listing through libelf
 *
 * Member headers come from elf_getarhdr() while stepping through the archive
 * with elf_begin()/elf_next(); the symbol index comes from elf_getarsym().
 * The symbol table and long-name members ("/", "//", "/SYM64/") are not
 * listed as members.
 */

class ArchiveReader {
public:
    /**
     * @brief Decode an ar archive
     * @throws BinaryFileError if libelf does not recognize the archive
     */
    static ArchiveModel read(const uint8_t* data, size_t size, const std::string& filename = "");
};
