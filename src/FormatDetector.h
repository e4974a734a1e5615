/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstddef>
#include <cstdint>
#include "BinStructures.h"

/**
 * @file FormatDetector.h
 * @brief Container format identification from leading magic bytes
 */

class FormatDetector {
public:
    /**
     * @brief Identify the container format of a file image
     * @param data File bytes
     * @param size Number of bytes available
     * @return Detected format, BinaryFormat::Unknown if no magic matches
     */
    static BinaryFormat detect(const uint8_t* data, size_t size);

    /**
     * @brief Leading bytes as a little-endian integer, for "unknown magic" reports
     *
     * Uses up to the first 8 bytes; shorter files are zero-extended.
     */
    static uint64_t peekMagic(const uint8_t* data, size_t size);

    static const char* formatName(BinaryFormat format);
};
