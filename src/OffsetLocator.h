/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include "BinStructures.h"

/**
 * @file OffsetLocator.h
 * @brief Resolution of raw file offsets to the ranges that contain them
 */

class OffsetLocator {
public:
    explicit OffsetLocator(std::vector<Range> ranges) : ranges_(std::move(ranges)) {}

    /**
     * @brief Every range containing an offset, with its normalized address
     * @param offset Raw file offset
     * @return Containing ranges in build order; empty if none
     *
     * Linear in the number of ranges.
     */
    std::vector<LocatedRange> rangesContaining(uint64_t offset) const;

    /**
     * @brief Map an offset inside a range to a virtual address
     * @return virtual_address + (offset - file_offset), or std::nullopt if unmapped
     */
    static std::optional<uint64_t> normalize(const Range& range, uint64_t offset);

    const std::vector<Range>& ranges() const { return ranges_; }

private:
    std::vector<Range> ranges_;
};
