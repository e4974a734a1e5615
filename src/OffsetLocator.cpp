/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "OffsetLocator.h"

std::vector<LocatedRange> OffsetLocator::rangesContaining(uint64_t offset) const {
    std::vector<LocatedRange> located;
    for (const auto& range : ranges_) {
        if (range.contains(offset)) {
            located.push_back({range, normalize(range, offset)});
        }
    }
    return located;
}

std::optional<uint64_t> OffsetLocator::normalize(const Range& range, uint64_t offset) {
    if (!range.virtual_address) {
        return std::nullopt;
    }
    return *range.virtual_address + (offset - range.file_offset);
}
