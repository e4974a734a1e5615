/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "CorrelationReporter.h"
#include "PatternSearch.h"
#include "ThreadPool.h"

std::vector<MatchReport> CorrelationReporter::correlate(const uint8_t* haystack,
                                                        size_t size,
                                                        const std::vector<uint8_t>& needle,
                                                        ThreadPool* pool) const {
    std::vector<uint64_t> offsets = pool != nullptr
                                        ? PatternSearch::findAllParallel(haystack, size, needle, *pool)
                                        : PatternSearch::findAll(haystack, size, needle);
    return correlateOffsets(offsets);
}

std::vector<MatchReport> CorrelationReporter::correlateOffsets(
    const std::vector<uint64_t>& offsets) const {
    std::vector<MatchReport> reports;
    reports.reserve(offsets.size());
    for (uint64_t offset : offsets) {
        reports.push_back({offset, locator_.rangesContaining(offset)});
    }
    return reports;
}
