/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include "BinStructures.h"
#include "OffsetLocator.h"

class ThreadPool;

/**
 * @file CorrelationReporter.h
 * @brief Pattern matches joined with the ranges that contain them
 *
 * One MatchReport per match offset, in ascending offset order. Each report
 * lists its containing ranges in the locator's build order. A model with no
 * ranges still yields one report per match, each with an empty range list.
 */

class CorrelationReporter {
public:
    explicit CorrelationReporter(const OffsetLocator& locator) : locator_(locator) {}

    /**
     * @brief Search the haystack and correlate every match
     * @param pool Optional pool; when given the search runs in parallel
     * @throws SearchPatternError if the needle is empty
     */
    std::vector<MatchReport> correlate(const uint8_t* haystack,
                                       size_t size,
                                       const std::vector<uint8_t>& needle,
                                       ThreadPool* pool = nullptr) const;

    /**
     * @brief Correlate offsets found elsewhere
     */
    std::vector<MatchReport> correlateOffsets(const std::vector<uint64_t>& offsets) const;

private:
    const OffsetLocator& locator_;
};
