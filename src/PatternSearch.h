/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

class ThreadPool;

/**
 * @file PatternSearch.h
 * @brief Exact byte-pattern search over a file image
 *
 * Matching is byte-wise and case-sensitive. Overlapping matches are all
 * reported, so searching "aa" in "aaa" yields offsets 0 and 1. Results are
 * strictly ascending.
 *
 * ## Parallel search:
 * The haystack is split into fixed-size chunks scanned on a ThreadPool.
 * Each chunk's scan window extends needle.size() - 1 bytes into the next
 * chunk so matches straddling a boundary are found; only matches starting
 * inside the chunk are kept. The merged result is sorted and deduplicated,
 * and always equals findAll().
 */

class PatternSearch {
public:
    static constexpr size_t DEFAULT_CHUNK_SIZE = 4 * 1024 * 1024;

    /**
     * @brief Find every occurrence of a needle
     * @throws SearchPatternError if the needle is empty
     */
    static std::vector<uint64_t> findAll(const uint8_t* haystack,
                                         size_t size,
                                         const std::vector<uint8_t>& needle);

    /**
     * @brief Chunked parallel variant of findAll()
     * @param pool Workers used to scan the chunks
     * @param chunk_size Bytes per task (0 selects DEFAULT_CHUNK_SIZE)
     * @throws SearchPatternError if the needle is empty
     */
    static std::vector<uint64_t> findAllParallel(const uint8_t* haystack,
                                                 size_t size,
                                                 const std::vector<uint8_t>& needle,
                                                 ThreadPool& pool,
                                                 size_t chunk_size = DEFAULT_CHUNK_SIZE);

    /**
     * @brief Parse a hex byte string such as "7f 45 4c 46" or "deadbeef"
     * @throws SearchPatternError on odd digit counts or non-hex characters
     */
    static std::vector<uint8_t> parseHexPattern(const std::string& text);

    /**
     * @brief Validate a hex byte string without throwing
     * @param error Receives the reason on failure
     */
    static bool isValidHexPattern(const std::string& text, std::string& error);

    static std::vector<uint8_t> fromText(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }
};
