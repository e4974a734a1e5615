/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "PatternSearch.h"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <future>
#include "BinExceptions.h"
#include "ThreadPool.h"

using BinReaderExceptions::SearchPatternError;

namespace {

/**
 * @brief Scan [begin, end) for matches starting before keep_end
 */
std::vector<uint64_t> scanWindow(const uint8_t* haystack,
                                 size_t begin,
                                 size_t end,
                                 size_t keep_end,
                                 const std::vector<uint8_t>& needle) {
    std::vector<uint64_t> matches;
    const size_t length = needle.size();
    if (end - begin < length) {
        return matches;
    }

    const uint8_t first = needle.front();
    const size_t last_start = end - length;
    size_t position = begin;
    while (position <= last_start && position < keep_end) {
        const void* found = std::memchr(haystack + position, first, last_start - position + 1);
        if (found == nullptr) {
            break;
        }
        position = static_cast<size_t>(static_cast<const uint8_t*>(found) - haystack);
        if (position >= keep_end) {
            break;
        }
        if (std::memcmp(haystack + position, needle.data(), length) == 0) {
            matches.push_back(position);
        }
        ++position;  // overlapping matches
    }
    return matches;
}

void requireNeedle(const std::vector<uint8_t>& needle) {
    if (needle.empty()) {
        throw SearchPatternError("Search pattern must not be empty");
    }
}

int hexDigit(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    return -1;
}

}  // namespace

std::vector<uint64_t> PatternSearch::findAll(const uint8_t* haystack,
                                             size_t size,
                                             const std::vector<uint8_t>& needle) {
    requireNeedle(needle);
    if (haystack == nullptr) {
        return {};
    }
    return scanWindow(haystack, 0, size, size, needle);
}

std::vector<uint64_t> PatternSearch::findAllParallel(const uint8_t* haystack,
                                                     size_t size,
                                                     const std::vector<uint8_t>& needle,
                                                     ThreadPool& pool,
                                                     size_t chunk_size) {
    requireNeedle(needle);
    if (haystack == nullptr) {
        return {};
    }
    if (chunk_size == 0) {
        chunk_size = DEFAULT_CHUNK_SIZE;
    }

    const size_t overlap = needle.size() - 1;
    std::vector<std::future<std::vector<uint64_t>>> chunks;
    for (size_t begin = 0; begin < size; begin += std::min(chunk_size, size - begin)) {
        size_t keep_end = begin + std::min(chunk_size, size - begin);
        size_t window_end = std::min(size, keep_end + std::min(overlap, size - keep_end));
        chunks.push_back(pool.submit(scanWindow, haystack, begin, window_end, keep_end,
                                     std::cref(needle)));
    }

    std::vector<uint64_t> matches;
    for (auto& chunk : chunks) {
        std::vector<uint64_t> part = chunk.get();
        matches.insert(matches.end(), part.begin(), part.end());
    }
    std::sort(matches.begin(), matches.end());
    matches.erase(std::unique(matches.begin(), matches.end()), matches.end());
    return matches;
}

bool PatternSearch::isValidHexPattern(const std::string& text, std::string& error) {
    size_t digits = 0;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        if (hexDigit(c) < 0) {
            error = std::string("Invalid hex digit '") + c + "' in search pattern";
            return false;
        }
        ++digits;
    }
    if (digits == 0) {
        error = "Hex search pattern is empty";
        return false;
    }
    if (digits % 2 != 0) {
        error = "Hex search pattern has an odd number of digits";
        return false;
    }
    return true;
}

std::vector<uint8_t> PatternSearch::parseHexPattern(const std::string& text) {
    std::string error;
    if (!isValidHexPattern(text, error)) {
        throw SearchPatternError(error, text);
    }

    std::vector<uint8_t> bytes;
    int high = -1;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        int value = hexDigit(c);
        if (high < 0) {
            high = value;
        } else {
            bytes.push_back(static_cast<uint8_t>((high << 4) | value));
            high = -1;
        }
    }
    return bytes;
}
