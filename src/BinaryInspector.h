/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "BinStructures.h"
#include "FileAccessStrategy.h"

class ReportPrinter;

/**
 * @brief Runtime options for one bintk invocation
 *
 * Filled in by CLI11Parser and checked by ConfigValidator before analysis.
 */
struct Config {
    std::string inputFile;
    std::optional<std::string> searchText;  ///< -s: literal bytes of the text
    std::optional<std::string> searchHex;   ///< -x: hex byte string
    bool demangle = false;                  ///< Demangle C++ symbol names
    bool pretty = false;                    ///< Column tables instead of listings
    bool color = false;                     ///< ANSI styling when stdout is a terminal
    bool json = false;                      ///< Range table and matches as JSON
    bool debug = false;                     ///< Print the normalized Range table
    int verbosity = 0;
    size_t threadCount = 0;  ///< Search workers (0 = auto-detect, 1 = sequential)
    size_t mmapThreshold =
        FileAccessConfig::DEFAULT_MMAP_THRESHOLD;  ///< Memory mapping threshold for large files

    bool hasSearch() const { return searchText.has_value() || searchHex.has_value(); }
};

/**
 * @class BinaryInspector
 * @brief Drives one analysis from file load to printed report
 *
 * ## Pipeline:
 * 1. Load the file through FileAccessStrategy (in-memory or mapped)
 * 2. Detect the container format from its magic
 * 3. Decode it with the matching reader
 * 4. Build the Range table with the format's StructuralModelAdapter
 * 5. Print the listing (or JSON), then correlate the search pattern if one
 *    was given
 *
 * A malformed search pattern is rejected before anything is printed.
 * Decoding failures propagate as BinaryParsingError, except for a single
 * failing fat slice, which is reported and skipped.
 */
class BinaryInspector {
public:
    explicit BinaryInspector(Config config, std::ostream& out = std::cout);

    /**
     * @brief Run the analysis
     * @throws BinaryParsingError on decoding failures or a bad search pattern
     * @throws FileAccessException if the file cannot be loaded
     */
    void analyze();

    /**
     * @brief Needle bytes and display label for the configured search
     * @return std::nullopt when no search was requested
     * @throws SearchPatternError if the pattern is empty or malformed
     */
    static std::optional<std::pair<std::string, std::vector<uint8_t>>> prepareNeedle(
        const Config& config);

private:
    void inspectElf(const uint8_t* data, size_t size, ReportPrinter& printer);
    void inspectMachO(const uint8_t* data, size_t size, ReportPrinter& printer);
    void inspectFat(const uint8_t* data, size_t size, ReportPrinter& printer);
    void inspectPe(const uint8_t* data, size_t size, ReportPrinter& printer);
    void inspectArchive(const uint8_t* data, size_t size, ReportPrinter& printer);

    void showRanges(const std::vector<Range>& ranges, ReportPrinter& printer) const;
    void reportWarnings(const std::vector<std::string>& warnings) const;

    /**
     * @brief Correlate the search pattern and print matches or the JSON document
     */
    void finish(BinaryFormat format,
                const std::vector<Range>& ranges,
                const uint8_t* data,
                size_t size,
                ReportPrinter& printer);

    Config config_;
    std::ostream& out_;
    std::optional<std::pair<std::string, std::vector<uint8_t>>> needle_;
};
