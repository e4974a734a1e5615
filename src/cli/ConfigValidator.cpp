/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "ConfigValidator.h"
#include <fstream>
#include "PatternSearch.h"

ConfigValidator::ValidationResult ConfigValidator::validate(const Config& config) {
    ValidationResult result;
    std::string error;

    if (!validateMutualExclusion(config, error)) {
        result.is_valid = false;
        result.error_message = error;
        return result;
    }

    if (!validateSearchPattern(config, error)) {
        result.is_valid = false;
        result.error_message = error;
        return result;
    }

    if (!validateInputFile(config.inputFile, error)) {
        result.is_valid = false;
        result.error_message = error;
        return result;
    }

    checkLogicalConsistency(config, result.warnings);

    return result;
}

bool ConfigValidator::validate(const Config& config, std::string& error) {
    ValidationResult result = validate(config);
    if (!result.is_valid) {
        error = result.error_message;
        return false;
    }
    return true;
}

bool ConfigValidator::validateMutualExclusion(const Config& config, std::string& error) {
    if (config.searchText && config.searchHex) {
        error = "Cannot specify both --search and --search-hex. Choose one search pattern.";
        return false;
    }
    return true;
}

bool ConfigValidator::validateSearchPattern(const Config& config, std::string& error) {
    if (config.searchText && config.searchText->empty()) {
        error = "Search pattern must not be empty";
        return false;
    }
    if (config.searchHex && !PatternSearch::isValidHexPattern(*config.searchHex, error)) {
        return false;
    }
    return true;
}

bool ConfigValidator::validateInputFile(const std::string& filepath, std::string& error) {
    if (filepath.empty()) {
        error = "Input file path is empty";
        return false;
    }

    std::ifstream file(filepath, std::ios::binary);
    if (!file) {
        error = "Cannot open input file '" + filepath + "'. Please check that the file exists and is readable.";
        return false;
    }

    file.seekg(0, std::ios::end);
    auto file_size = file.tellg();
    if (file_size <= 0) {
        error = "Input file '" + filepath + "' is empty or cannot determine file size.";
        return false;
    }

    return true;
}

bool ConfigValidator::checkLogicalConsistency(const Config& config, std::vector<std::string>& warnings) {
    if (config.json && !config.hasSearch()) {
        warnings.push_back("--json without --search or --search-hex outputs the range table only.");
    }

    if (config.json && config.pretty) {
        warnings.push_back("--pretty has no effect with --json.");
    }

    if (config.json && config.debug) {
        warnings.push_back("--debug has no effect with --json; the range table is part of the JSON output.");
    }

    return true;
}
