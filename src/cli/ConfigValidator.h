/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <string>
#include <vector>
#include "BinaryInspector.h"

/**
 * @file ConfigValidator.h
 * @brief Configuration validation and conflict detection
 *
 * Checks a parsed Config before any file is decoded, so that option
 * conflicts and malformed patterns are reported with a clear message.
 */

/**
 * @class ConfigValidator
 * @brief Validates configuration options and detects conflicts
 *
 * ## Validation Categories:
 * - **Mutual Exclusion**: --search and --search-hex
 * - **Pattern Validation**: hex strings must hold an even number of hex digits
 * - **File Access**: input file existence, readability and non-zero size
 * - **Logical Consistency**: combinations that are accepted but ignored (warnings)
 *
 * ## Usage:
 * ```cpp
 * auto result = ConfigValidator::validate(config);
 * if (!result.is_valid) {
 *     std::cerr << "Configuration error: " << result.error_message << std::endl;
 *     return 1;
 * }
 * ```
 */
class ConfigValidator {
public:
    /**
     * @brief Validation result structure
     */
    struct ValidationResult {
        bool is_valid = true;           ///< Whether configuration is valid
        std::string error_message;      ///< Detailed error message if invalid
        std::vector<std::string> warnings; ///< Non-fatal warnings
    };

    /**
     * @brief Validate complete configuration
     *
     * @param config Configuration to validate
     * @return ValidationResult with validation status and messages
     */
    static ValidationResult validate(const Config& config);

    /**
     * @brief Simple validation with error string
     *
     * @param config Configuration to validate
     * @param error Output parameter for error message
     * @return true if valid, false if errors found
     */
    static bool validate(const Config& config, std::string& error);

    static bool validateMutualExclusion(const Config& config, std::string& error);

    /**
     * @brief Validate the hex search pattern, if one was given
     */
    static bool validateSearchPattern(const Config& config, std::string& error);

    /**
     * @brief Validate input file accessibility
     *
     * @param filepath Path to input file
     * @param error Output parameter for error message
     * @return true if file is accessible, false otherwise
     */
    static bool validateInputFile(const std::string& filepath, std::string& error);

    /**
     * @brief Collect warnings for accepted but ineffective combinations
     * @return true always (generates warnings, not errors)
     */
    static bool checkLogicalConsistency(const Config& config, std::vector<std::string>& warnings);
};
