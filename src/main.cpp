/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/**
 * @file main.cpp
 * @brief bintk entry point
 *
 * @code
 * bintk /bin/ls                          # structural listing
 * bintk -s GLIBC /bin/ls                 # matches with containing sections and segments
 * bintk -x "7f 45 4c 46" --json lib.so   # range table and matches as JSON
 * @endcode
 *
 * Exit status is 0 on success and 1 on any usage, configuration or decoding error.
 */

#include <iostream>
#include <optional>
#include <stdexcept>
#include "BinExceptions.h"
#include "BinaryInspector.h"
#include "FileAccessStrategy.h"
#include "cli/CLI11Parser.h"
#include "cli/ConfigValidator.h"

int main(int argc, char* argv[]) {
    try {
        std::optional<Config> config = CLI11Parser::parse(argc, argv);
        if (!config) {
            return 1;
        }

        ConfigValidator::ValidationResult validation = ConfigValidator::validate(*config);
        if (!validation.is_valid) {
            std::cerr << "Configuration error: " << validation.error_message << "\n";
            return 1;
        }
        for (const auto& warning : validation.warnings) {
            std::cerr << "Warning: " << warning << "\n";
        }

        BinaryInspector inspector(*config);
        inspector.analyze();
    } catch (const BinReaderExceptions::BinaryParsingError& e) {
        std::cerr << "Binary Analysis Error: " << e.getDetailedMessage() << "\n";
        return 1;
    } catch (const FileAccessException& e) {
        std::cerr << "File Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
