/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <CLI/CLI.hpp>
#include <optional>
#include "BinaryInspector.h"

/**
 * @file CLI11Parser.h
 * @brief Command line parsing for bintk using the CLI11 library
 *
 * CLI11 generates the help text, prints usage errors and handles
 * --help/--version itself.
 */

/**
 * @brief Compact formatter that removes positionals section and reduces blank lines
 */
class CompactFormatter : public CLI::Formatter {
public:
    std::string make_help(const CLI::App *app, std::string name, CLI::AppFormatMode mode) const override;
};

class CLI11Parser {
public:
    /**
     * @brief Parse command line arguments using CLI11
     * @param argc Number of arguments
     * @param argv Array of argument strings
     * @return std::optional<Config> with parsed options, or std::nullopt if parsing
     *         failed or help/version was shown
     */
    static std::optional<Config> parse(int argc, char* argv[]);

private:
    static void setupApp(CLI::App& app, Config& config);
};
