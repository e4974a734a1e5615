/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "CLI11Parser.h"
#include <regex>
#include "VersionInfo.h"

std::string
CompactFormatter::make_help(const CLI::App* app, std::string name, CLI::AppFormatMode mode) const {
    std::string help = CLI::Formatter::make_help(app, name, mode);

    // Remove the positionals section entirely
    size_t pos = help.find("\nPOSITIONALS:");
    if (pos != std::string::npos) {
        size_t end = help.find("\nOPTIONS:", pos);
        if (end != std::string::npos) {
            help.erase(pos, end - pos);
        }
    }

    help = std::regex_replace(help, std::regex("\n\n\n+"), "\n\n");

    return help;
}

std::optional<Config> CLI11Parser::parse(int argc, char* argv[]) {
    Config config;

    CLI::App app{"bintk - binary tool kit for ELF, Mach-O, PE and archive files", "bintk"};
    setupApp(app, config);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Prints help, version or the usage error
        app.exit(e);
        return std::nullopt;
    }

    return config;
}

void CLI11Parser::setupApp(CLI::App& app, Config& config) {
    auto formatter = std::make_shared<CompactFormatter>();
    formatter->column_width(40);
    formatter->label("REQUIRED", "");
    app.formatter(formatter);

    app.allow_extras(false);
    app.allow_config_extras(false);

    app.set_version_flag("--version,-v", []() { return VersionInfo::banner(); });
    app.set_help_flag("--help,-h", "Show this help");

    app.add_option("file", config.inputFile, "Binary file to inspect")
        ->required()
        ->check(CLI::ExistingFile);

    // Search
    app.add_option_function<std::string>(
        "-s,--search",
        [&config](const std::string& text) { config.searchText = text; },
        "Search for a string and show the structures containing each match");
    app.add_option_function<std::string>(
        "-x,--search-hex",
        [&config](const std::string& hex) { config.searchHex = hex; },
        "Search for hex bytes, e.g. \"7f 45 4c 46\"");

    // Output
    app.add_flag("-D,--demangle", config.demangle, "Demangle C++ symbol names");
    app.add_flag("-p,--pretty", config.pretty, "Show listings as column tables");
    app.add_flag("--color", config.color, "Force ANSI colors, even when output is not a terminal");
    app.add_flag("--json", config.json, "Output the range table and matches as JSON");
    app.add_flag("-d,--debug", config.debug, "Print the normalized range table");
    app.add_flag(
           "--verbose",
           [&config](int64_t count) { config.verbosity = static_cast<int>(count); },
           "Show diagnostics on stderr (use twice for more detail)")
        ->multi_option_policy(CLI::MultiOptionPolicy::Sum);

    // Performance
    app.add_option("-j,--threads", config.threadCount,
                   "Search worker threads (0 = auto, 1 = sequential)")
        ->check(CLI::NonNegativeNumber)
        ->default_val(0);
    app.add_option("--mmap-threshold", config.mmapThreshold,
                   "File size in bytes from which the file is memory-mapped")
        ->check(CLI::PositiveNumber)
        ->default_val(FileAccessConfig::DEFAULT_MMAP_THRESHOLD);
}
