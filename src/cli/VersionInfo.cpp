/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "VersionInfo.h"

// Set by CMake
#ifndef BUILD_DATE
#define BUILD_DATE "unknown"
#endif

std::string VersionInfo::banner() {
    std::string text = std::string(APP_NAME) + " " + VERSION + "\n";
    text += "Formats: ELF, Mach-O (thin and fat), PE/COFF, ar archives\n";
    text += std::string("Built: ") + BUILD_DATE + "\n";
    text += std::string(COPYRIGHT) + "\n";
    text += std::string("License: ") + LICENSE;
    return text;
}
