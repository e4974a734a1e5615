/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <string>

/**
 * @file VersionInfo.h
 * @brief Version banner for --version
 */
class VersionInfo {
public:
    static constexpr const char* APP_NAME = "bintk";
    static constexpr const char* VERSION = "1.0.0";
    static constexpr const char* COPYRIGHT = "Copyright (c) 2025 the bintk authors";
    static constexpr const char* LICENSE = "Mozilla Public License 2.0 <https://mozilla.org/MPL/2.0/>";

    /**
     * @brief Name and version, supported formats, build date, copyright and license, one per line
     */
    static std::string banner();
};
