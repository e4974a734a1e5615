/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <string>
#include <unordered_map>

/**
 * @file Demangler.h
 * @brief Itanium C++ name demangling with a per-instance cache
 *
 * Only names starting with "_Z" (or "__Z", the Mach-O spelling with the
 * extra leading underscore) are passed to abi::__cxa_demangle. Any other
 * name, and any name the demangler rejects, is returned unchanged.
 */
class Demangler {
public:
    /**
     * @brief Demangle a symbol name
     * @param name Raw symbol name
     * @return Demangled name, or @p name itself if it is not a valid mangled name
     */
    std::string demangle(const std::string& name) const;

    /**
     * @brief Demangle only when enabled
     */
    std::string display(const std::string& name, bool enabled) const {
        return enabled ? demangle(name) : name;
    }

private:
    mutable std::unordered_map<std::string, std::string> cache_;
};
