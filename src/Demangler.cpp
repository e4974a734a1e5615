/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "Demangler.h"
#include <cxxabi.h>
#include <cstdlib>

std::string Demangler::demangle(const std::string& name) const {
    auto it = cache_.find(name);
    if (it != cache_.end()) {
        return it->second;
    }

    std::string result = name;
    std::string mangled;
    if (name.compare(0, 2, "_Z") == 0) {
        mangled = name;
    } else if (name.compare(0, 3, "__Z") == 0) {
        mangled = name.substr(1);
    }

    if (!mangled.empty()) {
        int status = 0;
        char* demangled = abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &status);
        if (status == 0 && demangled != nullptr) {
            result = demangled;
        }
        std::free(demangled);
    }

    cache_[name] = result;
    return result;
}
