/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

/**
 * @file LibElfRAII.h
 * @brief RAII wrapper for libelf descriptors
 *
 * Every `Elf*` obtained from elf_memory() or elf_begin() must be released
 * with elf_end(), including archive member descriptors. ElfHandle ties that
 * call to scope exit so early returns and exceptions in the decoders never
 * leak a descriptor.
 *
 * ## Usage Example:
 * ```cpp
 * ElfHandle elf(elf_memory(image.data(), image.size()));
 * if (!elf) {
 *     throw BinaryFileError::libraryFailure(elf_errmsg(-1));
 * }
 * GElf_Ehdr ehdr;
 * gelf_getehdr(elf.get(), &ehdr);
 * ```
 */

#include <libelf.h>
#include <utility>

namespace LibElfRAII {

/**
 * @brief Owning wrapper around an `Elf*` descriptor
 */
class ElfHandle {
private:
    Elf* elf_;

public:
    ElfHandle() : elf_(nullptr) {}
    explicit ElfHandle(Elf* elf) : elf_(elf) {}

    /**
     * @brief Destructor - releases the descriptor
     */
    ~ElfHandle() {
        if (elf_) {
            elf_end(elf_);
        }
    }

    // Delete copy operations to prevent double elf_end
    ElfHandle(const ElfHandle&) = delete;
    ElfHandle& operator=(const ElfHandle&) = delete;

    ElfHandle(ElfHandle&& other) noexcept : elf_(other.elf_) {
        other.elf_ = nullptr;
    }

    ElfHandle& operator=(ElfHandle&& other) noexcept {
        if (this != &other) {
            reset(other.elf_);
            other.elf_ = nullptr;
        }
        return *this;
    }

    Elf* get() const { return elf_; }

    explicit operator bool() const { return elf_ != nullptr; }

    /**
     * @brief Manage a new descriptor, ending the current one if any
     */
    void reset(Elf* elf = nullptr) {
        if (elf_) {
            elf_end(elf_);
        }
        elf_ = elf;
    }
};

/**
 * @brief Initialize the libelf library version once per process
 * @return true if libelf accepted EV_CURRENT
 */
inline bool ensureLibElfVersion() {
    static const bool initialized = elf_version(EV_CURRENT) != EV_NONE;
    return initialized;
}

}  // namespace LibElfRAII
