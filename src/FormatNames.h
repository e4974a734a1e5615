/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstdint>
#include <string>

/**
 * @file FormatNames.h
 * @brief Display names for format constants
 *
 * Unknown values are rendered numerically so a listing never loses
 * information for constants newer than this table.
 */

namespace ElfNames {

std::string fileType(uint16_t e_type);
std::string machine(uint16_t e_machine);
std::string programHeaderType(uint32_t p_type);

/**
 * @brief Compact segment permission string ("RW+X", "R+X", ...)
 */
std::string programHeaderFlags(uint32_t p_flags);

std::string sectionType(uint32_t sh_type);

/**
 * @brief Space-separated SHF flag names without the "SHF_" prefix
 */
std::string sectionFlags(uint64_t sh_flags);

std::string symbolBinding(uint8_t bind);
std::string symbolType(uint8_t type);
std::string dynamicTag(int64_t d_tag);

/**
 * @brief Relocation type name for the given machine
 *
 * Known for x86-64, i386, AArch64 and ARM; other machines get the number.
 */
std::string relocationType(uint32_t r_type, uint16_t e_machine);

}  // namespace ElfNames

namespace MachONames {

std::string loadCommand(uint32_t cmd);
std::string fileType(uint32_t filetype);
std::string cpuType(uint32_t cputype);

}  // namespace MachONames

namespace PeNames {

std::string machine(uint16_t machine);
std::string subsystem(uint16_t subsystem);

}  // namespace PeNames
