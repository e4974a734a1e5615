/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "BinStructures.h"

/**
 * @file SymbolCrossReferencer.h
 * @brief Naming of symbol and relocation entries against their tables
 *
 * Produces fully named SymbolRef and RelocationRef records. Malformed input
 * never throws: out-of-range indices render as BAD_IDX(n) and unreadable
 * strings as "<unreadable>".
 *
 * ## Section index rendering:
 * | index                         | rendering  |
 * |-------------------------------|------------|
 * | 0                             | ""         |
 * | 0 < i < section count         | name(i)    |
 * | the format's absolute index   | ABS        |
 * | anything else                 | BAD_IDX(i) |
 *
 * The absolute index comes from the policy; ELF uses SHN_ABS and Mach-O has
 * none.
 *
 * ## Relocation symbol names:
 * - named symbol: its name
 * - nameless STT_SECTION symbol: the bare name of its section, or the
 *   rendering above when the index is not a section
 * - any other nameless symbol: ABS
 * - symbol index past the table: BAD_IDX(n)
 */

/**
 * @brief Format-specific section index conventions
 */
struct SectionIndexPolicy {
    std::optional<uint32_t> abs_sentinel;

    static SectionIndexPolicy elf();
    static SectionIndexPolicy machO();
};

/**
 * @brief Renders section indices of one image's section table
 */
class SectionIndexResolver {
public:
    SectionIndexResolver(std::vector<std::string> names, SectionIndexPolicy policy)
        : names_(std::move(names)), policy_(policy) {}

    /// Section header table of an ELF image, index 0 being SHN_UNDEF
    static SectionIndexResolver forElf(const std::vector<ElfSectionHeader>& sections);

    /// Mach-O sections numbered from 1 across all segments, as n_sect counts them
    static SectionIndexResolver forMachO(const MachOModel& model);

    std::string render(uint32_t index) const;

    /**
     * @brief Bare section name for an in-table index (never index 0)
     */
    std::optional<std::string> sectionName(uint32_t index) const;

    size_t size() const { return names_.size(); }

private:
    std::vector<std::string> names_;
    SectionIndexPolicy policy_;
};

class SymbolCrossReferencer {
public:
    SymbolCrossReferencer(const std::vector<ElfSymbol>& symbols,
                          const StringTable& strings,
                          SectionIndexResolver sections)
        : symbols_(symbols), strings_(strings), sections_(std::move(sections)) {}

    /**
     * @brief Resolve the symbol at a table index
     *
     * An index past the table yields a record named BAD_IDX(index).
     */
    SymbolRef resolveSymbol(size_t index) const;

    /**
     * @brief Resolve a relocation entry against its symbol
     * @param machine e_machine, for the relocation type name
     */
    RelocationRef resolveRelocation(const ElfRelocation& relocation, uint16_t machine) const;

    std::string resolveSectionIndex(uint32_t index) const {
        return sections_.render(index);
    }

    /**
     * @brief "" for zero, "+0x.." for positive, "-0x.." for negative addends
     */
    static std::string formatAddend(int64_t addend);

    static SymbolBinding normalizeBinding(uint8_t bind);
    static SymbolKind normalizeType(uint8_t type);

private:
    const std::vector<ElfSymbol>& symbols_;
    const StringTable& strings_;
    SectionIndexResolver sections_;
};
