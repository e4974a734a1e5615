/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "SymbolCrossReferencer.h"
#include <elf.h>
#include <sstream>
#include "FormatNames.h"

namespace {

std::string badIndex(uint64_t index) {
    return "BAD_IDX(" + std::to_string(index) + ")";
}

}  // namespace

// ============================================================================
// Section index policy
// ============================================================================

SectionIndexPolicy SectionIndexPolicy::elf() {
    return SectionIndexPolicy{SHN_ABS};
}

SectionIndexPolicy SectionIndexPolicy::machO() {
    return SectionIndexPolicy{std::nullopt};
}

SectionIndexResolver SectionIndexResolver::forElf(const std::vector<ElfSectionHeader>& sections) {
    std::vector<std::string> names;
    names.reserve(sections.size());
    for (const auto& section : sections) {
        names.push_back(section.name);
    }
    return SectionIndexResolver(std::move(names), SectionIndexPolicy::elf());
}

SectionIndexResolver SectionIndexResolver::forMachO(const MachOModel& model) {
    std::vector<std::string> names{std::string()};  // NO_SECT
    for (const auto& segment : model.segments) {
        for (const auto& section : segment.sections) {
            names.push_back(section.name ? *section.name : UNREADABLE_NAME);
        }
    }
    return SectionIndexResolver(std::move(names), SectionIndexPolicy::machO());
}

std::string SectionIndexResolver::render(uint32_t index) const {
    if (index == 0) {
        return "";
    }
    if (index < names_.size()) {
        return names_[index] + "(" + std::to_string(index) + ")";
    }
    if (policy_.abs_sentinel && index == *policy_.abs_sentinel) {
        return "ABS";
    }
    return badIndex(index);
}

std::optional<std::string> SectionIndexResolver::sectionName(uint32_t index) const {
    if (index == 0 || index >= names_.size()) {
        return std::nullopt;
    }
    return names_[index];
}

// ============================================================================
// Symbols and relocations
// ============================================================================

SymbolRef SymbolCrossReferencer::resolveSymbol(size_t index) const {
    SymbolRef ref;
    if (index >= symbols_.size()) {
        ref.name = badIndex(index);
        return ref;
    }

    const ElfSymbol& symbol = symbols_[index];
    ref.value = symbol.value;
    ref.size = symbol.size;
    ref.raw_binding = symbol.bind();
    ref.raw_type = symbol.type();
    ref.binding = normalizeBinding(ref.raw_binding);
    ref.type = normalizeType(ref.raw_type);
    ref.other = symbol.other;
    ref.section_index = symbol.shndx;
    ref.owning_section = sections_.render(symbol.shndx);

    if (symbol.name != 0) {
        ref.name = strings_.nameAt(symbol.name);
    }
    if (ref.name.empty() && ref.raw_type == STT_SECTION) {
        auto section = sections_.sectionName(symbol.shndx);
        ref.name = section ? *section : ref.owning_section;
    }
    return ref;
}

RelocationRef SymbolCrossReferencer::resolveRelocation(const ElfRelocation& relocation,
                                                       uint16_t machine) const {
    RelocationRef ref;
    ref.offset = relocation.offset;
    ref.type = relocation.type;
    ref.type_name = ElfNames::relocationType(relocation.type, machine);
    ref.symbol_index = relocation.sym;
    ref.addend = relocation.addend;
    ref.addend_text = formatAddend(relocation.addend);

    if (relocation.sym >= symbols_.size()) {
        ref.symbol_name = badIndex(relocation.sym);
        return ref;
    }

    const ElfSymbol& symbol = symbols_[relocation.sym];
    if (symbol.name != 0) {
        ref.symbol_name = strings_.nameAt(symbol.name);
    }
    if (ref.symbol_name.empty()) {
        if (symbol.type() == STT_SECTION) {
            auto section = sections_.sectionName(symbol.shndx);
            ref.symbol_name = section ? *section : sections_.render(symbol.shndx);
        }
        if (ref.symbol_name.empty()) {
            ref.symbol_name = "ABS";
        }
    }
    return ref;
}

std::string SymbolCrossReferencer::formatAddend(int64_t addend) {
    if (addend == 0) {
        return "";
    }
    std::ostringstream oss;
    if (addend > 0) {
        oss << "+0x" << std::hex << static_cast<uint64_t>(addend);
    } else {
        oss << "-0x" << std::hex << (uint64_t{0} - static_cast<uint64_t>(addend));
    }
    return oss.str();
}

SymbolBinding SymbolCrossReferencer::normalizeBinding(uint8_t bind) {
    switch (bind) {
        case STB_LOCAL:
            return SymbolBinding::Local;
        case STB_GLOBAL:
            return SymbolBinding::Global;
        case STB_WEAK:
            return SymbolBinding::Weak;
        default:
            return SymbolBinding::Other;
    }
}

SymbolKind SymbolCrossReferencer::normalizeType(uint8_t type) {
    switch (type) {
        case STT_OBJECT:
            return SymbolKind::Object;
        case STT_FUNC:
            return SymbolKind::Function;
        case STT_GNU_IFUNC:
            return SymbolKind::IndirectFunction;
        case STT_SECTION:
            return SymbolKind::Section;
        default:
            return SymbolKind::Other;
    }
}
