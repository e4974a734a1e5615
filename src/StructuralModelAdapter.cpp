/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "StructuralModelAdapter.h"
#include <elf.h>
#include "FormatNames.h"

// ============================================================================
// ELF
// ============================================================================

std::vector<Range> ElfRangeAdapter::buildRanges() const {
    std::vector<Range> ranges;
    ranges.reserve(model_.program_headers.size() + model_.section_headers.size());

    for (size_t i = 0; i < model_.program_headers.size(); ++i) {
        const ElfProgramHeader& phdr = model_.program_headers[i];
        Range range;
        range.kind = RangeKind::ProgramHeader;
        range.name = ElfNames::programHeaderType(phdr.type);
        range.file_offset = phdr.offset;
        range.file_size = phdr.filesz;
        range.virtual_address = phdr.vaddr;
        range.index = i;
        ranges.push_back(std::move(range));
    }

    for (size_t i = 0; i < model_.section_headers.size(); ++i) {
        const ElfSectionHeader& shdr = model_.section_headers[i];
        Range range;
        range.kind = RangeKind::Section;
        range.name = shdr.name;
        range.file_offset = shdr.offset;
        range.file_size = shdr.type == SHT_NOBITS ? 0 : shdr.size;
        if (shdr.flags & SHF_ALLOC) {
            range.virtual_address = shdr.addr;
        }
        range.index = i;
        ranges.push_back(std::move(range));
    }

    return ranges;
}

// ============================================================================
// Mach-O
// ============================================================================

std::vector<Range> MachORangeAdapter::buildRanges() const {
    std::vector<Range> ranges;

    for (size_t i = 0; i < model_.segments.size(); ++i) {
        const MachOSegment& segment = model_.segments[i];
        Range range;
        range.kind = RangeKind::Segment;
        range.name = segment.name ? *segment.name : UNREADABLE_NAME;
        range.file_offset = segment.fileoff;
        range.file_size = segment.filesize;
        range.virtual_address = segment.vmaddr;
        range.index = i;
        ranges.push_back(std::move(range));
    }

    for (size_t i = 0; i < model_.load_commands.size(); ++i) {
        const MachOLoadCommand& command = model_.load_commands[i];
        Range range;
        range.kind = RangeKind::LoadCommand;
        range.name = MachONames::loadCommand(command.cmd);
        range.file_offset = command.offset;
        range.file_size = command.cmdsize;
        range.index = i;
        ranges.push_back(std::move(range));
    }

    for (const auto& segment : model_.segments) {
        for (size_t i = 0; i < segment.sections.size(); ++i) {
            const MachOSection& section = segment.sections[i];
            Range range;
            range.kind = RangeKind::Section;
            range.name = section.name ? *section.name : UNREADABLE_NAME;
            range.file_offset = section.offset;
            range.file_size = section.file_size;
            // addr already includes the segment base
            range.virtual_address = section.addr;
            range.index = i;
            ranges.push_back(std::move(range));
        }
    }

    return ranges;
}
