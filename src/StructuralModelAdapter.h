/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "BinStructures.h"

/**
 * @file StructuralModelAdapter.h
 * @brief Normalization of decoded format models into Range sequences
 *
 * Each adapter turns one decoded model into the ordered list of Ranges the
 * offset locator searches. Building is deterministic: the same model always
 * yields the same sequence, and adapters keep no state between calls.
 *
 * ## Emission order:
 * - ELF: program headers, then section headers, each in table order
 * - Mach-O: segments, then load commands, then sections (innermost last)
 * - PE, archive: no ranges
 */

class StructuralModelAdapter {
public:
    virtual ~StructuralModelAdapter() = default;

    /**
     * @brief Build the ordered Range list for the adapted model
     */
    virtual std::vector<Range> buildRanges() const = 0;
};

/**
 * @brief Ranges of an ELF image: ProgramHeader and Section kinds
 *
 * SHT_NOBITS sections have a zero file size. Sections without SHF_ALLOC are
 * not mapped and carry no virtual address.
 */
class ElfRangeAdapter : public StructuralModelAdapter {
public:
    explicit ElfRangeAdapter(const ElfModel& model) : model_(model) {}

    std::vector<Range> buildRanges() const override;

private:
    const ElfModel& model_;
};

/**
 * @brief Ranges of a Mach-O image: Segment, LoadCommand and Section kinds
 *
 * Section indices count within their segment, as in the segment listing.
 */
class MachORangeAdapter : public StructuralModelAdapter {
public:
    explicit MachORangeAdapter(const MachOModel& model) : model_(model) {}

    std::vector<Range> buildRanges() const override;

private:
    const MachOModel& model_;
};

/**
 * @brief Adapter for formats whose structures are not correlated
 */
class EmptyRangeAdapter : public StructuralModelAdapter {
public:
    std::vector<Range> buildRanges() const override {
        return {};
    }
};
