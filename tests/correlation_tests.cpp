/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/**
 * @file correlation_tests.cpp
 * @brief Offset location, address normalization and match correlation
 */

#include <gtest/gtest.h>
#include "BinExceptions.h"
#include "CorrelationReporter.h"
#include "OffsetLocator.h"
#include "ThreadPool.h"
#include "test_helpers.hpp"

namespace {

Range makeRange(RangeKind kind, const std::string& name, uint64_t offset, uint64_t size,
                std::optional<uint64_t> vaddr, size_t index = 0) {
    Range range;
    range.kind = kind;
    range.name = name;
    range.file_offset = offset;
    range.file_size = size;
    range.virtual_address = vaddr;
    range.index = index;
    return range;
}

/// Segment [0, 0x100) at 0x1000 holding section [0x10, 0x20) at 0x1010
std::vector<Range> nestedRanges() {
    return {makeRange(RangeKind::Segment, "__TEXT", 0, 0x100, 0x1000, 0),
            makeRange(RangeKind::Section, "__text", 0x10, 0x10, 0x1010, 0)};
}

}  // namespace

// ============================================================================
// Range containment
// ============================================================================

TEST(RangeContainment, IsHalfOpen) {
    Range range = makeRange(RangeKind::Section, ".text", 0x10, 0x10, std::nullopt);
    EXPECT_FALSE(range.contains(0x0f));
    EXPECT_TRUE(range.contains(0x10));
    EXPECT_TRUE(range.contains(0x1f));
    EXPECT_FALSE(range.contains(0x20));
}

TEST(RangeContainment, ZeroSizedRangeContainsNothing) {
    Range range = makeRange(RangeKind::Section, ".bss", 0x10, 0, 0x2000);
    EXPECT_FALSE(range.contains(0x10));
}

TEST(RangeContainment, NoOverflowNearTopOfAddressSpace) {
    Range range = makeRange(RangeKind::Section, "edge", UINT64_MAX - 4, 8, std::nullopt);
    EXPECT_TRUE(range.contains(UINT64_MAX - 1));
    EXPECT_FALSE(range.contains(0));
}

// ============================================================================
// OffsetLocator
// ============================================================================

TEST(OffsetLocator, ReturnsAllContainingRangesInBuildOrder) {
    OffsetLocator locator(nestedRanges());
    auto located = locator.rangesContaining(0x15);
    ASSERT_EQ(located.size(), 2u);
    EXPECT_EQ(located[0].range.name, "__TEXT");
    EXPECT_EQ(located[1].range.name, "__text");
    EXPECT_EQ(located[0].normalized_address, 0x1015u);
    EXPECT_EQ(located[1].normalized_address, 0x1015u);
}

TEST(OffsetLocator, OffsetOutsideEveryRangeIsUnlocated) {
    OffsetLocator locator(nestedRanges());
    EXPECT_TRUE(locator.rangesContaining(0x100).empty());
}

TEST(OffsetLocator, UnmappedRangeHasNoNormalizedAddress) {
    OffsetLocator locator({makeRange(RangeKind::LoadCommand, "LC_MAIN", 0x20, 0x18, std::nullopt)});
    auto located = locator.rangesContaining(0x24);
    ASSERT_EQ(located.size(), 1u);
    EXPECT_FALSE(located[0].normalized_address.has_value());
}

TEST(OffsetLocator, NormalizeAddsDisplacementToBase) {
    Range range = makeRange(RangeKind::ProgramHeader, "PT_LOAD", 0x1000, 0x200, 0x401000);
    EXPECT_EQ(OffsetLocator::normalize(range, 0x1080), 0x401080u);
    EXPECT_EQ(OffsetLocator::normalize(range, 0x1000), 0x401000u);
}

// ============================================================================
// CorrelationReporter
// ============================================================================

TEST(CorrelationReporter, CorrelatesEveryMatch) {
    std::vector<uint8_t> haystack(0x100, 0);
    haystack[0x05] = 'X';
    haystack[0x15] = 'X';

    OffsetLocator locator(nestedRanges());
    CorrelationReporter reporter(locator);
    auto reports = reporter.correlate(haystack.data(), haystack.size(), bytesOf("X"));

    ASSERT_EQ(reports.size(), 2u);
    EXPECT_EQ(reports[0].offset, 0x05u);
    ASSERT_EQ(reports[0].ranges.size(), 1u);
    EXPECT_EQ(reports[0].ranges[0].range.kind, RangeKind::Segment);
    EXPECT_EQ(reports[0].ranges[0].normalized_address, 0x1005u);

    EXPECT_EQ(reports[1].offset, 0x15u);
    ASSERT_EQ(reports[1].ranges.size(), 2u);
    EXPECT_EQ(reports[1].ranges[0].range.kind, RangeKind::Segment);
    EXPECT_EQ(reports[1].ranges[0].normalized_address, 0x1015u);
    EXPECT_EQ(reports[1].ranges[1].range.kind, RangeKind::Section);
    EXPECT_EQ(reports[1].ranges[1].normalized_address, 0x1015u);
}

TEST(CorrelationReporter, MatchOutsideRangesIsStillReported) {
    std::vector<uint8_t> haystack(0x200, 0);
    haystack[0x180] = 'Q';
    OffsetLocator locator(nestedRanges());
    CorrelationReporter reporter(locator);

    auto reports = reporter.correlate(haystack.data(), haystack.size(), bytesOf("Q"));
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].offset, 0x180u);
    EXPECT_TRUE(reports[0].ranges.empty());
}

TEST(CorrelationReporter, ZeroSizedRangeNeverMatches) {
    std::vector<uint8_t> haystack(0x40, 'Z');
    OffsetLocator locator({makeRange(RangeKind::Section, ".bss", 0x10, 0, 0x3000)});
    CorrelationReporter reporter(locator);

    auto reports = reporter.correlate(haystack.data(), haystack.size(), bytesOf("Z"));
    ASSERT_EQ(reports.size(), 0x40u);
    for (const auto& report : reports) {
        EXPECT_TRUE(report.ranges.empty()) << "offset " << report.offset;
    }
}

TEST(CorrelationReporter, ParallelSearchProducesSameReports) {
    std::vector<uint8_t> haystack(0x100, 0);
    for (size_t offset : {0x01u, 0x12u, 0x13u, 0x80u, 0xfeu}) {
        haystack[offset] = 'X';
    }
    OffsetLocator locator(nestedRanges());
    CorrelationReporter reporter(locator);
    ThreadPool pool(3);

    auto sequential = reporter.correlate(haystack.data(), haystack.size(), bytesOf("X"));
    auto parallel = reporter.correlate(haystack.data(), haystack.size(), bytesOf("X"), &pool);
    ASSERT_EQ(parallel.size(), sequential.size());
    for (size_t i = 0; i < sequential.size(); ++i) {
        EXPECT_EQ(parallel[i].offset, sequential[i].offset);
        EXPECT_EQ(parallel[i].ranges.size(), sequential[i].ranges.size());
    }
}

TEST(CorrelationReporter, EmptyNeedleThrows) {
    std::vector<uint8_t> haystack(8, 0);
    OffsetLocator locator(nestedRanges());
    CorrelationReporter reporter(locator);
    EXPECT_THROW(reporter.correlate(haystack.data(), haystack.size(), {}),
                 BinReaderExceptions::SearchPatternError);
}

TEST(CorrelationReporter, CorrelatesExternallyFoundOffsets) {
    OffsetLocator locator(nestedRanges());
    CorrelationReporter reporter(locator);
    auto reports = reporter.correlateOffsets({0x18, 0x300});
    ASSERT_EQ(reports.size(), 2u);
    EXPECT_EQ(reports[0].ranges.size(), 2u);
    EXPECT_TRUE(reports[1].ranges.empty());
}
