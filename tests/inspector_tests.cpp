/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/**
 * @file inspector_tests.cpp
 * @brief Whole pipeline from file on disk to printed report
 */

#include <gtest/gtest.h>
#include <sstream>
#include "BinExceptions.h"
#include "BinaryInspector.h"
#include "FileAccessStrategy.h"
#include "cli/VersionInfo.h"
#include "test_helpers.hpp"

namespace {

bool contains(const std::string& text, const std::string& fragment) {
    return text.find(fragment) != std::string::npos;
}

std::string run(Config config) {
    std::ostringstream out;
    BinaryInspector inspector(std::move(config), out);
    inspector.analyze();
    return out.str();
}

class InspectorTest : public ::testing::Test {
protected:
    InspectorTest() : machO_(SampleMachO::image()) {}

    Config configFor(const TempFile& file) const {
        Config config;
        config.inputFile = file.path();
        config.threadCount = 1;
        return config;
    }

    TempFile machO_;
};

}  // namespace

TEST_F(InspectorTest, ListsMachOImage) {
    std::string text = run(configFor(machO_));
    EXPECT_TRUE(contains(text, "Mach-o MH_EXECUTE"));
    EXPECT_TRUE(contains(text, "_main"));
    EXPECT_TRUE(contains(text, SampleMachO::LIBSYSTEM));
    EXPECT_FALSE(contains(text, "Matches for"));
}

TEST_F(InspectorTest, CorrelatesTextSearchWithSegmentAndSection) {
    Config config = configFor(machO_);
    config.searchText = "needle";
    std::string text = run(config);

    EXPECT_TRUE(contains(text,
                         "Matches for \"needle\":\n"
                         "  0x310\n"
                         "  ├──__TEXT(0) ∈ 0x100000310\n"
                         "  ├──__text(0) ∈ 0x100000310\n"));
}

TEST_F(InspectorTest, ParallelSearchFindsTheSameMatch) {
    Config config = configFor(machO_);
    config.searchHex = "6e 65 65 64 6c 65";
    config.threadCount = 4;
    EXPECT_TRUE(contains(run(config), "  ├──__text(0) ∈ 0x100000310\n"));
}

TEST_F(InspectorTest, JsonModePrintsOnlyTheDocument) {
    Config config = configFor(machO_);
    config.json = true;
    config.searchText = "needle";
    std::string text = run(config);

    ASSERT_FALSE(text.empty());
    EXPECT_EQ(text.front(), '{');
    EXPECT_TRUE(contains(text, "\"format\": \"Mach-O\""));
    EXPECT_TRUE(contains(text, "\"offset\": 784"));
    EXPECT_TRUE(contains(text, "\"normalized_address\": 4294968080"));
    EXPECT_FALSE(contains(text, "Mach-o MH_EXECUTE"));
}

TEST_F(InspectorTest, DebugPrintsRangeTable) {
    Config config = configFor(machO_);
    config.debug = true;
    EXPECT_TRUE(contains(run(config), "Ranges(6):"));
}

TEST_F(InspectorTest, ColorIsForcedWithoutTerminal) {
    Config config = configFor(machO_);
    config.searchText = "needle";
    EXPECT_FALSE(contains(run(config), "\033["));

    config.color = true;
    EXPECT_TRUE(contains(run(config), "\033[0m"));
}

TEST_F(InspectorTest, MappedFileGivesSameReport) {
    Config config = configFor(machO_);
    config.searchText = "needle";
    std::string in_memory = run(config);
    config.mmapThreshold = 1;
    EXPECT_EQ(run(config), in_memory);
}

TEST(Inspector, FatSlicesShareOneRangeTable) {
    TempFile fat(fatImage({{MachOFormat::CPU_TYPE_X86_64, SampleMachO::image()},
                           {MachOFormat::CPU_TYPE_ARM64, SampleMachO::image()}}));
    Config config;
    config.inputFile = fat.path();
    config.threadCount = 1;
    config.searchText = "needle";
    std::string text = run(config);

    // Slices at 0x1000 and 0x2000 both map the needle to the same address
    EXPECT_TRUE(contains(text, "  0x1310\n  ├──__TEXT(0) ∈ 0x100000310\n"));
    EXPECT_TRUE(contains(text, "  0x2310\n  ├──__TEXT(0) ∈ 0x100000310\n"));
}

TEST(Inspector, UnknownMagicIsReported) {
    TempFile junk(bytesOf("plain text file"));
    Config config;
    config.inputFile = junk.path();
    EXPECT_EQ(run(config), "unknown magic: 0x69616c70\n");
}

TEST(Inspector, MalformedPatternFailsBeforeOutput) {
    TempFile image(SampleMachO::image());
    Config config;
    config.inputFile = image.path();
    config.searchHex = "zz";

    std::ostringstream out;
    BinaryInspector inspector(config, out);
    EXPECT_THROW(inspector.analyze(), BinReaderExceptions::SearchPatternError);
    EXPECT_TRUE(out.str().empty());
}

// ============================================================================
// File access
// ============================================================================

TEST(FileAccess, ThresholdSelectsStrategy) {
    TempFile file(SampleMachO::image());
    FileAccessConfig config;
    auto small = FileAccessStrategy::create(file.path(), config);
    EXPECT_EQ(small->getStrategyName(), "in-memory");

    config.mmap_threshold = 1;
    auto mapped = FileAccessStrategy::create(file.path(), config);
    EXPECT_EQ(mapped->getStrategyName(), "memory-mapped");
    ASSERT_EQ(mapped->size(), SampleMachO::IMAGE_SIZE);
    EXPECT_EQ(0, std::memcmp(mapped->data(), small->data(), small->size()));
}

TEST(FileAccess, RejectsEmptyMissingAndNonRegularFiles) {
    TempFile empty(std::vector<uint8_t>{});
    EXPECT_THROW(FileAccessStrategy::create(empty.path()), FileAccessException);
    EXPECT_THROW(FileAccessStrategy::create("/nonexistent/bintk/input"), FileAccessException);
    EXPECT_THROW(FileAccessStrategy::create("/tmp"), FileAccessException);
}

TEST(VersionInfo, BannerNamesToolAndVersion) {
    std::string banner = VersionInfo::banner();
    EXPECT_EQ(banner.rfind("bintk 1.0.0\n", 0), 0u);
    EXPECT_TRUE(contains(banner, "License: "));
}
