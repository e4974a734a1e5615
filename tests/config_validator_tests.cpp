/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/**
 * @file config_validator_tests.cpp
 * @brief Command line configuration checks
 */

#include <gtest/gtest.h>
#include "BinExceptions.h"
#include "cli/ConfigValidator.h"
#include "test_helpers.hpp"

namespace {

class ConfigValidatorTest : public ::testing::Test {
protected:
    ConfigValidatorTest() : input_(bytesOf("\x7f" "ELF-ish contents")) {}

    Config baseConfig() const {
        Config config;
        config.inputFile = input_.path();
        return config;
    }

    TempFile input_;
};

}  // namespace

TEST_F(ConfigValidatorTest, AcceptsPlainListing) {
    auto result = ConfigValidator::validate(baseConfig());
    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.warnings.empty());
}

TEST_F(ConfigValidatorTest, RejectsBothSearchKinds) {
    Config config = baseConfig();
    config.searchText = "main";
    config.searchHex = "6d61";
    auto result = ConfigValidator::validate(config);
    EXPECT_FALSE(result.is_valid);
    EXPECT_NE(result.error_message.find("--search-hex"), std::string::npos);
}

TEST_F(ConfigValidatorTest, RejectsEmptyTextPattern) {
    Config config = baseConfig();
    config.searchText = "";
    std::string error;
    EXPECT_FALSE(ConfigValidator::validate(config, error));
    EXPECT_EQ(error, "Search pattern must not be empty");
}

TEST_F(ConfigValidatorTest, RejectsMalformedHexPattern) {
    Config config = baseConfig();
    config.searchHex = "7f4";
    std::string error;
    EXPECT_FALSE(ConfigValidator::validate(config, error));
    EXPECT_NE(error.find("odd number"), std::string::npos);
}

TEST_F(ConfigValidatorTest, AcceptsWellFormedHexPattern) {
    Config config = baseConfig();
    config.searchHex = "7f 45 4c 46";
    EXPECT_TRUE(ConfigValidator::validate(config).is_valid);
}

TEST_F(ConfigValidatorTest, RejectsMissingFile) {
    Config config = baseConfig();
    config.inputFile = "/nonexistent/bintk/input";
    std::string error;
    EXPECT_FALSE(ConfigValidator::validate(config, error));
    EXPECT_NE(error.find("Cannot open input file"), std::string::npos);
}

TEST(ConfigValidator, RejectsEmptyFile) {
    TempFile empty(std::vector<uint8_t>{});
    std::string error;
    EXPECT_FALSE(ConfigValidator::validateInputFile(empty.path(), error));
    EXPECT_NE(error.find("is empty"), std::string::npos);
}

TEST_F(ConfigValidatorTest, WarnsAboutIneffectiveJsonCombinations) {
    Config config = baseConfig();
    config.json = true;
    config.pretty = true;
    config.debug = true;
    auto result = ConfigValidator::validate(config);
    EXPECT_TRUE(result.is_valid);
    EXPECT_EQ(result.warnings.size(), 3u);
}

TEST_F(ConfigValidatorTest, JsonWithSearchOnlyWarnsAboutPretty) {
    Config config = baseConfig();
    config.json = true;
    config.pretty = true;
    config.searchText = "main";
    auto result = ConfigValidator::validate(config);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0], "--pretty has no effect with --json.");
}

// ============================================================================
// Needle preparation
// ============================================================================

TEST(PrepareNeedle, NoSearchGivesNoNeedle) {
    Config config;
    EXPECT_FALSE(BinaryInspector::prepareNeedle(config).has_value());
}

TEST(PrepareNeedle, TextNeedleKeepsLabel) {
    Config config;
    config.searchText = "main";
    auto needle = BinaryInspector::prepareNeedle(config);
    ASSERT_TRUE(needle.has_value());
    EXPECT_EQ(needle->first, "main");
    EXPECT_EQ(needle->second, bytesOf("main"));
}

TEST(PrepareNeedle, HexNeedleIsDecoded) {
    Config config;
    config.searchHex = "cafe babe";
    auto needle = BinaryInspector::prepareNeedle(config);
    ASSERT_TRUE(needle.has_value());
    EXPECT_EQ(needle->second, (std::vector<uint8_t>{0xca, 0xfe, 0xba, 0xbe}));
}

TEST(PrepareNeedle, EmptyTextThrows) {
    Config config;
    config.searchText = "";
    EXPECT_THROW(BinaryInspector::prepareNeedle(config), BinReaderExceptions::SearchPatternError);
}
