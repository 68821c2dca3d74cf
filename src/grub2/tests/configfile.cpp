/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include <core/common/tests/utils/log.hpp>
#include <core/common/tests/utils/utils.hpp>

#include <common/utils/filesystem.hpp>
#include <grub2/configfile.hpp>

using namespace testing;

namespace bootkit::grub2 {

namespace {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

const std::string cGrubDefault = R"(# If you change this file, run 'grub2-mkconfig -o /boot/grub2/grub.cfg' afterwards
GRUB_DISTRIBUTOR=
GRUB_DEFAULT=saved
GRUB_TIMEOUT=8

GRUB_CMDLINE_LINUX_DEFAULT="splash=silent mitigations=auto quiet"
GRUB_TERMINAL='gfxterm'
)";

} // namespace

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class ConfigFileTest : public Test {
protected:
    void SetUp() override { aos::tests::utils::InitLog(); }
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(ConfigFileTest, ParseKeepsLinesAndValues)
{
    ConfigFile config;

    ASSERT_TRUE(config.Parse(cGrubDefault).IsNone());

    const auto values = config.GetValues();

    ASSERT_EQ(values.size(), 5);

    EXPECT_EQ(values[0].mKey, "GRUB_DISTRIBUTOR");
    EXPECT_EQ(values[0].mValue, "");
    EXPECT_EQ(values[0].mLine, 1);

    EXPECT_EQ(values[3].mKey, "GRUB_CMDLINE_LINUX_DEFAULT");
    EXPECT_EQ(values[3].mValue, "splash=silent mitigations=auto quiet");
    EXPECT_EQ(values[3].mLine, 5);
    EXPECT_EQ(values[3].mOriginal, R"(GRUB_CMDLINE_LINUX_DEFAULT="splash=silent mitigations=auto quiet")");
    EXPECT_FALSE(values[3].mDirty);

    EXPECT_EQ(values[4].mValue, "gfxterm");
}

TEST_F(ConfigFileTest, UnmodifiedConfigIsSerializedUnchanged)
{
    const std::vector<std::string> texts = {
        cGrubDefault,
        "",
        "\n",
        "A=1",
        "A=1\n\n\n",
        "  # indented comment\n\tB = 'x' \nC=\"y\"",
    };

    for (const auto& text : texts) {
        ConfigFile config;

        ASSERT_TRUE(config.Parse(text).IsNone()) << text;
        EXPECT_EQ(config.ToString(), text);
    }
}

TEST_F(ConfigFileTest, MissingSeparatorFails)
{
    ConfigFile config;

    auto err = config.Parse("A=1\n# comment\nNOT_A_PAIR\n");

    ASSERT_TRUE(err.Is(ErrorEnum::eInvalidArgument)) << aos::tests::utils::ErrorToStr(err);
    EXPECT_NE(std::string(err.Message()).find("line 3"), std::string::npos) << err.Message();
}

TEST_F(ConfigFileTest, EmptyKeyFails)
{
    ConfigFile config;

    EXPECT_TRUE(config.Parse("=value").Is(ErrorEnum::eInvalidArgument));
}

TEST_F(ConfigFileTest, FailedParseKeepsPreviousContent)
{
    ConfigFile config;

    ASSERT_TRUE(config.Parse("A=1").IsNone());
    ASSERT_FALSE(config.Parse("broken").IsNone());

    EXPECT_EQ(config.ToString(), "A=1");
}

TEST_F(ConfigFileTest, ValueAfterFirstSeparator)
{
    ConfigFile config;

    ASSERT_TRUE(config.Parse("GRUB_CMDLINE_LINUX=\"root=/dev/sda1 a=b\"").IsNone());

    const auto* keyValue = config.Find("GRUB_CMDLINE_LINUX");

    ASSERT_NE(keyValue, nullptr);
    EXPECT_EQ(keyValue->mValue, "root=/dev/sda1 a=b");
}

TEST_F(ConfigFileTest, QuotesAreRemovedFromValue)
{
    ConfigFile config;

    ASSERT_TRUE(config.Parse("A=\"it's\"").IsNone());

    EXPECT_EQ(config.Find("A")->mValue, "its");
}

TEST_F(ConfigFileTest, LastOccurrenceWins)
{
    ConfigFile config;

    ASSERT_TRUE(config.Parse("A=1\nA=2").IsNone());

    const auto keyValues = config.GetKeyValues();

    ASSERT_EQ(keyValues.size(), 1);
    EXPECT_EQ(keyValues.at("A").mValue, "2");
    EXPECT_EQ(keyValues.at("A").mLine, 1);
    EXPECT_EQ(config.GetValues().size(), 2);
}

TEST_F(ConfigFileTest, SetSameValueKeepsLine)
{
    ConfigFile config;

    ASSERT_TRUE(config.Parse("GRUB_TIMEOUT='8'").IsNone());

    config.SetKeyValue("GRUB_TIMEOUT", "8");

    EXPECT_FALSE(config.Find("GRUB_TIMEOUT")->mDirty);
    EXPECT_EQ(config.ToString(), "GRUB_TIMEOUT='8'");
}

TEST_F(ConfigFileTest, SetChangedValueRewritesOnlyThisLine)
{
    ConfigFile config;

    ASSERT_TRUE(config.Parse(cGrubDefault).IsNone());

    config.SetKeyValue("GRUB_TIMEOUT", "3");

    const auto* keyValue = config.Find("GRUB_TIMEOUT");

    ASSERT_NE(keyValue, nullptr);
    EXPECT_TRUE(keyValue->mDirty);
    EXPECT_EQ(keyValue->mValue, "3");
    EXPECT_EQ(keyValue->mLine, 3);

    auto expected = cGrubDefault;

    expected.replace(expected.find("GRUB_TIMEOUT=8"), std::string("GRUB_TIMEOUT=8").size(), "GRUB_TIMEOUT=\"3\"");

    EXPECT_EQ(config.ToString(), expected);
}

TEST_F(ConfigFileTest, SetNewKeyAppendsLine)
{
    ConfigFile config;

    ASSERT_TRUE(config.Parse("A=1\n# comment").IsNone());

    config.SetKeyValue("B", "two words");

    const auto* keyValue = config.Find("B");

    ASSERT_NE(keyValue, nullptr);
    EXPECT_TRUE(keyValue->mDirty);
    EXPECT_EQ(keyValue->mLine, 2);
    EXPECT_EQ(keyValue->mOriginal, "");
    EXPECT_EQ(config.ToString(), "A=1\n# comment\nB=\"two words\"");
}

TEST_F(ConfigFileTest, ParseLines)
{
    ConfigFile config;

    ASSERT_TRUE(config.Parse(std::vector<std::string> {"# header", "A=1", "B='2'"}).IsNone());

    EXPECT_EQ(config.GetValues().size(), 2);
    EXPECT_EQ(config.ToString(), "# header\nA=1\nB='2'");
}

TEST_F(ConfigFileTest, LoadAndSave)
{
    auto [dir, err] = common::utils::MkTmpDir("", "configfile_test");
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    const auto path = common::utils::JoinPath(dir, "grub");

    std::ofstream(path) << cGrubDefault;

    ConfigFile config;

    ASSERT_TRUE(config.Load(path).IsNone());

    config.SetKeyValue("GRUB_DEFAULT", "0");

    ASSERT_TRUE(config.Save(path).IsNone());

    ConfigFile reloaded;

    ASSERT_TRUE(reloaded.Load(path).IsNone());
    EXPECT_EQ(reloaded.Find("GRUB_DEFAULT")->mValue, "0");
    EXPECT_EQ(reloaded.Find("GRUB_DEFAULT")->mOriginal, "GRUB_DEFAULT=\"0\"");

    std::filesystem::remove_all(dir);
}

TEST_F(ConfigFileTest, LoadMissingFile)
{
    ConfigFile config;

    EXPECT_TRUE(config.Load("/non/existing/grub").Is(ErrorEnum::eNotFound));
}

} // namespace bootkit::grub2
