/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <fstream>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>

#include <core/common/tests/utils/log.hpp>
#include <core/common/tests/utils/utils.hpp>

#include <common/utils/filesystem.hpp>
#include <common/utils/json.hpp>
#include <database/tests/mocks/snapshotstoremock.hpp>
#include <handler/handler.hpp>

using namespace testing;

namespace bootkit::handler {

namespace {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

const std::string cGrubDefault = "# grub defaults\nGRUB_DEFAULT=saved\nGRUB_TIMEOUT=8\n";

const std::string cGrubMenu = R"(menuentry 'Linux' {
}
submenu 'Advanced' {
	menuentry 'Linux, recovery' {
	}
}
)";

const std::string cGrubEnv = "# GRUB Environment Block\nsaved_entry=1\n";

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

Poco::JSON::Object::Ptr ParseObject(const std::string& json)
{
    auto [var, err] = common::utils::ParseJson(json);
    if (!err.IsNone()) {
        return {};
    }

    return var.extract<Poco::JSON::Object::Ptr>();
}

std::string ReadFile(const std::string& path)
{
    auto [content, err] = common::utils::ReadFile(path);
    if (!err.IsNone()) {
        return "";
    }

    return content;
}

} // namespace

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class HandlerTest : public Test {
protected:
    void SetUp() override
    {
        aos::tests::utils::InitLog();

        Error err;

        Tie(mDir, err) = common::utils::MkTmpDir("", "handler_test");
        ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

        mConfig.mGrubFile     = common::utils::JoinPath(mDir, "grub");
        mConfig.mGrubMenuFile = common::utils::JoinPath(mDir, "grub.cfg");
        mConfig.mGrubEnvFile  = common::utils::JoinPath(mDir, "grubenv");
        mConfig.mConfigDir    = mDir;
        mConfig.mBootDir      = mDir;

        std::ofstream(mConfig.mGrubFile) << cGrubDefault;
        std::ofstream(mConfig.mGrubMenuFile) << cGrubMenu;
        std::ofstream(mConfig.mGrubEnvFile) << cGrubEnv;

        ASSERT_TRUE(mHandler.Init(mConfig, mSnapshotStore).IsNone());
    }

    void TearDown() override { std::filesystem::remove_all(mDir); }

    std::string                             mDir;
    config::GrubConfig                      mConfig;
    StrictMock<database::MockSnapshotStore> mSnapshotStore;
    Handler                                 mHandler;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(HandlerTest, GetConfig)
{
    auto object = ParseObject(mHandler.GetConfig());
    ASSERT_FALSE(object.isNull());

    auto valueMap = object->getObject("value_map");
    ASSERT_FALSE(valueMap.isNull());
    EXPECT_EQ(valueMap->size(), 2);

    auto timeout = valueMap->getObject("GRUB_TIMEOUT");
    ASSERT_FALSE(timeout.isNull());
    EXPECT_EQ(timeout->getValue<std::string>("key"), "GRUB_TIMEOUT");
    EXPECT_EQ(timeout->getValue<std::string>("value"), "8");
    EXPECT_EQ(timeout->getValue<int>("line"), 2);
    EXPECT_FALSE(timeout->getValue<bool>("dirty"));

    auto valueList = object->getArray("value_list");
    ASSERT_FALSE(valueList.isNull());
    ASSERT_EQ(valueList->size(), 2);
    EXPECT_EQ(valueList->getObject(0)->getValue<std::string>("key"), "GRUB_DEFAULT");
    EXPECT_EQ(valueList->getObject(1)->getValue<std::string>("key"), "GRUB_TIMEOUT");
}

TEST_F(HandlerTest, GetConfigMissingFile)
{
    std::filesystem::remove(mConfig.mGrubFile);

    auto object = ParseObject(mHandler.GetConfig());
    ASSERT_FALSE(object.isNull());

    EXPECT_TRUE(object->has("error"));
}

TEST_F(HandlerTest, SetConfig)
{
    EXPECT_CALL(mSnapshotStore, SaveSnapshot(_, std::optional<std::string>("Linux, recovery")))
        .WillOnce(Return(ErrorEnum::eNone));

    auto object = ParseObject(mHandler.SetConfig(R"({"GRUB_TIMEOUT": 3, "GRUB_TERMINAL": "console"})"));
    ASSERT_FALSE(object.isNull());
    ASSERT_FALSE(object->has("error")) << object->getValue<std::string>("error");

    auto timeout = object->getObject("value_map")->getObject("GRUB_TIMEOUT");
    EXPECT_EQ(timeout->getValue<std::string>("value"), "3");
    EXPECT_TRUE(timeout->getValue<bool>("dirty"));

    EXPECT_EQ(ReadFile(mConfig.mGrubFile),
        "# grub defaults\nGRUB_DEFAULT=saved\nGRUB_TIMEOUT=\"3\"\n\nGRUB_TERMINAL=\"console\"");
}

TEST_F(HandlerTest, SetConfigKeepsPayloadOrder)
{
    EXPECT_CALL(mSnapshotStore, SaveSnapshot(_, _)).WillOnce(Return(ErrorEnum::eNone));

    mHandler.SetConfig(R"({"Z_KEY": "1", "A_KEY": "2"})");

    EXPECT_EQ(ReadFile(mConfig.mGrubFile), cGrubDefault + "\nZ_KEY=\"1\"\nA_KEY=\"2\"");
}

TEST_F(HandlerTest, SetConfigSnapshotContent)
{
    std::string snapshot;

    EXPECT_CALL(mSnapshotStore, SaveSnapshot(_, _))
        .WillOnce(DoAll(SaveArg<0>(&snapshot), Return(ErrorEnum::eNone)));

    mHandler.SetConfig(R"({"GRUB_DEFAULT": "0"})");

    EXPECT_EQ(snapshot, ReadFile(mConfig.mGrubFile));
}

TEST_F(HandlerTest, SetConfigInvalidPayload)
{
    for (const auto& payload : {"not json", "[1, 2]", R"({"A": null})", R"({"A": {"B": 1}})"}) {
        auto object = ParseObject(mHandler.SetConfig(payload));
        ASSERT_FALSE(object.isNull()) << payload;

        EXPECT_TRUE(object->has("error")) << payload;
    }

    EXPECT_EQ(ReadFile(mConfig.mGrubFile), cGrubDefault);
}

TEST_F(HandlerTest, SetConfigRejectsUnsafeKeyValues)
{
    const std::vector<std::string> payloads = {
        R"({"GRUB_TIMEOUT": "1\nx"})",
        R"({"GRUB_TIMEOUT": "1\rx"})",
        R"({"GRUB_CMDLINE_LINUX": "quiet \"splash\""})",
        R"({"GRUB_CMDLINE_LINUX": "it's"})",
        R"({"": "1"})",
        R"({"GRUB=TIMEOUT": "1"})",
        R"({"GRUB TIMEOUT": "1"})",
        R"({"GRUB_TIMEOUT\n": "1"})",
        R"({"#GRUB_TIMEOUT": "1"})",
        R"({"GRUB_DEFAULT": "0", "GRUB_TIMEOUT": "1\nx"})",
    };

    for (const auto& payload : payloads) {
        auto object = ParseObject(mHandler.SetConfig(payload));
        ASSERT_FALSE(object.isNull()) << payload;

        EXPECT_TRUE(object->has("error")) << payload;
        EXPECT_EQ(ReadFile(mConfig.mGrubFile), cGrubDefault) << payload;
    }

    auto object = ParseObject(mHandler.GetConfig());
    ASSERT_FALSE(object.isNull());

    EXPECT_FALSE(object->has("error"));
}

TEST_F(HandlerTest, SetConfigSnapshotFailure)
{
    EXPECT_CALL(mSnapshotStore, SaveSnapshot(_, _)).WillOnce(Return(ErrorEnum::eFailed));

    auto object = ParseObject(mHandler.SetConfig(R"({"GRUB_TIMEOUT": "5"})"));
    ASSERT_FALSE(object.isNull());

    EXPECT_TRUE(object->has("error"));
    EXPECT_EQ(ReadFile(mConfig.mGrubFile), "# grub defaults\nGRUB_DEFAULT=saved\nGRUB_TIMEOUT=\"5\"\n");
}

TEST_F(HandlerTest, GetBootEntries)
{
    auto object = ParseObject(mHandler.GetBootEntries());
    ASSERT_FALSE(object.isNull());

    auto entries = object->getArray("entries");
    ASSERT_FALSE(entries.isNull());
    ASSERT_EQ(entries->size(), 2);

    auto entry = entries->getObject(1);
    EXPECT_EQ(entry->getValue<std::string>("name"), "Linux, recovery");
    EXPECT_EQ(entry->getValue<std::string>("path"), "Advanced>Linux, recovery");
    EXPECT_EQ(entry->getArray("submenus")->size(), 1);

    EXPECT_EQ(object->getValue<std::string>("selected"), "Linux, recovery");
}

TEST_F(HandlerTest, GetBootEntriesNoSelection)
{
    std::filesystem::remove(mConfig.mGrubEnvFile);

    auto object = ParseObject(mHandler.GetBootEntries());
    ASSERT_FALSE(object.isNull());

    EXPECT_TRUE(object->isNull("selected"));
}

TEST_F(HandlerTest, SaveSnapshot)
{
    EXPECT_CALL(mSnapshotStore, SaveSnapshot(cGrubDefault, std::optional<std::string>("Linux, recovery")))
        .WillOnce(Return(ErrorEnum::eNone));

    EXPECT_TRUE(mHandler.SaveSnapshot().IsNone());
}

} // namespace bootkit::handler
