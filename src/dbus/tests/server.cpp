/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cerrno>
#include <chrono>
#include <future>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <core/common/tests/utils/log.hpp>
#include <core/common/tests/utils/utils.hpp>

#include <dbus/server.hpp>

using namespace testing;

namespace bootkit::dbus {

namespace {

class MockRequestHandler : public handler::RequestHandlerItf {
public:
    MOCK_METHOD(std::string, GetConfig, (), (override));
    MOCK_METHOD(std::string, SetConfig, (const std::string& payload), (override));
    MOCK_METHOD(std::string, GetBootEntries, (), (override));
};

} // namespace

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class ServerTest : public Test {
protected:
    void SetUp() override
    {
        aos::tests::utils::InitLog();

        config::DBusConfig config {"org.opensuse.bootloader", "/org/opensuse/bootloader", true};

        ASSERT_TRUE(mServer.Init(config, mHandler).IsNone());
    }

    StrictMock<MockRequestHandler> mHandler;
    Server                         mServer;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST(BusPollFDTest, MakeBusPollFD)
{
    auto [pollFD, err] = MakeBusPollFD(5, POLLIN | POLLOUT);

    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);
    EXPECT_EQ(pollFD.fd, 5);
    EXPECT_EQ(pollFD.events, POLLIN | POLLOUT);
    EXPECT_EQ(pollFD.revents, 0);
}

TEST(BusPollFDTest, MakeBusPollFDFailed)
{
    EXPECT_FALSE(MakeBusPollFD(-EBADF, POLLIN).mError.IsNone());
    EXPECT_FALSE(MakeBusPollFD(5, -ENOTCONN).mError.IsNone());
    EXPECT_FALSE(MakeBusPollFD(-ECHILD, -ECHILD).mError.IsNone());
}

TEST_F(ServerTest, GracefulShutdownWithoutHandles)
{
    EXPECT_TRUE(mServer.GracefulShutdown().IsNone());
}

TEST_F(ServerTest, GracefulShutdownWaitsHandlesReleased)
{
    auto handle      = mServer.GetHandle();
    auto otherHandle = handle;
    auto lastHandle  = mServer.GetHandle();

    auto shutdown = std::async(std::launch::async, [this]() { return mServer.GracefulShutdown(); });

    EXPECT_EQ(shutdown.wait_for(std::chrono::milliseconds(200)), std::future_status::timeout);

    handle.reset();
    otherHandle.reset();

    EXPECT_EQ(shutdown.wait_for(std::chrono::milliseconds(200)), std::future_status::timeout);

    lastHandle.reset();

    ASSERT_EQ(shutdown.wait_for(std::chrono::seconds(1)), std::future_status::ready);
    EXPECT_TRUE(shutdown.get().IsNone());
}

TEST_F(ServerTest, WaitActivityWithoutClients)
{
    EXPECT_FALSE(mServer.WaitActivity(Time::cMilliseconds * 50));
}

TEST_F(ServerTest, EmitWithoutBus)
{
    EXPECT_TRUE(mServer.EmitFileChanged().Is(ErrorEnum::eWrongState));
}

} // namespace bootkit::dbus
