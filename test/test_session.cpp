// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#include "spd_tools/errors.hpp"
#include "spd_tools/session.hpp"
#include "fake_programmer.hpp"
#include "spd_test_image.hpp"

#include <chrono>
#include <memory>
#include <span>
#include <stop_token>
#include <utility>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace spd_tools;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace
{

ProgrammerConfig instantConfig()
{
    ProgrammerConfig config;
    config.commandDelay = 0ms;
    config.writeDelay = 0ms;
    config.activationDelay = 0ms;
    config.pageSelectDelay = {0ms, 0ms};
    config.retryDelay = 0ms;
    return config;
}

class MockHidLink : public HidLink
{
  public:
    MOCK_METHOD(void, writeReport, (std::span<const uint8_t>), (override));
    MOCK_METHOD(std::vector<uint8_t>, readReport, (std::chrono::milliseconds),
                (override));
};

class SessionTest : public ::testing::Test
{
  protected:
    SessionTest()
    {
        programmer.eeprom = test::ddr4UdimmWithXmp();
    }

    void connect(ProgrammerConfig config = instantConfig())
    {
        session = Session::connect(config, [this](const ProgrammerConfig&) {
            return std::make_unique<test::FakeLink>(programmer);
        });
    }

    test::FakeProgrammer programmer;
    std::unique_ptr<Session> session;
    std::vector<std::pair<size_t, size_t>> progress;

    ProgressFunc recordProgress()
    {
        return [this](size_t done, size_t total) {
            progress.emplace_back(done, total);
        };
    }
};

} // namespace

TEST_F(SessionTest, ConnectLeavesSessionConnected)
{
    connect();
    EXPECT_EQ(session->state(), SessionState::connected);
    EXPECT_TRUE(programmer.commands.empty());
}

TEST_F(SessionTest, ReadImageSelectsPagesInOrder)
{
    connect();
    RawImage image = session->readImage();
    EXPECT_EQ(image, programmer.eeprom);

    ASSERT_EQ(programmer.commands.size(), 1U + 2U + 64U);
    EXPECT_EQ(programmer.commands[0], "BT-VER0010");
    EXPECT_EQ(programmer.commands[1], "BT-I2C2WR360001");
    EXPECT_EQ(programmer.commands[2], "BT-I2C2RD500008");
    EXPECT_EQ(programmer.commands[33], "BT-I2C2RD50F808");
    EXPECT_EQ(programmer.commands[34], "BT-I2C2WR370001");
    EXPECT_EQ(programmer.commands[35], "BT-I2C2RD500008");
    EXPECT_EQ(session->state(), SessionState::connected);
}

TEST_F(SessionTest, ReadReportsProgressPerChunk)
{
    connect();
    session->readImage(recordProgress());
    ASSERT_EQ(progress.size(), 64U);
    EXPECT_EQ(progress.front(), std::make_pair(size_t{8}, size_t{512}));
    EXPECT_EQ(progress.back(), std::make_pair(size_t{512}, size_t{512}));
}

TEST_F(SessionTest, BlankPageIsReadAgain)
{
    programmer.blankPasses[1] = 2;
    connect();
    RawImage image = session->readImage();
    EXPECT_EQ(image, programmer.eeprom);
    EXPECT_EQ(programmer.count("BT-I2C2WR370001"), 3U);
}

TEST_F(SessionTest, PersistentBlankPageIsReadFault)
{
    programmer.blankPasses[1] = 3;
    connect();
    try
    {
        session->readImage();
        FAIL() << "blank page was accepted";
    }
    catch (const ReadFault& e)
    {
        EXPECT_EQ(e.offset, 256U);
    }
    // first read plus BlankPageRetries
    EXPECT_EQ(programmer.count("BT-I2C2WR370001"), 3U);
    EXPECT_EQ(session->state(), SessionState::connected);
}

TEST_F(SessionTest, BlankPagesCanBeAccepted)
{
    programmer.eeprom = {};
    ProgrammerConfig config = instantConfig();
    config.acceptBlankPages = true;
    connect(config);
    EXPECT_EQ(session->readImage(), RawImage{});
    EXPECT_EQ(programmer.count("BT-I2C2WR36"), 1U);
}

TEST_F(SessionTest, GarbledReplyIsRetried)
{
    programmer.malformedReplies = 2;
    connect();
    EXPECT_EQ(session->readImage(), programmer.eeprom);
    // three attempts for page 0, one for page 1
    EXPECT_EQ(programmer.count("BT-I2C2RD500008"), 4U);
}

TEST_F(SessionTest, GarbledReplyGivesUpAfterChunkRetries)
{
    programmer.malformedReplies = 3;
    connect();
    try
    {
        session->readImage();
        FAIL() << "garbled chunk was accepted";
    }
    catch (const ReadFault& e)
    {
        EXPECT_EQ(e.offset, 0U);
        EXPECT_EQ(e.kind(), ErrorKind::readFault);
    }
    EXPECT_EQ(session->state(), SessionState::connected);
}

TEST_F(SessionTest, LateReplyIsNotTakenForTheNextChunk)
{
    programmer.lateReplyTo = "BT-I2C2RD500808";
    connect();
    EXPECT_EQ(session->readImage(), programmer.eeprom);
    // timed out once on page 0, then once per page
    EXPECT_EQ(programmer.count("BT-I2C2RD500808"), 3U);
}

TEST_F(SessionTest, WriteImageProgramsAndVerifies)
{
    programmer.eeprom = test::ddr4Udimm();
    RawImage target = test::ddr4UdimmWithXmp();
    connect();
    session->writeImage(target, recordProgress());

    EXPECT_EQ(programmer.eeprom, target);
    EXPECT_EQ(programmer.commands[0], "BT-VER0010");
    EXPECT_EQ(programmer.commands[1], "BT-I2C2WR360001");
    EXPECT_EQ(programmer.commands[2], "BT-I2C2WR50000823110C0285210000");
    EXPECT_EQ(programmer.count("BT-I2C2WR5000"), 2U);
    ASSERT_FALSE(progress.empty());
    EXPECT_EQ(progress.back(), std::make_pair(size_t{1024}, size_t{1024}));
    EXPECT_EQ(session->state(), SessionState::connected);
}

TEST_F(SessionTest, VerifyMismatchReportsAbsoluteOffset)
{
    RawImage target = test::ddr4UdimmWithXmp();
    programmer.stuckOffset = 0x12C;
    connect();
    try
    {
        session->writeImage(target);
        FAIL() << "stuck byte was not detected";
    }
    catch (const WriteVerificationFailed& e)
    {
        EXPECT_EQ(e.offset, 0x12CU);
        EXPECT_EQ(e.expected, target[0x12C]);
        EXPECT_EQ(e.actual, static_cast<uint8_t>(~target[0x12C]));
    }
    EXPECT_EQ(session->state(), SessionState::connected);
}

TEST_F(SessionTest, SecondTransferIsRejectedWhileBusy)
{
    connect();
    bool checked = false;
    programmer.onCommand = [&](const std::string& command) {
        if (checked || !command.starts_with("BT-I2C2RD"))
        {
            return;
        }
        checked = true;
        EXPECT_EQ(session->state(), SessionState::reading);
        EXPECT_THROW(session->readImage(), DeviceBusy);
        EXPECT_THROW(session->writeImage(programmer.eeprom), DeviceBusy);
        EXPECT_THROW(session->disconnect(), DeviceBusy);
    };
    EXPECT_EQ(session->readImage(), programmer.eeprom);
    EXPECT_TRUE(checked);
}

TEST_F(SessionTest, DisconnectDuringTransferKeepsTheLink)
{
    connect();
    bool refused = false;
    programmer.onCommand = [&](const std::string& command) {
        if (refused || !command.starts_with("BT-I2C2RD"))
        {
            return;
        }
        EXPECT_THROW(session->disconnect(), DeviceBusy);
        refused = true;
    };
    EXPECT_EQ(session->readImage(), programmer.eeprom);
    EXPECT_TRUE(refused);
    EXPECT_EQ(session->state(), SessionState::connected);

    programmer.onCommand = nullptr;
    EXPECT_EQ(session->readImage(), programmer.eeprom);
    session->disconnect();
    EXPECT_EQ(session->state(), SessionState::disconnected);
}

TEST_F(SessionTest, CancelStopsBetweenChunks)
{
    connect();
    std::stop_source stop;
    programmer.onCommand = [&](const std::string&) {
        if (programmer.count("BT-I2C2RD") == 10)
        {
            stop.request_stop();
        }
    };
    try
    {
        session->readImage({}, stop.get_token());
        FAIL() << "cancelled read completed";
    }
    catch (const OperationCancelled& e)
    {
        EXPECT_EQ(e.transferred, 80U);
        EXPECT_EQ(e.kind(), ErrorKind::cancelled);
    }
    EXPECT_EQ(programmer.count("BT-I2C2RD"), 10U);
    EXPECT_EQ(session->state(), SessionState::connected);

    programmer.onCommand = nullptr;
    EXPECT_EQ(session->readImage(), programmer.eeprom);
}

TEST_F(SessionTest, DisconnectedSessionRejectsTransfers)
{
    connect();
    session->disconnect();
    EXPECT_EQ(session->state(), SessionState::disconnected);
    EXPECT_THROW(session->readImage(), DeviceIoError);
}

TEST(SessionConnectTest, UnsolicitedReportsAreDiscarded)
{
    auto session =
        Session::connect(instantConfig(), [](const ProgrammerConfig&) {
            auto link = std::make_unique<MockHidLink>();
            std::vector<uint8_t> stale(65, 0);
            stale[1] = 'O';
            stale[2] = 'K';
            ::testing::InSequence seq;
            EXPECT_CALL(*link, readReport(0ms)).WillOnce(Return(stale));
            EXPECT_CALL(*link, readReport(0ms))
                .WillOnce(Return(std::vector<uint8_t>{}));
            EXPECT_CALL(*link, writeReport(_))
                .WillOnce(Throw(DeviceIoError("write: No such device")));
            return std::unique_ptr<HidLink>(std::move(link));
        });
    EXPECT_THROW(session->readImage(), DeviceIoError);
}

TEST(SessionConnectTest, EndlessInputIsDeviceIoError)
{
    auto session =
        Session::connect(instantConfig(), [](const ProgrammerConfig&) {
            auto link = std::make_unique<MockHidLink>();
            std::vector<uint8_t> noise(65, 0);
            noise[1] = ':';
            EXPECT_CALL(*link, readReport(0ms)).WillRepeatedly(Return(noise));
            EXPECT_CALL(*link, writeReport(_)).Times(0);
            return std::unique_ptr<HidLink>(std::move(link));
        });
    EXPECT_THROW(session->readImage(), DeviceIoError);
    EXPECT_EQ(session->state(), SessionState::connected);
}

TEST(SessionConnectTest, OpenerErrorsPropagate)
{
    EXPECT_THROW(Session::connect(instantConfig(),
                                  [](const ProgrammerConfig&)
                                      -> std::unique_ptr<HidLink> {
                                      throw DeviceNotFound("no 0483:1230");
                                  }),
                 DeviceNotFound);
    EXPECT_THROW(Session::connect(instantConfig(),
                                  [](const ProgrammerConfig&) {
                                      return std::unique_ptr<HidLink>();
                                  }),
                 DeviceNotFound);
}

TEST(SessionConnectTest, TransportFailureEndsOperation)
{
    auto session =
        Session::connect(instantConfig(), [](const ProgrammerConfig&) {
            auto link = std::make_unique<MockHidLink>();
            EXPECT_CALL(*link, writeReport(_))
                .WillOnce(Throw(DeviceIoError("write: No such device")));
            // only the check for stale input before the command
            EXPECT_CALL(*link, readReport(_)).Times(0);
            EXPECT_CALL(*link, readReport(0ms))
                .WillOnce(Return(std::vector<uint8_t>{}));
            return std::unique_ptr<HidLink>(std::move(link));
        });
    EXPECT_THROW(session->readImage(), DeviceIoError);
    EXPECT_EQ(session->state(), SessionState::connected);
}
