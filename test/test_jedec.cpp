// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#include "spd_tools/errors.hpp"
#include "spd_tools/jedec.hpp"
#include "spd_test_image.hpp"

#include <array>
#include <cstdint>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace spd_tools;
using ::testing::ElementsAre;

namespace
{

const jedec::TimingSpec tck{"tCKmin", byteField("tCKmin", 0), std::nullopt,
                            signedByteField("tCKminFine", 1)};

const jedec::TimingSpec tras{"tRAS", byteField("tRAS", 1),
                             bitField("tRASUpper", 0, 0x0F, 0), std::nullopt};

int32_t decodeTck(uint8_t medium, uint8_t fine, const jedec::Timebase& base)
{
    std::array<uint8_t, 2> buffer = {medium, fine};
    return jedec::decodeTiming(buffer, tck, base);
}

} // namespace

TEST(CrcTest, MatchesBitwiseReference)
{
    RawImage image = test::ddr4Udimm();
    EXPECT_EQ(jedec::calcCRC16(std::span(image).first(126)),
              test::referenceCrc16(image.data(), 126));
}

TEST(CrcTest, KnownCheckValue)
{
    // CRC-16/XMODEM check value
    std::array<uint8_t, 9> digits = {'1', '2', '3', '4', '5',
                                     '6', '7', '8', '9'};
    EXPECT_EQ(jedec::calcCRC16(digits), 0x31C3);
}

TEST(CrcTest, EverySingleByteFlipChangesCrc)
{
    RawImage image = test::ddr4Udimm();
    uint16_t crc = jedec::calcCRC16(std::span(image).first(126));
    for (size_t offset = 0; offset < 126; offset++)
    {
        RawImage flipped = image;
        flipped[offset] ^= 0x01;
        EXPECT_NE(jedec::calcCRC16(std::span(flipped).first(126)), crc)
            << "offset " << offset;
    }
}

TEST(TimebaseTest, MediumCodes)
{
    EXPECT_EQ(jedec::mediumTimebasePs(0), 125);
    EXPECT_EQ(jedec::mediumTimebasePs(1), 250);
    EXPECT_EQ(jedec::mediumTimebasePs(2), 1000);
    EXPECT_EQ(jedec::mediumTimebasePs(3), std::nullopt);
    EXPECT_EQ(jedec::fineTimebasePs(0), 1);
    EXPECT_EQ(jedec::fineTimebasePs(1), std::nullopt);
    EXPECT_EQ(jedec::mediumTimebaseCode(1000), 2);
    EXPECT_EQ(jedec::mediumTimebaseCode(500), std::nullopt);
}

TEST(TimingDecodeTest, OneNanosecondTimebaseGivesWholeNanoseconds)
{
    EXPECT_EQ(decodeTck(0x02, 0x00, {1000, 1}), 2000);
}

TEST(TimingDecodeTest, NegativeFineOffsetSubtractsFraction)
{
    // DDR4-2133: 8 MTB - 62 FTB = 0.938 ns
    EXPECT_EQ(decodeTck(0x08, 0xC2, jedec::ddr4Timebase), 938);
    // DDR4-2400: 7 MTB - 42 FTB = 0.833 ns
    EXPECT_EQ(decodeTck(0x07, 0xD6, jedec::ddr4Timebase), 833);
}

TEST(TimingDecodeTest, PositiveFineOffsetAdds)
{
    EXPECT_EQ(decodeTck(0x27, 0x19, jedec::ddr4Timebase), 4900);
}

TEST(TimingDecodeTest, UpperNibbleWidensMedium)
{
    std::array<uint8_t, 2> buffer = {0x01, 0x00};
    EXPECT_EQ(jedec::decodeTiming(buffer, tras, jedec::ddr4Timebase), 32000);
}

TEST(TimingEncodeTest, SplitsIntoMediumAndFine)
{
    std::array<uint8_t, 2> buffer{};
    jedec::encodeTiming(buffer, tck, jedec::ddr4Timebase, 938);
    EXPECT_THAT(buffer, ElementsAre(0x08, 0xC2));
    jedec::encodeTiming(buffer, tck, jedec::ddr4Timebase, 750);
    EXPECT_THAT(buffer, ElementsAre(0x06, 0x00));
}

TEST(TimingEncodeTest, WithoutFineRoundsUp)
{
    std::array<uint8_t, 2> buffer{};
    jedec::encodeTiming(buffer, tras, jedec::ddr4Timebase, 32001);
    EXPECT_THAT(buffer, ElementsAre(0x01, 0x01));
}

TEST(TimingEncodeTest, TooLargeThrowsAndLeavesBuffer)
{
    std::array<uint8_t, 2> buffer = {0x06, 0x00};
    EXPECT_THROW(jedec::encodeTiming(buffer, tck, jedec::ddr4Timebase, 40000),
                 RangeError);
    EXPECT_THAT(buffer, ElementsAre(0x06, 0x00));
    EXPECT_THROW(jedec::encodeTiming(buffer, tck, jedec::ddr4Timebase, -1),
                 RangeError);
}

TEST(CasLatencyTest, LowRange)
{
    EXPECT_THAT(jedec::decodeCasLatencies(0x00003FF8),
                ElementsAre(10, 11, 12, 13, 14, 15, 16, 17, 18, 19, 20));
    EXPECT_EQ(jedec::encodeCasLatencies("cl", {10, 12, 14}), 0x000000A8U);
}

TEST(CasLatencyTest, HighRange)
{
    EXPECT_THAT(jedec::decodeCasLatencies(0x80000003), ElementsAre(23, 24));
    EXPECT_EQ(jedec::encodeCasLatencies("cl", {40, 50}), 0x88020000U);
}

TEST(CasLatencyTest, MixedRangesThrow)
{
    EXPECT_THROW(jedec::encodeCasLatencies("cl", {7, 52}), RangeError);
}

TEST(SpeedTest, DerivedFromCycleTime)
{
    EXPECT_DOUBLE_EQ(jedec::clockMhz(1000), 1000.0);
    EXPECT_NEAR(jedec::dataRateMts(750), 2666.67, 0.01);
    EXPECT_EQ(jedec::speedGrade(750), 2666);
    EXPECT_EQ(jedec::speedGrade(625), 3200);
    EXPECT_EQ(jedec::speedGrade(938), 2133);
    EXPECT_EQ(jedec::speedGrade(2000), std::nullopt);
    EXPECT_EQ(jedec::tckForDataRate(3200), 625);
    EXPECT_EQ(jedec::tckForDataRate(3000), 666);
    EXPECT_THROW(jedec::tckForDataRate(0), RangeError);
}

TEST(SpeedTest, ClocksUseGuardBand)
{
    EXPECT_EQ(jedec::clocksFor(13750, 750), 19U);
    EXPECT_EQ(jedec::clocksFor(10000, 625), 16U);
    EXPECT_EQ(jedec::clocksFor(0, 625), 0U);
}

TEST(BcdTest, Conversion)
{
    EXPECT_EQ(jedec::bcdToInt(0x19), 19);
    EXPECT_EQ(jedec::bcdToInt(0x1A), std::nullopt);
    EXPECT_EQ(jedec::intToBcd(53), 0x53);
}
