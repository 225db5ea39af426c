// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#include "spd_tools/errors.hpp"
#include "spd_tools/xmp.hpp"
#include "spd_test_image.hpp"

#include <algorithm>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace spd_tools;
using ::testing::ElementsAre;

namespace
{

uint16_t storedProfileCrc(const RawImage& image, size_t profile)
{
    size_t at = xmp::profileOffsets[profile] + xmp::profileCrcCoverage;
    return static_cast<uint16_t>(image[at] | (image[at + 1] << 8));
}

} // namespace

TEST(XmpDecodeTest, MissingHeaderIsNotAnError)
{
    xmp::XmpBlock block = xmp::decode(test::ddr4Udimm());
    EXPECT_FALSE(block.present);
    EXPECT_FALSE(block.profiles[0].enabled);
    EXPECT_FALSE(block.profiles[1].enabled);
}

TEST(XmpDecodeTest, EnabledProfile)
{
    xmp::XmpBlock block = xmp::decode(test::ddr4UdimmWithXmp());
    ASSERT_TRUE(block.present);
    EXPECT_EQ(block.revision, xmp::revision20);

    const xmp::XmpProfile& profile = block.profiles[0];
    EXPECT_TRUE(profile.enabled);
    EXPECT_EQ(profile.dimmsPerChannel, 1);
    EXPECT_EQ(profile.voltageMv, 1350);
    EXPECT_EQ(profile.timings.tCKmin, 625);
    EXPECT_EQ(profile.timings.tAA, 10000);
    EXPECT_EQ(profile.timings.tRCD, 11250);
    EXPECT_EQ(profile.timings.tRP, 11250);
    EXPECT_EQ(profile.timings.tRAS, 22500);
    EXPECT_EQ(profile.timings.tRC, 33750);
    EXPECT_EQ(profile.timings.tRFC1, 350000);
    EXPECT_EQ(profile.timings.tRRD_L, 4900);
    EXPECT_THAT(profile.casLatencies, ElementsAre(16, 18, 20, 22));
    EXPECT_TRUE(profile.checksumValid());
    EXPECT_NEAR(xmp::dataRateMts(profile), 3200.0, 0.001);

    EXPECT_FALSE(block.profiles[1].enabled);
}

TEST(XmpDecodeTest, NamedTimingsFollowProfileOrder)
{
    xmp::XmpBlock block = xmp::decode(test::ddr4UdimmWithXmp());
    auto timings = xmp::namedTimings(block.profiles[0]);
    ASSERT_EQ(timings.size(), 13U);
    EXPECT_EQ(timings.front().first, "tCKmin");
    EXPECT_EQ(timings.front().second, 625);
    EXPECT_EQ(timings[1].first, "tAA");
    EXPECT_EQ(timings.back().first, "tCCD_L");
}

TEST(XmpDecodeTest, CorruptedProfileFailsChecksum)
{
    RawImage image = test::ddr4UdimmWithXmp();
    image[xmp::profileOffsets[0] + 8] = 0x51;
    xmp::XmpBlock block = xmp::decode(image);
    EXPECT_FALSE(block.profiles[0].checksumValid());
}

TEST(XmpEncodeTest, UnchangedBlockReproducesImage)
{
    RawImage image = test::ddr4UdimmWithXmp();
    EXPECT_EQ(xmp::encode(xmp::decode(image), image), image);

    RawImage plain = test::ddr4Udimm();
    EXPECT_EQ(xmp::encode(xmp::decode(plain), plain), plain);
}

TEST(XmpEncodeTest, EnablingIntoPlainImageWritesHeader)
{
    RawImage image = test::ddr4Udimm();
    xmp::XmpBlock block = xmp::decode(image);
    block.present = true;
    xmp::XmpProfile& profile = block.profiles[0];
    profile.enabled = true;
    profile.voltageMv = 1200;
    profile.casLatencies = {16, 18};
    profile.timings = {};
    profile.timings.tAA = 10000;
    xmp::setDataRate(profile, 3200);

    RawImage encoded = xmp::encode(block, image);
    EXPECT_EQ(encoded[xmp::headerOffset], xmp::magic0);
    EXPECT_EQ(encoded[xmp::headerOffset + 1], xmp::magic1);
    EXPECT_EQ(encoded[xmp::headerOffset + 3], xmp::revision20);

    xmp::XmpBlock decoded = xmp::decode(encoded);
    ASSERT_TRUE(decoded.present);
    EXPECT_TRUE(decoded.profiles[0].enabled);
    EXPECT_EQ(decoded.profiles[0].voltageMv, 1200);
    EXPECT_EQ(decoded.profiles[0].timings.tCKmin, 625);
    EXPECT_TRUE(decoded.profiles[0].checksumValid());
    EXPECT_FALSE(decoded.profiles[1].enabled);
    // the disabled second profile keeps its (empty) bytes
    EXPECT_TRUE(std::all_of(encoded.begin() + xmp::profileOffsets[1],
                            encoded.begin() + xmp::profileOffsets[1] +
                                xmp::profileSize,
                            [](uint8_t b) { return b == 0; }));
}

TEST(XmpEncodeTest, ChangedProfileGetsNewChecksum)
{
    RawImage image = test::ddr4UdimmWithXmp();
    xmp::XmpBlock block = xmp::decode(image);
    block.profiles[0].voltageMv = 1400;
    block.profiles[0].timings.tAA = 10625;

    RawImage encoded = xmp::encode(block, image);
    EXPECT_EQ(encoded[xmp::profileOffsets[0]], 0xA8);
    EXPECT_NE(storedProfileCrc(encoded, 0), storedProfileCrc(image, 0));
    EXPECT_EQ(storedProfileCrc(encoded, 0),
              test::referenceCrc16(encoded.data() + xmp::profileOffsets[0],
                                   xmp::profileCrcCoverage));
    EXPECT_EQ(xmp::decode(encoded).profiles[0].timings.tAA, 10625);
    // DDR4 part of the image is untouched
    EXPECT_TRUE(std::equal(image.begin(), image.begin() + xmp::headerOffset,
                           encoded.begin()));
}

TEST(XmpEncodeTest, NotPresentClearsOnlyMagic)
{
    RawImage image = test::ddr4UdimmWithXmp();
    xmp::XmpBlock block = xmp::decode(image);
    block.present = false;

    RawImage encoded = xmp::encode(block, image);
    EXPECT_EQ(encoded[xmp::headerOffset], 0);
    EXPECT_EQ(encoded[xmp::headerOffset + 1], 0);
    EXPECT_TRUE(std::equal(image.begin() + xmp::headerOffset + 2, image.end(),
                           encoded.begin() + xmp::headerOffset + 2));
    EXPECT_FALSE(xmp::decode(encoded).present);
}

TEST(XmpEncodeTest, VoltageOutsideEncodingThrows)
{
    RawImage image = test::ddr4UdimmWithXmp();
    xmp::XmpBlock block = xmp::decode(image);

    block.profiles[0].voltageMv = 1355;
    EXPECT_THROW(xmp::encode(block, image), RangeError);

    block.profiles[0].voltageMv = 2000;
    EXPECT_THROW(xmp::encode(block, image), RangeError);
}

TEST(XmpEncodeTest, DimmsPerChannelRange)
{
    RawImage image = test::ddr4UdimmWithXmp();
    xmp::XmpBlock block = xmp::decode(image);

    block.profiles[0].dimmsPerChannel = 2;
    RawImage encoded = xmp::encode(block, image);
    EXPECT_EQ(xmp::decode(encoded).profiles[0].dimmsPerChannel, 2);

    block.profiles[0].dimmsPerChannel = 5;
    EXPECT_THROW(xmp::encode(block, image), RangeError);
}

TEST(XmpChecksumTest, RefreshSkipsDisabledProfiles)
{
    RawImage image = test::ddr4UdimmWithXmp();
    image[xmp::profileOffsets[1] + 8] = 0x50;
    RawImage refreshed = image;
    xmp::refreshChecksums(refreshed);
    EXPECT_EQ(storedProfileCrc(refreshed, 1), storedProfileCrc(image, 1));
    EXPECT_EQ(storedProfileCrc(refreshed, 0), storedProfileCrc(image, 0));
}

TEST(XmpChecksumTest, ReferenceRefreshFollowsChanges)
{
    RawImage reference = test::ddr4UdimmWithXmp();
    RawImage image = reference;
    image[xmp::profileOffsets[0] + 9] = 0x5B;
    xmp::refreshChecksums(image, reference);
    EXPECT_TRUE(xmp::decode(image).profiles[0].checksumValid());
}

TEST(XmpTimingTableTest, ProfileOutOfRangeThrows)
{
    EXPECT_EQ(xmp::timingTable(1).size(), 13U);
    EXPECT_EQ(xmp::timingTable(1).front().spec.medium.offset,
              xmp::profileOffsets[1] + 3);
    EXPECT_THROW(xmp::timingTable(2), RangeError);
}
