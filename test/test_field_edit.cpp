// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#include "spd_tools/document.hpp"
#include "spd_tools/errors.hpp"
#include "spd_tools/field_edit.hpp"
#include "spd_test_image.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace spd_tools;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::Not;

TEST(EditableFieldsTest, ListsRecordTimingAndXmpFields)
{
    auto fields = editableFields();
    EXPECT_THAT(fields, Contains("partNumber"));
    EXPECT_THAT(fields, Contains("tRCD"));
    EXPECT_THAT(fields, Contains("xmp1.voltage"));
    EXPECT_THAT(fields, Contains("xmp2.tRRD_L"));
    EXPECT_THAT(fields, Not(Contains("baseCrc")));
    EXPECT_THAT(fields, Not(Contains("xmp2.tCKmax")));
}

TEST(SetFieldTest, TextAndIdentifiers)
{
    SpdDocument document(test::ddr4Udimm());
    setField(document, "partNumber", "F4-3200C16-8GVKB");
    setField(document, "manufacturerId", "0x04CD");
    setField(document, "manufacturingDate", "2024-17");
    setField(document, "serialNumber", "01 02 0A 0B");

    ddr4::Ddr4Record record = document.record();
    EXPECT_EQ(record.partNumber, "F4-3200C16-8GVKB");
    EXPECT_EQ(record.manufacturerId, (ddr4::JedecId{0x04, 0xCD}));
    EXPECT_EQ(record.manufacturingDate, (ddr4::ManufacturingDate{2024, 17}));
    EXPECT_THAT(record.serialNumber, ElementsAre(0x01, 0x02, 0x0A, 0x0B));

    setField(document, "serialNumber", "DEADBEEF");
    EXPECT_EQ(ddr4::serialNumberHex(document.record()), "DEADBEEF");
}

TEST(SetFieldTest, TimingsInPicoseconds)
{
    SpdDocument document(test::ddr4Udimm());
    setField(document, "tAA", "13500");
    setField(document, "dataRate", "3200");
    setField(document, "casLatencies", "16,18,20");

    ddr4::Ddr4Record record = document.record();
    EXPECT_EQ(record.timings.tAA, 13500);
    EXPECT_EQ(record.timings.tCKmin, 625);
    EXPECT_THAT(record.casLatencies, ElementsAre(16, 18, 20));
    EXPECT_TRUE(record.checksumValid);
}

TEST(SetFieldTest, RawOffset)
{
    SpdDocument document(test::ddr4Udimm());
    setField(document, "0x17F", "0xA5");
    setField(document, "384", "7");
    EXPECT_EQ(document.byteAt(0x17F), 0xA5);
    EXPECT_EQ(document.byteAt(384), 7);
    EXPECT_THROW(setField(document, "0x200", "1"), RangeError);
    EXPECT_THROW(setField(document, "0x10", "256"), RangeError);
}

TEST(SetFieldTest, BadNamesAndValues)
{
    SpdDocument document(test::ddr4Udimm());
    EXPECT_THROW(setField(document, "colour", "red"), RangeError);
    EXPECT_THROW(setField(document, "tAA", "fast"), RangeError);
    EXPECT_THROW(setField(document, "manufacturingDate", "2024"),
                 RangeError);
    EXPECT_THROW(setField(document, "serialNumber", "123"), RangeError);
    EXPECT_THROW(setField(document, "partNumber", "P\xC3\xA4rt"),
                 EncodingError);
    EXPECT_THROW(setField(document, "xmp3.enabled", "1"), RangeError);
    EXPECT_FALSE(document.modified());
}

TEST(SetFieldTest, XmpFieldsEditExistingProfile)
{
    SpdDocument document(test::ddr4UdimmWithXmp());
    setField(document, "xmp1.voltage", "1400");
    setField(document, "xmp1.tAA", "10625");
    setField(document, "xmp1.dimmsPerChannel", "2");

    xmp::XmpProfile profile = document.xmpBlock().profiles[0];
    EXPECT_EQ(profile.voltageMv, 1400);
    EXPECT_EQ(profile.timings.tAA, 10625);
    EXPECT_EQ(profile.dimmsPerChannel, 2);
    EXPECT_TRUE(profile.checksumValid());
}

TEST(SetFieldTest, EnablingXmpSeedsFromJedecTimings)
{
    SpdDocument document(test::ddr4Udimm());
    EXPECT_THROW(setField(document, "xmp1.voltage", "1350"), RangeError);

    setField(document, "xmp1.enabled", "1");
    xmp::XmpBlock block = document.xmpBlock();
    ASSERT_TRUE(block.present);
    EXPECT_EQ(block.revision, xmp::revision20);
    const xmp::XmpProfile& profile = block.profiles[0];
    EXPECT_TRUE(profile.enabled);
    EXPECT_EQ(profile.voltageMv, 1200);
    EXPECT_EQ(profile.timings.tCKmin, 750);
    EXPECT_EQ(profile.timings.tRC, 45750);
    EXPECT_EQ(profile.casLatencies, document.record().casLatencies);
    EXPECT_TRUE(profile.checksumValid());
    EXPECT_FALSE(block.profiles[1].enabled);

    setField(document, "xmp1.dataRate", "3200");
    EXPECT_EQ(document.xmpBlock().profiles[0].timings.tCKmin, 625);
}
