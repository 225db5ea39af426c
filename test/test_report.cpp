// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#include "spd_tools/report.hpp"
#include "spd_test_image.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace spd_tools;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::Return;

namespace
{

class MockLookup : public ManufacturerLookup
{
  public:
    MOCK_METHOD(std::optional<std::string>, resolveName, (uint8_t, uint8_t),
                (const, override));
};

} // namespace

TEST(RecordJsonTest, DecodedFields)
{
    MockLookup lookup;
    EXPECT_CALL(lookup, resolveName(1, 0x2C))
        .Times(2)
        .WillRepeatedly(Return("Micron Technology"));

    nlohmann::json decoded =
        recordToJson(ddr4::decode(test::ddr4Udimm()), lookup);
    EXPECT_EQ(decoded["BytesUsed"], 384);
    EXPECT_EQ(decoded["SpdRevision"], "1.1");
    EXPECT_EQ(decoded["DeviceType"], "0x0C");
    EXPECT_EQ(decoded["ModuleType"], "UDIMM");
    EXPECT_EQ(decoded["Capacity"], "8 GB");
    EXPECT_EQ(decoded["Density"]["CapacityMiB"], 8192);
    EXPECT_EQ(decoded["TimingsPs"]["tRC"], 45750);
    EXPECT_EQ(decoded["SpeedGrade"], 2666);
    EXPECT_EQ(decoded["TimingString"], "CL19-19-19-43");
    EXPECT_EQ(decoded["ManufacturerId"], "0x802C");
    EXPECT_EQ(decoded["Manufacturer"], "Micron Technology");
    EXPECT_EQ(decoded["ManufacturingYear"], 2019);
    EXPECT_EQ(decoded["SerialNumber"], "1A2B3C4D");
    EXPECT_EQ(decoded["PartNumber"], "8ATF1G64AZ-2G6E1");
    EXPECT_EQ(decoded["BaseCrc"]["Valid"], true);
    EXPECT_EQ(decoded["ChecksumValid"], true);
}

TEST(RecordJsonTest, ReservedCodesAreNull)
{
    RawImage image = test::ddr4Udimm();
    image[4] = 0x8F;
    image[17] = 0x0C;
    MockLookup lookup;
    EXPECT_CALL(lookup, resolveName(1, 0x2C))
        .WillRepeatedly(Return(std::nullopt));

    nlohmann::json decoded = recordToJson(ddr4::decode(image), lookup);
    EXPECT_TRUE(decoded["Capacity"].is_null());
    EXPECT_TRUE(decoded["Density"]["DieDensityMb"].is_null());
    EXPECT_TRUE(decoded["TimingsPs"]["tAA"].is_null());
    EXPECT_FALSE(decoded.contains("SpeedGrade"));
    EXPECT_EQ(decoded["Manufacturer"], "Unknown (0x802C)");
}

TEST(XmpJsonTest, Profiles)
{
    nlohmann::json xmpJson = xmpToJson(xmp::decode(test::ddr4UdimmWithXmp()));
    EXPECT_EQ(xmpJson["Present"], true);
    EXPECT_EQ(xmpJson["Revision"], "2.0");
    ASSERT_EQ(xmpJson["Profiles"].size(), 2U);
    const nlohmann::json& first = xmpJson["Profiles"][0];
    EXPECT_EQ(first["Enabled"], true);
    EXPECT_EQ(first["VoltageMv"], 1350);
    EXPECT_EQ(first["TimingsPs"]["tCKmin"], 625);
    EXPECT_EQ(first["Crc"]["Valid"], true);

    nlohmann::json absent = xmpToJson(xmp::decode(test::ddr4Udimm()));
    EXPECT_EQ(absent, (nlohmann::json{{"Present", false}}));
}

TEST(DocumentReportTest, RawDataAndModifications)
{
    JsonManufacturerTable table;
    SpdDocument document(test::ddr4Udimm(), "device");
    document.setByte(0x17F, 0x00);
    document.setByte(2, 0x0B);

    nlohmann::json report = documentReport(document, table);
    EXPECT_EQ(report["Source"], "device");
    std::string raw = report["RawData"];
    EXPECT_EQ(raw.size(), 512U * 3 - 1);
    EXPECT_TRUE(raw.starts_with("23 11 0B 02"));
    EXPECT_EQ(report["Advisories"],
              (nlohmann::json{"UnsupportedFormat", "ChecksumMismatch"}));
    ASSERT_EQ(report["Modifications"].size(), 2U);
    EXPECT_EQ(report["Modifications"][0]["Offset"], "0x002");
    EXPECT_EQ(report["Modifications"][0]["Original"], "0x0C");
    EXPECT_EQ(report["Modifications"][1]["Offset"], "0x17F");
    EXPECT_EQ(report["Modifications"][1]["Current"], "0x00");
}

TEST(DocumentReportTest, ForeignModuleSerializes)
{
    JsonManufacturerTable table;
    SpdDocument document(test::foreignModule(), "dump.bin");

    nlohmann::json report = documentReport(document, table);
    EXPECT_EQ(report["Decoded"]["PartNumber"], "");
    std::string text;
    EXPECT_NO_THROW(text = report.dump(4));
    EXPECT_FALSE(text.empty());

    std::string plain = textReport(document, table);
    EXPECT_TRUE(std::ranges::all_of(plain, [](char c) {
        return c == '\n' || (c >= 0x20 && c < 0x7F);
    }));
}

TEST(TextReportTest, Sections)
{
    nlohmann::json::object_t bank1;
    bank1["0x2C"] = "Micron Technology";
    nlohmann::json::object_t banks;
    banks["1"] = bank1;
    JsonManufacturerTable table(banks);

    SpdDocument document(test::ddr4UdimmWithXmp(), "module.bin");
    std::string text = textReport(document, table);
    EXPECT_THAT(text, HasSubstr("Source                  module.bin\n"));
    EXPECT_THAT(text, HasSubstr("Capacity                8 GB\n"));
    EXPECT_THAT(text, HasSubstr("DDR4-2666"));
    EXPECT_THAT(text, HasSubstr("Timings                 CL19-19-19-43\n"));
    EXPECT_THAT(text, HasSubstr("Manufacturer            Micron Technology\n"));
    EXPECT_THAT(text, HasSubstr("tRRD_L                  4900\n"));
    EXPECT_THAT(text,
                HasSubstr("Profile 1               3200 MT/s 1.35 V, "
                          "checksum ok\n"));
    EXPECT_THAT(text, HasSubstr("Profile 2               disabled\n"));
    EXPECT_THAT(text, Not(HasSubstr("Modifications")));
    EXPECT_THAT(text, Not(HasSubstr("Advisory")));

    document.setByte(0x17F, 0x00);
    EXPECT_THAT(textReport(document, table),
                HasSubstr("Modifications (1 bytes)\n"));
}

TEST(TextReportTest, WithoutXmp)
{
    JsonManufacturerTable table;
    SpdDocument document(test::ddr4Udimm());
    std::string text = textReport(document, table);
    EXPECT_THAT(text, HasSubstr("Source                  unknown\n"));
    EXPECT_THAT(text, HasSubstr("Present                 no\n"));
    EXPECT_THAT(text, HasSubstr("Unknown (0x802C)"));
}
