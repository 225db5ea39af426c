// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#pragma once

#include "spd_tools/byte_field.hpp"
#include "spd_tools/jedec.hpp"
#include "spd_tools/spd_image.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// JESD21-C Annex L: DDR4 SDRAM Serial Presence Detect, 512 byte layout.
namespace spd_tools::ddr4
{

// byte 2, Key Byte / DRAM Device Type
constexpr uint8_t deviceTypeDDR4 = 0x0C;

// Bytes covered by the base configuration CRC, stored at 126~127.
constexpr size_t baseCrcCoverage = 126;
// Module specific block 128~253, CRC stored at 254~255.
constexpr size_t moduleCrcStart = 128;
constexpr size_t moduleCrcCoverage = 126;

namespace fields
{
// 0 Number of Bytes Used / Number of Bytes in SPD Device
constexpr FieldSpec bytesUsed = bitField("bytesUsed", 0x000, 0x0F, 0);
constexpr FieldSpec bytesTotal = bitField("bytesTotal", 0x000, 0x70, 4);
// 1 SPD Revision
constexpr FieldSpec spdRevision = byteField("spdRevision", 0x001);
// 2 Key Byte / DRAM Device Type
constexpr FieldSpec deviceType = byteField("deviceType", 0x002);
// 3 Key Byte / Module Type
constexpr FieldSpec moduleTypeCode =
    bitField("moduleTypeCode", 0x003, 0x0F, 0);
// 4 SDRAM Density and Banks
constexpr FieldSpec dieDensity = bitField("dieDensity", 0x004, 0x0F, 0);
constexpr FieldSpec bankAddressBits =
    bitField("bankAddressBits", 0x004, 0x30, 4);
constexpr FieldSpec bankGroupBits = bitField("bankGroupBits", 0x004, 0xC0, 6);
// 5 SDRAM Addressing
constexpr FieldSpec columnAddressBits =
    bitField("columnAddressBits", 0x005, 0x07, 0);
constexpr FieldSpec rowAddressBits =
    bitField("rowAddressBits", 0x005, 0x38, 3);
// 6 Primary SDRAM Package Type
constexpr FieldSpec signalLoading = bitField("signalLoading", 0x006, 0x03, 0);
constexpr FieldSpec dieCount = bitField("dieCount", 0x006, 0x70, 4);
constexpr FieldSpec packageType = bitField("packageType", 0x006, 0x80, 7);
// 11 Module Nominal Voltage, VDD
constexpr FieldSpec moduleVoltage = byteField("moduleVoltage", 0x00B);
// 12 Module Organization
constexpr FieldSpec deviceWidth = bitField("deviceWidth", 0x00C, 0x07, 0);
constexpr FieldSpec packageRanks = bitField("packageRanks", 0x00C, 0x38, 3);
// 13 Module Memory Bus Width
constexpr FieldSpec busWidth = bitField("busWidth", 0x00D, 0x07, 0);
constexpr FieldSpec busWidthExtension =
    bitField("busWidthExtension", 0x00D, 0x18, 3);
// 17 Timebases
constexpr FieldSpec fineTimebase = bitField("fineTimebase", 0x011, 0x03, 0);
constexpr FieldSpec mediumTimebase =
    bitField("mediumTimebase", 0x011, 0x0C, 2);
// 20~23 CAS Latencies Supported
constexpr FieldSpec casLatencies = {"casLatencies",
                                    0x014,
                                    4,
                                    FieldKind::unsignedInt,
                                    Endian::little,
                                    jedec::casRangeBit | jedec::casBitmapMask,
                                    0,
                                    0};
// 126~127 CRC for Base Configuration Section
constexpr FieldSpec baseCrc = wordField("baseCrc", 0x07E);
// 254~255 CRC for Module Specific Section
constexpr FieldSpec moduleCrc = wordField("moduleCrc", 0x0FE);
// 320~321 Module Manufacturer ID Code
constexpr FieldSpec manufacturerIdContinuation =
    byteField("manufacturerIdContinuation", 0x140);
constexpr FieldSpec manufacturerIdCode =
    byteField("manufacturerIdCode", 0x141);
// 322 Module Manufacturing Location
constexpr FieldSpec manufacturingLocation =
    byteField("manufacturingLocation", 0x142);
// 323~324 Module Manufacturing Date, BCD year and week
constexpr FieldSpec manufacturingYear = byteField("manufacturingYear", 0x143);
constexpr FieldSpec manufacturingWeek = byteField("manufacturingWeek", 0x144);
// 325~328 Module Serial Number
constexpr FieldSpec serialNumber = rawField("serialNumber", 0x145, 4);
// 329~348 Module Part Number
constexpr FieldSpec partNumber = textField("partNumber", 0x149, 20);
// 349 Module Revision Code
constexpr FieldSpec revisionCode = byteField("revisionCode", 0x15D);
// 350~351 DRAM Manufacturer ID Code
constexpr FieldSpec dramManufacturerIdContinuation =
    byteField("dramManufacturerIdContinuation", 0x15E);
constexpr FieldSpec dramManufacturerIdCode =
    byteField("dramManufacturerIdCode", 0x15F);
// 352 DRAM Stepping
constexpr FieldSpec dramStepping = byteField("dramStepping", 0x160);
} // namespace fields

// Every single-field descriptor above, in offset order.
std::span<const FieldSpec> fieldTable();

// byte 3: [3:0]
// 0000: Extended module type
// 0001: RDIMM
// 0010: UDIMM
// 0011: SO-DIMM
// 0100: LRDIMM
// 0101: Mini-RDIMM
// 0110: Mini-UDIMM
// 1000: 72b-SO-RDIMM
// 1001: 72b-SO-UDIMM
// 1100: 16b-SO-DIMM
// 1101: 32b-SO-DIMM
// All others reserved
enum class ModuleType
{
    udimm,
    rdimm,
    soDimm,
    lrdimm,
    other,
};

ModuleType moduleType(uint8_t code);

std::string_view moduleTypeName(uint8_t code);

// JEP106 identifier: the number of 0x7F continuation codes (with odd parity in
// bit 7) and the identification code itself.
struct JedecId
{
    uint8_t continuation = 0;
    uint8_t code = 0;

    // 1 based JEP106 bank
    uint8_t bank() const
    {
        return static_cast<uint8_t>((continuation & 0x7F) + 1);
    }

    bool operator==(const JedecId&) const = default;
};

struct ManufacturingDate
{
    uint16_t year = 0;
    uint8_t week = 0;

    bool operator==(const ManufacturingDate&) const = default;
};

// Decoded density related sub-fields. Each member is nullopt when its code is
// reserved, which also makes moduleCapacityMiB() nullopt.
struct Density
{
    // SDRAM capacity per die in Mbit
    std::optional<uint32_t> dieDensityMb;
    std::optional<uint8_t> bankGroups;
    std::optional<uint8_t> banksPerGroup;
    std::optional<uint8_t> rowBits;
    std::optional<uint8_t> columnBits;
    uint8_t diePerPackage = 1;
    bool monolithic = true;
    // 10b: 3DS (single load stack)
    uint8_t signalLoading = 0;
    std::optional<uint8_t> deviceWidth;
    uint8_t packageRanks = 1;
    std::optional<uint8_t> busWidth;
    std::optional<uint8_t> eccBits;

    bool operator==(const Density&) const = default;
};

// Logical ranks per DIMM: package ranks, times die count for 3DS stacks.
uint32_t logicalRanks(const Density& density);

// Capacity = die density / 8 * bus width / device width * logical ranks
std::optional<uint64_t> moduleCapacityMiB(const Density& density);

// Timing parameters in picoseconds. nullopt when the timebase byte carries a
// reserved code.
struct Timings
{
    std::optional<int32_t> tCKmin;
    std::optional<int32_t> tCKmax;
    std::optional<int32_t> tAA;
    std::optional<int32_t> tRCD;
    std::optional<int32_t> tRP;
    std::optional<int32_t> tRAS;
    std::optional<int32_t> tRC;
    std::optional<int32_t> tRFC1;
    std::optional<int32_t> tRFC2;
    std::optional<int32_t> tRFC4;
    std::optional<int32_t> tFAW;
    std::optional<int32_t> tRRD_S;
    std::optional<int32_t> tRRD_L;
    std::optional<int32_t> tCCD_L;
    std::optional<int32_t> tWR;
    std::optional<int32_t> tWTR_S;
    std::optional<int32_t> tWTR_L;

    bool operator==(const Timings&) const = default;
};

struct TimingEntry
{
    jedec::TimingSpec spec;
    std::optional<int32_t> Timings::* member;
};

// Static description of every timing parameter, in SPD order.
std::span<const TimingEntry> timingTable();

enum class Advisory
{
    unsupportedFormat,
    checksumMismatch,
};

std::string_view advisoryName(Advisory advisory);

struct CrcState
{
    uint16_t stored = 0;
    uint16_t computed = 0;

    bool valid() const
    {
        return stored == computed;
    }
};

// Structured view of a DDR4 image. Always re-derivable from the image, edits
// are flushed back with encode().
struct Ddr4Record
{
    std::optional<uint16_t> bytesUsed;
    std::optional<uint16_t> bytesTotal;
    uint8_t spdRevision = 0;
    uint8_t deviceType = 0;
    uint8_t moduleTypeCode = 0;
    Density density;
    std::optional<jedec::Timebase> timebase;
    Timings timings;
    std::vector<uint8_t> casLatencies;
    uint8_t moduleVoltage = 0;
    JedecId manufacturerId;
    uint8_t manufacturingLocation = 0;
    std::optional<ManufacturingDate> manufacturingDate;
    std::array<uint8_t, 4> serialNumber{};
    std::string partNumber;
    uint8_t revisionCode = 0;
    JedecId dramManufacturerId;
    uint8_t dramStepping = 0;

    // computed on decode, ignored by encode
    CrcState baseCrc;
    CrcState moduleCrc;
    bool formatSupported = false;
    bool checksumValid = false;
    std::vector<Advisory> advisories;
};

// Never throws on content: a non DDR4 device type or a bad CRC is flagged on
// the record, reserved codes leave the affected members empty.
Ddr4Record decode(const RawImage& image);

// Copy-and-patch: every member that differs from decode(original) is written
// into a copy of original, bytes the record does not model are left alone.
// A CRC is recomputed when any byte it covers changed. Throws RangeError or
// EncodingError for values the fields cannot represent.
RawImage encode(const Ddr4Record& record, const RawImage& original);

// Recompute and store both CRCs unconditionally.
void refreshChecksums(RawImage& image);

// Recompute only the CRCs whose covered bytes differ from reference.
void refreshChecksums(RawImage& image, const RawImage& reference);

std::string serialNumberHex(const Ddr4Record& record);

// e.g. "CL16-18-18-36", nullopt without a valid tCKmin
std::optional<std::string> timingString(const Ddr4Record& record);

// byte 11 [0]: 1.2 V operable
bool vdd12VOperable(const Ddr4Record& record);

} // namespace spd_tools::ddr4
