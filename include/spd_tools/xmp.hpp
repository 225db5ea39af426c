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
#include <string_view>
#include <utility>
#include <vector>

// Intel Extreme Memory Profile 2.0 block in the end user area of a DDR4 SPD.
namespace spd_tools::xmp
{

constexpr uint16_t headerOffset = 0x180;
constexpr uint8_t magic0 = 0x0C;
constexpr uint8_t magic1 = 0x4A;
// major nibble high, minor nibble low
constexpr uint8_t revision20 = 0x20;

constexpr size_t profileCount = 2;
constexpr size_t profileSize = 47;
constexpr std::array<uint16_t, profileCount> profileOffsets = {0x189, 0x1B8};
// profile bytes +0..+44 are covered by the CRC stored at +45/+46
constexpr size_t profileCrcCoverage = 45;

namespace fields
{
constexpr FieldSpec magicFirst = byteField("xmpMagic", headerOffset);
constexpr FieldSpec magicSecond = byteField("xmpMagic", headerOffset + 1);
// 0x182: [0] profile 1 enabled, [1] profile 2 enabled
constexpr std::array<FieldSpec, profileCount> profileEnabled = {
    bitField("profile1Enabled", headerOffset + 2, 0x01, 0),
    bitField("profile2Enabled", headerOffset + 2, 0x02, 1),
};
// 0x182: [3:2] / [5:4] DIMMs per channel - 1
constexpr std::array<FieldSpec, profileCount> dimmsPerChannel = {
    bitField("profile1DimmsPerChannel", headerOffset + 2, 0x0C, 2),
    bitField("profile2DimmsPerChannel", headerOffset + 2, 0x30, 4),
};
constexpr FieldSpec revision = byteField("xmpRevision", headerOffset + 3);
} // namespace fields

struct Timings
{
    int32_t tCKmin = 0;
    int32_t tAA = 0;
    int32_t tRCD = 0;
    int32_t tRP = 0;
    int32_t tRAS = 0;
    int32_t tRC = 0;
    int32_t tRFC1 = 0;
    int32_t tRFC2 = 0;
    int32_t tRFC4 = 0;
    int32_t tFAW = 0;
    int32_t tRRD_S = 0;
    int32_t tRRD_L = 0;
    int32_t tCCD_L = 0;

    bool operator==(const Timings&) const = default;
};

struct TimingEntry
{
    jedec::TimingSpec spec;
    int32_t Timings::* member;
};

// Timing descriptors for profile 0 or 1, in profile byte order.
std::span<const TimingEntry> timingTable(size_t profile);

struct XmpProfile
{
    bool enabled = false;
    uint8_t dimmsPerChannel = 1;
    // +0: [7] 1 V, [6:0] hundredths of a volt; nullopt when the hundredths
    // are not a decimal fraction
    std::optional<uint16_t> voltageMv;
    Timings timings;
    std::vector<uint8_t> casLatencies;

    // computed on decode, ignored by encode
    uint16_t storedCrc = 0;
    uint16_t computedCrc = 0;

    bool checksumValid() const
    {
        return storedCrc == computedCrc;
    }
};

struct XmpBlock
{
    bool present = false;
    uint8_t revision = 0;
    std::array<XmpProfile, profileCount> profiles;
};

// A missing magic is not an error, the block is returned with present unset
// and default profiles.
XmpBlock decode(const RawImage& image);

// Copy-and-patch like ddr4::encode(). A present block written into an image
// without XMP gets the magic and revision 2.0 first. A block marked not
// present clears the magic, the profile bytes are kept. Each profile CRC is
// recomputed when the profile changed.
RawImage encode(const XmpBlock& block, const RawImage& original);

// Recompute the CRC of every enabled profile. Does nothing without the XMP
// header.
void refreshChecksums(RawImage& image);

// Same, limited to enabled profiles whose bytes differ from reference.
void refreshChecksums(RawImage& image, const RawImage& reference);

// Ordered (name, picoseconds) list of a profile's timings.
std::vector<std::pair<std::string_view, int32_t>>
    namedTimings(const XmpProfile& profile);

// Program tCKmin for a data rate in MT/s.
void setDataRate(XmpProfile& profile, uint32_t mts);

double dataRateMts(const XmpProfile& profile);

} // namespace spd_tools::xmp
