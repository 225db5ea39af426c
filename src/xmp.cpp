// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#include "spd_tools/xmp.hpp"

#include "spd_tools/errors.hpp"

#include <phosphor-logging/lg2.hpp>

#include <algorithm>
#include <format>

namespace spd_tools::xmp
{

namespace
{

using jedec::TimingSpec;

// Offsets inside one 47 byte profile.
constexpr uint16_t voltageOffset = 0;
constexpr uint16_t casOffset = 4;
constexpr uint16_t crcOffset = 45;

struct ProfileFields
{
    FieldSpec voltage;
    FieldSpec casLatencies;
    FieldSpec crc;
};

constexpr ProfileFields profileFields(uint16_t base)
{
    return {byteField("voltage", base + voltageOffset),
            {"casLatencies", static_cast<uint16_t>(base + casOffset), 4,
             FieldKind::unsignedInt, Endian::little,
             jedec::casRangeBit | jedec::casBitmapMask, 0, 0},
            wordField("profileCrc", base + crcOffset)};
}

constexpr std::array<ProfileFields, profileCount> kProfileFields = {
    profileFields(profileOffsets[0]), profileFields(profileOffsets[1])};

std::array<TimingEntry, 13> makeTimingTable(uint16_t base)
{
    auto at = [base](std::string_view name, uint16_t offset) {
        return byteField(name, base + offset);
    };
    auto lowNibble = [base](std::string_view name, uint16_t offset) {
        return bitField(name, base + offset, 0x0F, 0);
    };
    auto highNibble = [base](std::string_view name, uint16_t offset) {
        return bitField(name, base + offset, 0xF0, 4);
    };
    auto fine = [base](std::string_view name, uint16_t offset) {
        return signedByteField(name, base + offset);
    };

    // +3 tCKmin, +8..+24 timings, +25..+36 untouched, +37..+44 fine offsets
    return {{
        {TimingSpec{"tCKmin", at("tCKmin", 3), std::nullopt,
                    fine("tCKminFine", 44)},
         &Timings::tCKmin},
        {TimingSpec{"tAA", at("tAA", 8), std::nullopt, fine("tAAFine", 43)},
         &Timings::tAA},
        {TimingSpec{"tRCD", at("tRCD", 9), std::nullopt,
                    fine("tRCDFine", 42)},
         &Timings::tRCD},
        {TimingSpec{"tRP", at("tRP", 10), std::nullopt, fine("tRPFine", 41)},
         &Timings::tRP},
        {TimingSpec{"tRAS", at("tRAS", 12), lowNibble("tRASUpper", 11),
                    std::nullopt},
         &Timings::tRAS},
        {TimingSpec{"tRC", at("tRC", 13), highNibble("tRCUpper", 11),
                    fine("tRCFine", 40)},
         &Timings::tRC},
        {TimingSpec{"tRFC1", at("tRFC1", 14), at("tRFC1Upper", 15),
                    std::nullopt},
         &Timings::tRFC1},
        {TimingSpec{"tRFC2", at("tRFC2", 16), at("tRFC2Upper", 17),
                    std::nullopt},
         &Timings::tRFC2},
        {TimingSpec{"tRFC4", at("tRFC4", 18), at("tRFC4Upper", 19),
                    std::nullopt},
         &Timings::tRFC4},
        {TimingSpec{"tFAW", at("tFAW", 21), lowNibble("tFAWUpper", 20),
                    std::nullopt},
         &Timings::tFAW},
        {TimingSpec{"tRRD_S", at("tRRD_S", 22), std::nullopt,
                    fine("tRRD_SFine", 39)},
         &Timings::tRRD_S},
        {TimingSpec{"tRRD_L", at("tRRD_L", 23), std::nullopt,
                    fine("tRRD_LFine", 38)},
         &Timings::tRRD_L},
        {TimingSpec{"tCCD_L", at("tCCD_L", 24), std::nullopt,
                    fine("tCCD_LFine", 37)},
         &Timings::tCCD_L},
    }};
}

const std::array<std::array<TimingEntry, 13>, profileCount> kTimingTables = {
    makeTimingTable(profileOffsets[0]), makeTimingTable(profileOffsets[1])};

bool headerPresent(std::span<const uint8_t> buffer)
{
    return readUnsigned(buffer, fields::magicFirst) == magic0 &&
           readUnsigned(buffer, fields::magicSecond) == magic1;
}

std::optional<uint16_t> voltageFromByte(uint8_t value)
{
    uint16_t hundredths = value & 0x7F;
    if (hundredths > 99)
    {
        return std::nullopt;
    }
    return static_cast<uint16_t>(((value >> 7) * 1000) + (hundredths * 10));
}

uint8_t voltageToByte(uint16_t millivolts)
{
    if (millivolts % 10 != 0 || millivolts > 1990)
    {
        throw RangeError("voltage",
                         std::format("{} mV is not representable, use 10 mV "
                                     "steps up to 1990 mV",
                                     millivolts));
    }
    uint8_t volts = millivolts >= 1000 ? 1 : 0;
    return static_cast<uint8_t>((volts << 7) | ((millivolts % 1000) / 10));
}

uint16_t computeProfileCrc(const RawImage& image, size_t profile)
{
    return jedec::calcCRC16(std::span(image).subspan(profileOffsets[profile],
                                                     profileCrcCoverage));
}

XmpProfile decodeProfile(std::span<const uint8_t> buffer, const RawImage& image,
                         size_t index)
{
    const ProfileFields& layout = kProfileFields[index];
    XmpProfile profile;
    profile.enabled = readUnsigned(buffer, fields::profileEnabled[index]) != 0;
    profile.dimmsPerChannel = static_cast<uint8_t>(
        readUnsigned(buffer, fields::dimmsPerChannel[index]) + 1);
    profile.voltageMv = voltageFromByte(
        static_cast<uint8_t>(readUnsigned(buffer, layout.voltage)));
    for (const auto& entry : kTimingTables[index])
    {
        profile.timings.*entry.member =
            jedec::decodeTiming(buffer, entry.spec, jedec::ddr4Timebase);
    }
    profile.casLatencies =
        jedec::decodeCasLatencies(readUnsigned(buffer, layout.casLatencies));
    profile.storedCrc = static_cast<uint16_t>(readUnsigned(buffer, layout.crc));
    profile.computedCrc = computeProfileCrc(image, index);
    return profile;
}

// Writes every profile member that differs from previous, or all of them when
// the profile bytes were not meaningful before.
void patchProfile(std::span<uint8_t> buffer, size_t index,
                  const XmpProfile& profile,
                  const std::optional<XmpProfile>& previous)
{
    const ProfileFields& layout = kProfileFields[index];

    if (!previous || profile.voltageMv != previous->voltageMv)
    {
        if (!profile.voltageMv)
        {
            throw RangeError("voltage", "a decoded value cannot be cleared");
        }
        writeUnsigned(buffer, layout.voltage, voltageToByte(*profile.voltageMv));
    }
    for (const auto& entry : kTimingTables[index])
    {
        int32_t value = profile.timings.*entry.member;
        if (!previous || value != previous->timings.*entry.member)
        {
            jedec::encodeTiming(buffer, entry.spec, jedec::ddr4Timebase, value);
        }
    }
    if (!previous || profile.casLatencies != previous->casLatencies)
    {
        writeUnsigned(buffer, layout.casLatencies,
                      jedec::encodeCasLatencies(layout.casLatencies.name,
                                                profile.casLatencies));
    }
    if (profile.dimmsPerChannel < 1 || profile.dimmsPerChannel > 4)
    {
        throw RangeError("dimmsPerChannel",
                         std::format("{} is outside 1..4",
                                     profile.dimmsPerChannel));
    }
    writeUnsigned(buffer, fields::dimmsPerChannel[index],
                  profile.dimmsPerChannel - 1U);
    writeUnsigned(buffer, fields::profileEnabled[index],
                  profile.enabled ? 1 : 0);
}

} // namespace

std::span<const TimingEntry> timingTable(size_t profile)
{
    if (profile >= profileCount)
    {
        throw RangeError("profile", std::format("no XMP profile {}", profile));
    }
    return kTimingTables[profile];
}

XmpBlock decode(const RawImage& image)
{
    std::span<const uint8_t> buffer(image);
    XmpBlock block;
    block.present = headerPresent(buffer);
    if (!block.present)
    {
        lg2::debug("No XMP header at {OFFSET}", "OFFSET", lg2::hex,
                   headerOffset);
        return block;
    }

    block.revision =
        static_cast<uint8_t>(readUnsigned(buffer, fields::revision));
    for (size_t i = 0; i < profileCount; i++)
    {
        block.profiles[i] = decodeProfile(buffer, image, i);
        const XmpProfile& profile = block.profiles[i];
        if (profile.enabled && !profile.checksumValid())
        {
            lg2::debug("XMP profile {PROFILE} checksum mismatch, stored "
                       "{STORED} calculated {CALCULATED}",
                       "PROFILE", i + 1, "STORED", lg2::hex, profile.storedCrc,
                       "CALCULATED", lg2::hex, profile.computedCrc);
        }
    }
    return block;
}

RawImage encode(const XmpBlock& block, const RawImage& original)
{
    const XmpBlock previous = decode(original);
    RawImage image = original;
    std::span<uint8_t> buffer(image);

    if (!block.present)
    {
        if (previous.present)
        {
            writeUnsigned(buffer, fields::magicFirst, 0);
            writeUnsigned(buffer, fields::magicSecond, 0);
        }
        return image;
    }

    if (!previous.present)
    {
        writeUnsigned(buffer, fields::magicFirst, magic0);
        writeUnsigned(buffer, fields::magicSecond, magic1);
        writeUnsigned(buffer, fields::revision,
                      block.revision != 0 ? block.revision : revision20);
    }
    else if (block.revision != previous.revision)
    {
        writeUnsigned(buffer, fields::revision, block.revision);
    }

    for (size_t i = 0; i < profileCount; i++)
    {
        std::optional<XmpProfile> before;
        if (previous.present)
        {
            before = previous.profiles[i];
        }
        const XmpProfile& profile = block.profiles[i];
        if (!previous.present && !profile.enabled)
        {
            // leave the bytes of a profile that never existed alone
            writeUnsigned(buffer, fields::profileEnabled[i], 0);
            continue;
        }
        patchProfile(buffer, i, profile, before);

        bool newlyEnabled = profile.enabled && !(before && before->enabled);
        bool changed = !std::equal(
            image.begin() + profileOffsets[i],
            image.begin() + profileOffsets[i] + profileCrcCoverage,
            original.begin() + profileOffsets[i]);
        if (newlyEnabled || changed)
        {
            writeUnsigned(buffer, kProfileFields[i].crc,
                          computeProfileCrc(image, i));
        }
    }
    return image;
}

void refreshChecksums(RawImage& image)
{
    std::span<uint8_t> buffer(image);
    if (!headerPresent(buffer))
    {
        return;
    }
    for (size_t i = 0; i < profileCount; i++)
    {
        if (readUnsigned(buffer, fields::profileEnabled[i]) != 0)
        {
            writeUnsigned(buffer, kProfileFields[i].crc,
                          computeProfileCrc(image, i));
        }
    }
}

void refreshChecksums(RawImage& image, const RawImage& reference)
{
    std::span<uint8_t> buffer(image);
    if (!headerPresent(buffer))
    {
        return;
    }
    for (size_t i = 0; i < profileCount; i++)
    {
        bool changed = !std::equal(
            image.begin() + profileOffsets[i],
            image.begin() + profileOffsets[i] + profileCrcCoverage,
            reference.begin() + profileOffsets[i]);
        if (changed && readUnsigned(buffer, fields::profileEnabled[i]) != 0)
        {
            writeUnsigned(buffer, kProfileFields[i].crc,
                          computeProfileCrc(image, i));
        }
    }
}

std::vector<std::pair<std::string_view, int32_t>>
    namedTimings(const XmpProfile& profile)
{
    std::vector<std::pair<std::string_view, int32_t>> result;
    for (const auto& entry : kTimingTables[0])
    {
        result.emplace_back(entry.spec.name, profile.timings.*entry.member);
    }
    return result;
}

void setDataRate(XmpProfile& profile, uint32_t mts)
{
    profile.timings.tCKmin = jedec::tckForDataRate(mts);
}

double dataRateMts(const XmpProfile& profile)
{
    return jedec::dataRateMts(profile.timings.tCKmin);
}

} // namespace spd_tools::xmp
