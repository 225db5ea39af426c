// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#include "spd_tools/ddr4.hpp"

#include "spd_tools/errors.hpp"

#include <phosphor-logging/lg2.hpp>

#include <algorithm>
#include <format>

namespace spd_tools::ddr4
{

namespace
{

using namespace fields;

constexpr std::array<FieldSpec, 34> kFieldTable = {
    bytesUsed,
    bytesTotal,
    spdRevision,
    deviceType,
    moduleTypeCode,
    dieDensity,
    bankAddressBits,
    bankGroupBits,
    columnAddressBits,
    rowAddressBits,
    signalLoading,
    dieCount,
    packageType,
    moduleVoltage,
    deviceWidth,
    packageRanks,
    busWidth,
    busWidthExtension,
    fineTimebase,
    mediumTimebase,
    casLatencies,
    baseCrc,
    moduleCrc,
    manufacturerIdContinuation,
    manufacturerIdCode,
    manufacturingLocation,
    manufacturingYear,
    manufacturingWeek,
    serialNumber,
    partNumber,
    revisionCode,
    dramManufacturerIdContinuation,
    dramManufacturerIdCode,
    dramStepping,
};

constexpr FieldSpec upperNibble(std::string_view name, uint16_t offset)
{
    return bitField(name, offset, 0x0F, 0);
}

constexpr FieldSpec highNibble(std::string_view name, uint16_t offset)
{
    return bitField(name, offset, 0xF0, 4);
}

using jedec::TimingSpec;

// 18~45 medium timebase values, 117~125 fine offsets.
const std::array<TimingEntry, 17> kTimingTable = {{
    {TimingSpec{"tCKmin", byteField("tCKmin", 18), std::nullopt,
                signedByteField("tCKminFine", 125)},
     &Timings::tCKmin},
    {TimingSpec{"tCKmax", byteField("tCKmax", 19), std::nullopt,
                signedByteField("tCKmaxFine", 124)},
     &Timings::tCKmax},
    {TimingSpec{"tAA", byteField("tAA", 24), std::nullopt,
                signedByteField("tAAFine", 123)},
     &Timings::tAA},
    {TimingSpec{"tRCD", byteField("tRCD", 25), std::nullopt,
                signedByteField("tRCDFine", 122)},
     &Timings::tRCD},
    {TimingSpec{"tRP", byteField("tRP", 26), std::nullopt,
                signedByteField("tRPFine", 121)},
     &Timings::tRP},
    {TimingSpec{"tRAS", byteField("tRAS", 28), upperNibble("tRASUpper", 27),
                std::nullopt},
     &Timings::tRAS},
    {TimingSpec{"tRC", byteField("tRC", 29), highNibble("tRCUpper", 27),
                signedByteField("tRCFine", 120)},
     &Timings::tRC},
    {TimingSpec{"tRFC1", byteField("tRFC1", 30), byteField("tRFC1Upper", 31),
                std::nullopt},
     &Timings::tRFC1},
    {TimingSpec{"tRFC2", byteField("tRFC2", 32), byteField("tRFC2Upper", 33),
                std::nullopt},
     &Timings::tRFC2},
    {TimingSpec{"tRFC4", byteField("tRFC4", 34), byteField("tRFC4Upper", 35),
                std::nullopt},
     &Timings::tRFC4},
    {TimingSpec{"tFAW", byteField("tFAW", 37), upperNibble("tFAWUpper", 36),
                std::nullopt},
     &Timings::tFAW},
    {TimingSpec{"tRRD_S", byteField("tRRD_S", 38), std::nullopt,
                signedByteField("tRRD_SFine", 119)},
     &Timings::tRRD_S},
    {TimingSpec{"tRRD_L", byteField("tRRD_L", 39), std::nullopt,
                signedByteField("tRRD_LFine", 118)},
     &Timings::tRRD_L},
    {TimingSpec{"tCCD_L", byteField("tCCD_L", 40), std::nullopt,
                signedByteField("tCCD_LFine", 117)},
     &Timings::tCCD_L},
    {TimingSpec{"tWR", byteField("tWR", 42), upperNibble("tWRUpper", 41),
                std::nullopt},
     &Timings::tWR},
    {TimingSpec{"tWTR_S", byteField("tWTR_S", 44),
                upperNibble("tWTR_SUpper", 43), std::nullopt},
     &Timings::tWTR_S},
    {TimingSpec{"tWTR_L", byteField("tWTR_L", 45),
                highNibble("tWTR_LUpper", 43), std::nullopt},
     &Timings::tWTR_L},
}};

std::optional<uint16_t> bytesUsedFromCode(uint8_t code)
{
    // byte 0: [3:0]
    // 0000: Undefined
    // 0001: 128
    // 0010: 256
    // 0011: 384
    // 0100: 512
    // All others reserved
    if (code >= 0x01 && code <= 0x04)
    {
        return static_cast<uint16_t>(code * 128);
    }
    return std::nullopt;
}

std::optional<uint16_t> bytesTotalFromCode(uint8_t code)
{
    // byte 0: [6:4]
    // 000: Undefined
    // 001: 256
    // 010: 512
    // All others reserved
    switch (code)
    {
        case 0x01:
            return 256;
        case 0x02:
            return 512;
        default:
            return std::nullopt;
    }
}

std::optional<uint32_t> dieDensityFromCode(uint8_t code)
{
    // byte 4: [3:0]
    // 0000: 256 Mb
    // 0001: 512 Mb
    // 0010: 1 Gb
    // 0011: 2 Gb
    // 0100: 4 Gb
    // 0101: 8 Gb
    // 0110: 16 Gb
    // 0111: 32 Gb
    // 1000: 12 Gb
    // 1001: 24 Gb
    // All others reserved
    if (code <= 0x07)
    {
        return 256U << code;
    }
    switch (code)
    {
        case 0x08:
            return 12288;
        case 0x09:
            return 24576;
        default:
            return std::nullopt;
    }
}

std::optional<uint8_t> banksPerGroupFromCode(uint8_t code)
{
    // byte 4: [5:4]
    // 00: 4 banks
    // 01: 8 banks
    // All others reserved
    switch (code)
    {
        case 0x00:
            return 4;
        case 0x01:
            return 8;
        default:
            return std::nullopt;
    }
}

std::optional<uint8_t> bankGroupsFromCode(uint8_t code)
{
    // byte 4: [7:6]
    // 00: no bank groups
    // 01: 2 bank groups
    // 10: 4 bank groups
    // 11: reserved
    switch (code)
    {
        case 0x00:
            return 1;
        case 0x01:
            return 2;
        case 0x02:
            return 4;
        default:
            return std::nullopt;
    }
}

std::optional<uint8_t> columnBitsFromCode(uint8_t code)
{
    // byte 5: [2:0] 000 = 9 ... 011 = 12, all others reserved
    if (code <= 0x03)
    {
        return static_cast<uint8_t>(9 + code);
    }
    return std::nullopt;
}

std::optional<uint8_t> rowBitsFromCode(uint8_t code)
{
    // byte 5: [5:3] 000 = 12 ... 110 = 18, 111 reserved
    if (code <= 0x06)
    {
        return static_cast<uint8_t>(12 + code);
    }
    return std::nullopt;
}

std::optional<uint8_t> deviceWidthFromCode(uint8_t code)
{
    // byte 12: [2:0]
    // 000: 4 bits
    // 001: 8 bits
    // 010: 16 bits
    // 011: 32 bits
    // All others reserved
    if (code <= 0x03)
    {
        return static_cast<uint8_t>(4 << code);
    }
    return std::nullopt;
}

std::optional<uint8_t> busWidthFromCode(uint8_t code)
{
    // byte 13: [2:0]
    // 000: 8 bits
    // 001: 16 bits
    // 010: 32 bits
    // 011: 64 bits
    // All others reserved
    if (code <= 0x03)
    {
        return static_cast<uint8_t>(8 << code);
    }
    return std::nullopt;
}

std::optional<uint8_t> eccBitsFromCode(uint8_t code)
{
    // byte 13: [4:3]
    // 00: 0 bits (no extension)
    // 01: 8 bits
    // All others reserved
    switch (code)
    {
        case 0x00:
            return 0;
        case 0x01:
            return 8;
        default:
            return std::nullopt;
    }
}

std::optional<uint8_t> countFromCode(uint8_t code)
{
    return static_cast<uint8_t>(code + 1);
}

std::optional<jedec::Timebase> timebaseOf(std::span<const uint8_t> buffer)
{
    auto medium = jedec::mediumTimebasePs(
        static_cast<uint8_t>(readUnsigned(buffer, mediumTimebase)));
    auto fine = jedec::fineTimebasePs(
        static_cast<uint8_t>(readUnsigned(buffer, fineTimebase)));
    if (!medium || !fine)
    {
        return std::nullopt;
    }
    return jedec::Timebase{*medium, *fine};
}

std::optional<ManufacturingDate> dateOf(std::span<const uint8_t> buffer)
{
    auto year = jedec::bcdToInt(
        static_cast<uint8_t>(readUnsigned(buffer, manufacturingYear)));
    auto week = jedec::bcdToInt(
        static_cast<uint8_t>(readUnsigned(buffer, manufacturingWeek)));
    if (!year || !week)
    {
        return std::nullopt;
    }
    return ManufacturingDate{static_cast<uint16_t>(2000 + *year), *week};
}

JedecId jedecIdOf(std::span<const uint8_t> buffer, const FieldSpec& bank,
                  const FieldSpec& code)
{
    return {static_cast<uint8_t>(readUnsigned(buffer, bank)),
            static_cast<uint8_t>(readUnsigned(buffer, code))};
}

// Finds the code of a reserved-aware enumeration by trying every value the
// field can hold.
template <typename T, typename Decoder>
void patchCoded(std::span<uint8_t> buffer, const FieldSpec& spec,
                const std::optional<T>& value, const std::optional<T>& previous,
                Decoder decoder)
{
    if (value == previous)
    {
        return;
    }
    if (!value)
    {
        throw RangeError(std::string(spec.name),
                         "a decoded value cannot be cleared");
    }
    for (uint32_t code = 0; code <= spec.maxValue(); code++)
    {
        if (decoder(static_cast<uint8_t>(code)) == value)
        {
            writeUnsigned(buffer, spec, code);
            return;
        }
    }
    throw RangeError(std::string(spec.name),
                     std::format("{} has no encoding", *value));
}

void patchByte(std::span<uint8_t> buffer, const FieldSpec& spec, uint8_t value,
               uint8_t previous)
{
    if (value != previous)
    {
        writeUnsigned(buffer, spec, value);
    }
}

void patchJedecId(std::span<uint8_t> buffer, const FieldSpec& bank,
                  const FieldSpec& code, const JedecId& value,
                  const JedecId& previous)
{
    patchByte(buffer, bank, value.continuation, previous.continuation);
    patchByte(buffer, code, value.code, previous.code);
}

void patchDensity(std::span<uint8_t> buffer, const Density& value,
                  const Density& previous)
{
    patchCoded(buffer, dieDensity, value.dieDensityMb, previous.dieDensityMb,
               dieDensityFromCode);
    patchCoded(buffer, bankGroupBits, value.bankGroups, previous.bankGroups,
               bankGroupsFromCode);
    patchCoded(buffer, bankAddressBits, value.banksPerGroup,
               previous.banksPerGroup, banksPerGroupFromCode);
    patchCoded(buffer, rowAddressBits, value.rowBits, previous.rowBits,
               rowBitsFromCode);
    patchCoded(buffer, columnAddressBits, value.columnBits,
               previous.columnBits, columnBitsFromCode);
    patchCoded(buffer, dieCount, std::optional(value.diePerPackage),
               std::optional(previous.diePerPackage), countFromCode);
    if (value.monolithic != previous.monolithic)
    {
        writeUnsigned(buffer, packageType, value.monolithic ? 0 : 1);
    }
    patchByte(buffer, signalLoading, value.signalLoading,
              previous.signalLoading);
    patchCoded(buffer, deviceWidth, value.deviceWidth, previous.deviceWidth,
               deviceWidthFromCode);
    patchCoded(buffer, packageRanks, std::optional(value.packageRanks),
               std::optional(previous.packageRanks), countFromCode);
    patchCoded(buffer, busWidth, value.busWidth, previous.busWidth,
               busWidthFromCode);
    patchCoded(buffer, busWidthExtension, value.eccBits, previous.eccBits,
               eccBitsFromCode);
}

void patchTimings(std::span<uint8_t> buffer, const Ddr4Record& record,
                  const Ddr4Record& previous)
{
    bool timebaseChanged = record.timebase != previous.timebase;
    if (timebaseChanged)
    {
        if (!record.timebase)
        {
            throw RangeError("timebase", "a decoded value cannot be cleared");
        }
        auto mediumCode = jedec::mediumTimebaseCode(record.timebase->mediumPs);
        if (!mediumCode || record.timebase->finePs != 1)
        {
            throw RangeError("timebase",
                             std::format("no encoding for MTB {} ps / FTB {} "
                                         "ps",
                                         record.timebase->mediumPs,
                                         record.timebase->finePs));
        }
        writeUnsigned(buffer, mediumTimebase, *mediumCode);
        writeUnsigned(buffer, fineTimebase, 0);
    }

    for (const auto& entry : kTimingTable)
    {
        const auto& value = record.timings.*entry.member;
        const auto& before = previous.timings.*entry.member;
        if (!timebaseChanged && value == before)
        {
            continue;
        }
        if (!value)
        {
            if (!before)
            {
                continue;
            }
            throw RangeError(std::string(entry.spec.name),
                             "a decoded value cannot be cleared");
        }
        if (!record.timebase)
        {
            throw RangeError(std::string(entry.spec.name),
                             "timebase byte holds a reserved code");
        }
        jedec::encodeTiming(buffer, entry.spec, *record.timebase, *value);
    }
}

void patchDate(std::span<uint8_t> buffer,
               const std::optional<ManufacturingDate>& value,
               const std::optional<ManufacturingDate>& previous)
{
    if (value == previous)
    {
        return;
    }
    if (!value)
    {
        throw RangeError("manufacturingDate",
                         "a decoded value cannot be cleared");
    }
    if (value->year < 2000 || value->year > 2099)
    {
        throw RangeError("manufacturingDate",
                         std::format("year {} is outside 2000..2099",
                                     value->year));
    }
    if (value->week > 53)
    {
        throw RangeError("manufacturingDate",
                         std::format("week {} is outside 0..53", value->week));
    }
    writeUnsigned(buffer, manufacturingYear,
                  jedec::intToBcd(static_cast<uint8_t>(value->year - 2000)));
    writeUnsigned(buffer, manufacturingWeek, jedec::intToBcd(value->week));
}

bool rangeChanged(const RawImage& a, const RawImage& b, size_t start,
                  size_t length)
{
    return !std::equal(a.begin() + start, a.begin() + start + length,
                       b.begin() + start);
}

uint16_t computeBaseCrc(const RawImage& image)
{
    return jedec::calcCRC16(std::span(image).first(baseCrcCoverage));
}

uint16_t computeModuleCrc(const RawImage& image)
{
    return jedec::calcCRC16(
        std::span(image).subspan(moduleCrcStart, moduleCrcCoverage));
}

} // namespace

std::span<const FieldSpec> fieldTable()
{
    return kFieldTable;
}

std::span<const TimingEntry> timingTable()
{
    return kTimingTable;
}

ModuleType moduleType(uint8_t code)
{
    switch (code & 0x0F)
    {
        case 0x01:
        case 0x05:
        case 0x08:
            return ModuleType::rdimm;
        case 0x02:
        case 0x06:
            return ModuleType::udimm;
        case 0x03:
        case 0x09:
        case 0x0C:
        case 0x0D:
            return ModuleType::soDimm;
        case 0x04:
            return ModuleType::lrdimm;
        default:
            return ModuleType::other;
    }
}

std::string_view moduleTypeName(uint8_t code)
{
    switch (code & 0x0F)
    {
        case 0x00:
            return "Extended";
        case 0x01:
            return "RDIMM";
        case 0x02:
            return "UDIMM";
        case 0x03:
            return "SO-DIMM";
        case 0x04:
            return "LRDIMM";
        case 0x05:
            return "Mini-RDIMM";
        case 0x06:
            return "Mini-UDIMM";
        case 0x08:
            return "72b-SO-RDIMM";
        case 0x09:
            return "72b-SO-UDIMM";
        case 0x0C:
            return "16b-SO-DIMM";
        case 0x0D:
            return "32b-SO-DIMM";
        default:
            return "Reserved";
    }
}

uint32_t logicalRanks(const Density& density)
{
    // byte 6 [1:0] 10b: single load stack (3DS), every die is its own rank
    if (density.signalLoading == 0x02)
    {
        return uint32_t{density.packageRanks} * density.diePerPackage;
    }
    return density.packageRanks;
}

std::optional<uint64_t> moduleCapacityMiB(const Density& density)
{
    if (!density.dieDensityMb || !density.busWidth || !density.deviceWidth)
    {
        return std::nullopt;
    }
    uint64_t dieMiB = *density.dieDensityMb / 8;
    return dieMiB * *density.busWidth / *density.deviceWidth *
           logicalRanks(density);
}

std::string_view advisoryName(Advisory advisory)
{
    switch (advisory)
    {
        case Advisory::unsupportedFormat:
            return "UnsupportedFormat";
        case Advisory::checksumMismatch:
            return "ChecksumMismatch";
    }
    return "Unknown";
}

Ddr4Record decode(const RawImage& image)
{
    std::span<const uint8_t> buffer(image);
    auto code = [&buffer](const FieldSpec& spec) {
        return static_cast<uint8_t>(readUnsigned(buffer, spec));
    };

    Ddr4Record record;
    record.bytesUsed = bytesUsedFromCode(code(bytesUsed));
    record.bytesTotal = bytesTotalFromCode(code(bytesTotal));
    record.spdRevision = code(spdRevision);
    record.deviceType = code(deviceType);
    record.moduleTypeCode = code(fields::moduleTypeCode);

    record.formatSupported = record.deviceType == deviceTypeDDR4;
    if (!record.formatSupported)
    {
        lg2::debug("SPD device type {TYPE} is not DDR4, decoding anyway",
                   "TYPE", lg2::hex, record.deviceType);
        record.advisories.push_back(Advisory::unsupportedFormat);
    }

    Density& density = record.density;
    density.dieDensityMb = dieDensityFromCode(code(dieDensity));
    density.bankGroups = bankGroupsFromCode(code(bankGroupBits));
    density.banksPerGroup = banksPerGroupFromCode(code(bankAddressBits));
    density.rowBits = rowBitsFromCode(code(rowAddressBits));
    density.columnBits = columnBitsFromCode(code(columnAddressBits));
    density.diePerPackage = static_cast<uint8_t>(code(dieCount) + 1);
    density.monolithic = code(packageType) == 0;
    density.signalLoading = code(signalLoading);
    density.deviceWidth = deviceWidthFromCode(code(deviceWidth));
    density.packageRanks = static_cast<uint8_t>(code(packageRanks) + 1);
    density.busWidth = busWidthFromCode(code(busWidth));
    density.eccBits = eccBitsFromCode(code(busWidthExtension));
    if (!moduleCapacityMiB(density))
    {
        lg2::debug("SPD density fields hold reserved codes, capacity unknown");
    }

    record.timebase = timebaseOf(buffer);
    if (record.timebase)
    {
        for (const auto& entry : kTimingTable)
        {
            record.timings.*entry.member =
                jedec::decodeTiming(buffer, entry.spec, *record.timebase);
        }
    }
    else
    {
        lg2::debug("SPD timebase byte {VALUE} holds a reserved code", "VALUE",
                   lg2::hex, image[0x011]);
    }

    record.casLatencies =
        jedec::decodeCasLatencies(readUnsigned(buffer, casLatencies));
    record.moduleVoltage = code(moduleVoltage);

    record.manufacturerId = jedecIdOf(buffer, manufacturerIdContinuation,
                                      manufacturerIdCode);
    record.manufacturingLocation = code(manufacturingLocation);
    record.manufacturingDate = dateOf(buffer);
    std::ranges::copy(readBytes(buffer, serialNumber),
                      record.serialNumber.begin());
    record.partNumber = readText(buffer, partNumber);
    record.revisionCode = code(revisionCode);
    record.dramManufacturerId = jedecIdOf(
        buffer, dramManufacturerIdContinuation, dramManufacturerIdCode);
    record.dramStepping = code(dramStepping);

    record.baseCrc.stored = static_cast<uint16_t>(readUnsigned(buffer, baseCrc));
    record.baseCrc.computed = computeBaseCrc(image);
    record.moduleCrc.stored =
        static_cast<uint16_t>(readUnsigned(buffer, moduleCrc));
    record.moduleCrc.computed = computeModuleCrc(image);
    record.checksumValid = record.baseCrc.valid();
    if (!record.checksumValid)
    {
        lg2::debug(
            "SPD base checksum mismatch, stored {STORED} calculated {CALCULATED}",
            "STORED", lg2::hex, record.baseCrc.stored, "CALCULATED", lg2::hex,
            record.baseCrc.computed);
        record.advisories.push_back(Advisory::checksumMismatch);
    }
    if (!record.moduleCrc.valid())
    {
        lg2::debug("SPD module block checksum mismatch, stored {STORED} "
                   "calculated {CALCULATED}",
                   "STORED", lg2::hex, record.moduleCrc.stored, "CALCULATED",
                   lg2::hex, record.moduleCrc.computed);
    }
    return record;
}

RawImage encode(const Ddr4Record& record, const RawImage& original)
{
    const Ddr4Record previous = decode(original);
    RawImage image = original;
    std::span<uint8_t> buffer(image);

    patchCoded(buffer, bytesUsed, record.bytesUsed, previous.bytesUsed,
               bytesUsedFromCode);
    patchCoded(buffer, bytesTotal, record.bytesTotal, previous.bytesTotal,
               bytesTotalFromCode);
    patchByte(buffer, spdRevision, record.spdRevision, previous.spdRevision);
    patchByte(buffer, deviceType, record.deviceType, previous.deviceType);
    patchByte(buffer, fields::moduleTypeCode, record.moduleTypeCode,
              previous.moduleTypeCode);
    patchDensity(buffer, record.density, previous.density);
    patchTimings(buffer, record, previous);
    if (record.casLatencies != previous.casLatencies)
    {
        writeUnsigned(buffer, casLatencies,
                      jedec::encodeCasLatencies(casLatencies.name,
                                                record.casLatencies));
    }
    patchByte(buffer, moduleVoltage, record.moduleVoltage,
              previous.moduleVoltage);

    patchJedecId(buffer, manufacturerIdContinuation, manufacturerIdCode,
                 record.manufacturerId, previous.manufacturerId);
    patchByte(buffer, manufacturingLocation, record.manufacturingLocation,
              previous.manufacturingLocation);
    patchDate(buffer, record.manufacturingDate, previous.manufacturingDate);
    if (record.serialNumber != previous.serialNumber)
    {
        writeBytes(buffer, serialNumber, record.serialNumber);
    }
    if (record.partNumber != previous.partNumber)
    {
        writeText(buffer, partNumber, record.partNumber);
    }
    patchByte(buffer, revisionCode, record.revisionCode, previous.revisionCode);
    patchJedecId(buffer, dramManufacturerIdContinuation,
                 dramManufacturerIdCode, record.dramManufacturerId,
                 previous.dramManufacturerId);
    patchByte(buffer, dramStepping, record.dramStepping, previous.dramStepping);

    refreshChecksums(image, original);
    return image;
}

void refreshChecksums(RawImage& image)
{
    std::span<uint8_t> buffer(image);
    writeUnsigned(buffer, baseCrc, computeBaseCrc(image));
    writeUnsigned(buffer, moduleCrc, computeModuleCrc(image));
}

void refreshChecksums(RawImage& image, const RawImage& reference)
{
    std::span<uint8_t> buffer(image);
    if (rangeChanged(image, reference, 0, baseCrcCoverage))
    {
        writeUnsigned(buffer, baseCrc, computeBaseCrc(image));
    }
    if (rangeChanged(image, reference, moduleCrcStart, moduleCrcCoverage))
    {
        writeUnsigned(buffer, moduleCrc, computeModuleCrc(image));
    }
}

std::string serialNumberHex(const Ddr4Record& record)
{
    std::string result;
    for (uint8_t byte : record.serialNumber)
    {
        result += std::format("{:02X}", byte);
    }
    return result;
}

std::optional<std::string> timingString(const Ddr4Record& record)
{
    const Timings& t = record.timings;
    if (!t.tCKmin || !t.tAA || !t.tRCD || !t.tRP || !t.tRAS || *t.tCKmin <= 0)
    {
        return std::nullopt;
    }
    return std::format("CL{}-{}-{}-{}", jedec::clocksFor(*t.tAA, *t.tCKmin),
                       jedec::clocksFor(*t.tRCD, *t.tCKmin),
                       jedec::clocksFor(*t.tRP, *t.tCKmin),
                       jedec::clocksFor(*t.tRAS, *t.tCKmin));
}

bool vdd12VOperable(const Ddr4Record& record)
{
    return (record.moduleVoltage & 0x01) != 0;
}

} // namespace spd_tools::ddr4
