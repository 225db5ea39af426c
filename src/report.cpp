// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#include "spd_tools/report.hpp"

#include "spd_tools/jedec.hpp"
#include "spd_tools/utils.hpp"

#include <format>
#include <iterator>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace spd_tools
{

namespace
{

template <typename T>
nlohmann::json orNull(const std::optional<T>& value)
{
    if (!value)
    {
        return nullptr;
    }
    return *value;
}

std::string hexWord(uint16_t value)
{
    return std::format("0x{:04X}", value);
}

std::optional<std::string> capacityText(const ddr4::Density& density)
{
    auto mib = ddr4::moduleCapacityMiB(density);
    if (!mib)
    {
        return std::nullopt;
    }
    if (*mib >= 1024 && *mib % 1024 == 0)
    {
        return std::format("{} GB", *mib / 1024);
    }
    return std::format("{} MB", *mib);
}

std::string dateText(const std::optional<ddr4::ManufacturingDate>& date)
{
    if (!date)
    {
        return "Unknown";
    }
    return std::format("{} week {}", date->year, date->week);
}

nlohmann::json crcToJson(const ddr4::CrcState& crc)
{
    nlohmann::json::object_t res;
    res["Stored"] = hexWord(crc.stored);
    res["Computed"] = hexWord(crc.computed);
    res["Valid"] = crc.valid();
    return res;
}

nlohmann::json densityToJson(const ddr4::Density& density)
{
    nlohmann::json::object_t res;
    res["DieDensityMb"] = orNull(density.dieDensityMb);
    res["BankGroups"] = orNull(density.bankGroups);
    res["BanksPerGroup"] = orNull(density.banksPerGroup);
    res["RowBits"] = orNull(density.rowBits);
    res["ColumnBits"] = orNull(density.columnBits);
    res["DiePerPackage"] = density.diePerPackage;
    res["Monolithic"] = density.monolithic;
    res["PackageRanks"] = density.packageRanks;
    res["LogicalRanks"] = ddr4::logicalRanks(density);
    res["DeviceWidth"] = orNull(density.deviceWidth);
    res["BusWidth"] = orNull(density.busWidth);
    res["EccBits"] = orNull(density.eccBits);
    res["CapacityMiB"] = orNull(ddr4::moduleCapacityMiB(density));
    return res;
}

nlohmann::json profileToJson(const xmp::XmpProfile& profile)
{
    nlohmann::json::object_t res;
    res["Enabled"] = profile.enabled;
    res["DimmsPerChannel"] = profile.dimmsPerChannel;
    res["VoltageMv"] = orNull(profile.voltageMv);
    if (profile.timings.tCKmin > 0)
    {
        res["DataRateMTs"] = xmp::dataRateMts(profile);
    }
    nlohmann::json::object_t timings;
    for (const auto& [name, ps] : xmp::namedTimings(profile))
    {
        timings[std::string(name)] = ps;
    }
    res["TimingsPs"] = std::move(timings);
    res["CasLatencies"] = profile.casLatencies;
    res["Crc"] = crcToJson({profile.storedCrc, profile.computedCrc});
    return res;
}

std::string latencyList(const std::vector<uint8_t>& latencies)
{
    if (latencies.empty())
    {
        return "None";
    }
    std::string list;
    for (uint8_t cl : latencies)
    {
        if (!list.empty())
        {
            list += ' ';
        }
        list += std::to_string(cl);
    }
    return list;
}

void appendLine(std::string& out, std::string_view label,
                std::string_view value)
{
    std::format_to(std::back_inserter(out), "{:<24}{}\n", label, value);
}

void appendHeading(std::string& out, std::string_view title)
{
    std::format_to(std::back_inserter(out), "\n{}\n{}\n", title,
                   std::string(title.size(), '-'));
}

} // namespace

nlohmann::json recordToJson(const ddr4::Ddr4Record& record,
                            const ManufacturerLookup& lookup)
{
    nlohmann::json::object_t res;
    res["BytesUsed"] = orNull(record.bytesUsed);
    res["BytesTotal"] = orNull(record.bytesTotal);
    res["SpdRevision"] = std::format("{}.{}", record.spdRevision >> 4,
                                     record.spdRevision & 0x0F);
    res["DeviceType"] = std::format("0x{:02X}", record.deviceType);
    res["ModuleType"] =
        std::string(ddr4::moduleTypeName(record.moduleTypeCode));
    res["Density"] = densityToJson(record.density);
    res["Capacity"] = orNull(capacityText(record.density));

    if (record.timebase)
    {
        res["MediumTimebasePs"] = record.timebase->mediumPs;
        res["FineTimebasePs"] = record.timebase->finePs;
    }
    nlohmann::json::object_t timings;
    for (const auto& entry : ddr4::timingTable())
    {
        timings[std::string(entry.spec.name)] =
            orNull(record.timings.*entry.member);
    }
    res["TimingsPs"] = std::move(timings);
    res["CasLatencies"] = record.casLatencies;
    if (record.timings.tCKmin && *record.timings.tCKmin > 0)
    {
        int32_t tck = *record.timings.tCKmin;
        res["ClockMHz"] = jedec::clockMhz(tck);
        res["DataRateMTs"] = jedec::dataRateMts(tck);
        res["SpeedGrade"] = orNull(jedec::speedGrade(tck));
    }
    res["TimingString"] = orNull(ddr4::timingString(record));
    res["Vdd12VOperable"] = ddr4::vdd12VOperable(record);

    res["ManufacturerId"] = std::format("0x{:02X}{:02X}",
                                        record.manufacturerId.continuation,
                                        record.manufacturerId.code);
    res["Manufacturer"] = manufacturerName(lookup, record.manufacturerId);
    res["ManufacturingLocation"] = record.manufacturingLocation;
    if (record.manufacturingDate)
    {
        res["ManufacturingYear"] = record.manufacturingDate->year;
        res["ManufacturingWeek"] = record.manufacturingDate->week;
    }
    res["SerialNumber"] = ddr4::serialNumberHex(record);
    res["PartNumber"] = record.partNumber;
    res["RevisionCode"] = std::format("0x{:02X}", record.revisionCode);
    res["DramManufacturer"] =
        manufacturerName(lookup, record.dramManufacturerId);
    res["DramStepping"] = std::format("0x{:02X}", record.dramStepping);

    res["BaseCrc"] = crcToJson(record.baseCrc);
    res["ModuleCrc"] = crcToJson(record.moduleCrc);
    res["FormatSupported"] = record.formatSupported;
    res["ChecksumValid"] = record.checksumValid;
    return res;
}

nlohmann::json xmpToJson(const xmp::XmpBlock& block)
{
    nlohmann::json::object_t res;
    res["Present"] = block.present;
    if (!block.present)
    {
        return res;
    }
    res["Revision"] =
        std::format("{}.{}", block.revision >> 4, block.revision & 0x0F);
    nlohmann::json::array_t profiles;
    for (const auto& profile : block.profiles)
    {
        profiles.emplace_back(profileToJson(profile));
    }
    res["Profiles"] = std::move(profiles);
    return res;
}

nlohmann::json documentReport(const SpdDocument& document,
                              const ManufacturerLookup& lookup)
{
    ddr4::Ddr4Record record = document.record();

    nlohmann::json::object_t res;
    res["Source"] = document.source().empty() ? "unknown" : document.source();
    res["RawData"] = toHex(document.image(), " ");
    res["Decoded"] = recordToJson(record, lookup);

    nlohmann::json::array_t advisories;
    for (ddr4::Advisory advisory : record.advisories)
    {
        advisories.emplace_back(std::string(ddr4::advisoryName(advisory)));
    }
    res["Advisories"] = std::move(advisories);
    res["Xmp"] = xmpToJson(document.xmpBlock());

    nlohmann::json::array_t modifications;
    for (const auto& change : document.modifications())
    {
        modifications.emplace_back(nlohmann::json::object_t{
            {"Offset", std::format("0x{:03X}", change.offset)},
            {"Original", std::format("0x{:02X}", change.before)},
            {"Current", std::format("0x{:02X}", change.after)}});
    }
    res["Modifications"] = std::move(modifications);
    return res;
}

std::string textReport(const SpdDocument& document,
                       const ManufacturerLookup& lookup)
{
    ddr4::Ddr4Record record = document.record();
    std::string out;

    appendLine(out, "Source",
               document.source().empty() ? "unknown" : document.source());
    for (ddr4::Advisory advisory : record.advisories)
    {
        appendLine(out, "Advisory", ddr4::advisoryName(advisory));
    }

    appendHeading(out, "Module");
    appendLine(out, "Memory type",
               record.formatSupported
                   ? "DDR4"
                   : std::format("0x{:02X}", record.deviceType));
    appendLine(out, "Module type", ddr4::moduleTypeName(record.moduleTypeCode));
    appendLine(out, "Capacity",
               capacityText(record.density).value_or("Unknown"));
    appendLine(out, "Ranks",
               std::to_string(ddr4::logicalRanks(record.density)));
    if (record.timings.tCKmin && *record.timings.tCKmin > 0)
    {
        int32_t tck = *record.timings.tCKmin;
        auto grade = jedec::speedGrade(tck);
        appendLine(out, "Speed",
                   std::format("{:.0f} MT/s ({:.1f} MHz){}",
                               jedec::dataRateMts(tck), jedec::clockMhz(tck),
                               grade ? std::format(", DDR4-{}", *grade) : ""));
    }
    appendLine(out, "Timings", ddr4::timingString(record).value_or("Unknown"));
    appendLine(out, "CAS latencies", latencyList(record.casLatencies));

    appendHeading(out, "Manufacturer");
    appendLine(out, "Manufacturer",
               manufacturerName(lookup, record.manufacturerId));
    appendLine(out, "Part number", record.partNumber);
    appendLine(out, "Serial number", ddr4::serialNumberHex(record));
    appendLine(out, "Manufacturing date", dateText(record.manufacturingDate));
    appendLine(out, "DRAM manufacturer",
               manufacturerName(lookup, record.dramManufacturerId));

    appendHeading(out, "Timing parameters (ps)");
    for (const auto& entry : ddr4::timingTable())
    {
        const auto& value = record.timings.*entry.member;
        appendLine(out, entry.spec.name,
                   value ? std::to_string(*value) : "Unknown");
    }

    appendHeading(out, "Checksums");
    appendLine(out, "Base CRC",
               std::format("stored {} computed {}",
                           hexWord(record.baseCrc.stored),
                           hexWord(record.baseCrc.computed)));
    appendLine(out, "Module CRC",
               std::format("stored {} computed {}",
                           hexWord(record.moduleCrc.stored),
                           hexWord(record.moduleCrc.computed)));

    xmp::XmpBlock block = document.xmpBlock();
    appendHeading(out, "XMP");
    if (!block.present)
    {
        appendLine(out, "Present", "no");
    }
    for (size_t i = 0; block.present && i < xmp::profileCount; i++)
    {
        const xmp::XmpProfile& profile = block.profiles[i];
        std::string label = std::format("Profile {}", i + 1);
        if (!profile.enabled)
        {
            appendLine(out, label, "disabled");
            continue;
        }
        std::string voltage =
            profile.voltageMv
                ? std::format("{:.2f} V", *profile.voltageMv / 1000.0)
                : std::string("invalid voltage");
        appendLine(out, label,
                   std::format("{:.0f} MT/s {}, checksum {}",
                               xmp::dataRateMts(profile), voltage,
                               profile.checksumValid() ? "ok" : "mismatch"));
    }

    auto changes = document.modifications();
    if (!changes.empty())
    {
        appendHeading(out, std::format("Modifications ({} bytes)",
                                       changes.size()));
        for (const auto& change : changes)
        {
            std::format_to(std::back_inserter(out),
                           "0x{:03X}: 0x{:02X} -> 0x{:02X}\n", change.offset,
                           change.before, change.after);
        }
    }
    return out;
}

} // namespace spd_tools
