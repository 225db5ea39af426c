// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#include "spd_tools/field_edit.hpp"

#include "spd_tools/errors.hpp"
#include "spd_tools/jedec.hpp"
#include "spd_tools/utils.hpp"

#include <phosphor-logging/lg2.hpp>

#include <algorithm>
#include <array>
#include <format>
#include <string>

namespace spd_tools
{

namespace
{

using RecordSetter = void (*)(ddr4::Ddr4Record&, std::string_view);

uint32_t numberValue(std::string_view field, std::string_view value,
                     uint32_t max)
{
    auto number = parseNumber(value);
    if (!number || *number > max)
    {
        throw RangeError(std::string(field),
                         std::format("'{}' is not a number in 0..{}", value,
                                     max));
    }
    return *number;
}

uint8_t byteValue(std::string_view field, std::string_view value)
{
    return static_cast<uint8_t>(numberValue(field, value, 0xFF));
}

int32_t picoseconds(std::string_view field, std::string_view value)
{
    return static_cast<int32_t>(numberValue(field, value, 0xFFFFFF));
}

std::vector<uint8_t> latencyList(std::string_view field, std::string_view value)
{
    std::vector<uint8_t> latencies;
    size_t pos = 0;
    while (pos <= value.size())
    {
        auto end = value.find(',', pos);
        std::string_view token = value.substr(pos, end - pos);
        latencies.push_back(byteValue(field, token));
        if (end == std::string_view::npos)
        {
            break;
        }
        pos = end + 1;
    }
    return latencies;
}

std::vector<uint8_t> serialBytes(std::string_view value)
{
    std::string spaced;
    if (value.find(' ') == std::string_view::npos)
    {
        for (size_t i = 0; i < value.size(); i += 2)
        {
            spaced += value.substr(i, 2);
            spaced += ' ';
        }
        value = spaced;
    }
    auto bytes = parseHexBytes(value);
    if (!bytes || bytes->size() != 4)
    {
        throw RangeError("serialNumber",
                         std::format("'{}' is not 4 hex bytes", value));
    }
    return *bytes;
}

ddr4::JedecId jedecIdValue(std::string_view field, std::string_view value)
{
    uint32_t id = numberValue(field, value, 0xFFFF);
    return {static_cast<uint8_t>(id >> 8), static_cast<uint8_t>(id & 0xFF)};
}

ddr4::ManufacturingDate dateValue(std::string_view value)
{
    auto dash = value.find('-');
    if (dash == std::string_view::npos)
    {
        throw RangeError("manufacturingDate",
                         std::format("'{}' is not year-week", value));
    }
    return {static_cast<uint16_t>(numberValue("manufacturingDate",
                                              value.substr(0, dash), 9999)),
            static_cast<uint8_t>(numberValue("manufacturingDate",
                                             value.substr(dash + 1), 0xFF))};
}

struct RecordField
{
    std::string_view name;
    RecordSetter set;
};

const std::array<RecordField, 13> recordFields = {{
    {"spdRevision",
     [](ddr4::Ddr4Record& r, std::string_view v) {
         r.spdRevision = byteValue("spdRevision", v);
     }},
    {"deviceType",
     [](ddr4::Ddr4Record& r, std::string_view v) {
         r.deviceType = byteValue("deviceType", v);
     }},
    {"moduleTypeCode",
     [](ddr4::Ddr4Record& r, std::string_view v) {
         r.moduleTypeCode = byteValue("moduleTypeCode", v);
     }},
    {"moduleVoltage",
     [](ddr4::Ddr4Record& r, std::string_view v) {
         r.moduleVoltage = byteValue("moduleVoltage", v);
     }},
    {"casLatencies",
     [](ddr4::Ddr4Record& r, std::string_view v) {
         r.casLatencies = latencyList("casLatencies", v);
     }},
    {"dataRate",
     [](ddr4::Ddr4Record& r, std::string_view v) {
         r.timings.tCKmin =
             jedec::tckForDataRate(numberValue("dataRate", v, 10000));
     }},
    {"manufacturerId",
     [](ddr4::Ddr4Record& r, std::string_view v) {
         r.manufacturerId = jedecIdValue("manufacturerId", v);
     }},
    {"manufacturingLocation",
     [](ddr4::Ddr4Record& r, std::string_view v) {
         r.manufacturingLocation = byteValue("manufacturingLocation", v);
     }},
    {"manufacturingDate",
     [](ddr4::Ddr4Record& r, std::string_view v) {
         r.manufacturingDate = dateValue(v);
     }},
    {"serialNumber",
     [](ddr4::Ddr4Record& r, std::string_view v) {
         std::ranges::copy(serialBytes(v), r.serialNumber.begin());
     }},
    {"partNumber",
     [](ddr4::Ddr4Record& r, std::string_view v) { r.partNumber = v; }},
    {"revisionCode",
     [](ddr4::Ddr4Record& r, std::string_view v) {
         r.revisionCode = byteValue("revisionCode", v);
     }},
    {"dramManufacturerId",
     [](ddr4::Ddr4Record& r, std::string_view v) {
         r.dramManufacturerId = jedecIdValue("dramManufacturerId", v);
     }},
}};

constexpr std::array<std::string_view, 5> xmpProfileFields = {
    "enabled", "voltage", "dimmsPerChannel", "casLatencies", "dataRate"};

bool setRecordField(ddr4::Ddr4Record& record, std::string_view name,
                    std::string_view value)
{
    auto field = std::ranges::find(recordFields, name, &RecordField::name);
    if (field != recordFields.end())
    {
        field->set(record, value);
        return true;
    }
    for (const auto& entry : ddr4::timingTable())
    {
        if (entry.spec.name == name)
        {
            record.timings.*entry.member = picoseconds(name, value);
            return true;
        }
    }
    return false;
}

// A profile enabled in an image without XMP starts from the module's own
// JEDEC timings at 1.2 V.
void seedProfile(xmp::XmpProfile& profile, size_t index,
                 const ddr4::Ddr4Record& record)
{
    profile.voltageMv = 1200;
    profile.casLatencies = record.casLatencies;
    for (const auto& entry : xmp::timingTable(index))
    {
        for (const auto& base : ddr4::timingTable())
        {
            if (base.spec.name == entry.spec.name)
            {
                profile.timings.*entry.member =
                    (record.timings.*base.member).value_or(0);
            }
        }
    }
}

bool setProfileField(xmp::XmpProfile& profile, size_t index,
                     std::string_view name, std::string_view value)
{
    if (name == "enabled")
    {
        profile.enabled = numberValue(name, value, 1) != 0;
    }
    else if (name == "voltage")
    {
        profile.voltageMv =
            static_cast<uint16_t>(numberValue(name, value, 0xFFFF));
    }
    else if (name == "dimmsPerChannel")
    {
        profile.dimmsPerChannel = byteValue(name, value);
    }
    else if (name == "casLatencies")
    {
        profile.casLatencies = latencyList(name, value);
    }
    else if (name == "dataRate")
    {
        xmp::setDataRate(profile, numberValue(name, value, 10000));
    }
    else
    {
        auto table = xmp::timingTable(index);
        auto entry = std::ranges::find_if(table, [name](const auto& e) {
            return e.spec.name == name;
        });
        if (entry == table.end())
        {
            return false;
        }
        profile.timings.*entry->member = picoseconds(name, value);
    }
    return true;
}

void setXmpField(SpdDocument& document, size_t index, std::string_view name,
                 std::string_view value)
{
    xmp::XmpBlock block = document.xmpBlock();
    xmp::XmpProfile& profile = block.profiles[index];
    if (!block.present)
    {
        if (name != "enabled")
        {
            throw RangeError(std::format("xmp{}.{}", index + 1, name),
                             "the image has no XMP block, enable a profile "
                             "first");
        }
        block.present = true;
        block.revision = xmp::revision20;
        seedProfile(profile, index, document.record());
    }
    if (!setProfileField(profile, index, name, value))
    {
        throw RangeError(std::format("xmp{}.{}", index + 1, name),
                         "unknown XMP field");
    }
    document.applyXmp(block);
}

} // namespace

std::vector<std::string> editableFields()
{
    std::vector<std::string> names;
    for (const auto& field : recordFields)
    {
        names.emplace_back(field.name);
    }
    for (const auto& entry : ddr4::timingTable())
    {
        names.emplace_back(entry.spec.name);
    }
    for (size_t i = 0; i < xmp::profileCount; i++)
    {
        for (std::string_view field : xmpProfileFields)
        {
            names.push_back(std::format("xmp{}.{}", i + 1, field));
        }
        for (const auto& entry : xmp::timingTable(i))
        {
            names.push_back(std::format("xmp{}.{}", i + 1, entry.spec.name));
        }
    }
    return names;
}

void setField(SpdDocument& document, std::string_view name,
              std::string_view value)
{
    lg2::debug("Setting SPD field {FIELD} to {VALUE}", "FIELD",
               std::string(name), "VALUE", std::string(value));

    if (auto offset = parseNumber(name))
    {
        if (*offset >= spdImageSize)
        {
            throw RangeError("offset",
                             std::format("0x{:X} is past the end of the image",
                                         *offset));
        }
        document.setByte(*offset, byteValue(name, value));
        return;
    }

    if (name.starts_with("xmp") && name.size() > 5 && name[4] == '.')
    {
        size_t index = static_cast<size_t>(name[3] - '1');
        if (index >= xmp::profileCount)
        {
            throw RangeError(std::string(name), "no such XMP profile");
        }
        setXmpField(document, index, name.substr(5), value);
        return;
    }

    ddr4::Ddr4Record record = document.record();
    if (!setRecordField(record, name, value))
    {
        throw RangeError(std::string(name), "unknown field");
    }
    document.applyRecord(record);
}

} // namespace spd_tools
