// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#include "spd_tools/manufacturer.hpp"

#include "spd_tools/utils.hpp"

#include <phosphor-logging/lg2.hpp>

#include <format>
#include <fstream>
#include <stdexcept>

namespace spd_tools
{

JsonManufacturerTable::JsonManufacturerTable(
    const nlohmann::json::object_t& table)
{
    for (const auto& [bankKey, codes] : table)
    {
        auto bank = parseNumber(bankKey);
        if (!bank || *bank == 0 || *bank > 0x80)
        {
            throw std::invalid_argument(
                std::format("'{}' is not a JEP106 bank", bankKey));
        }
        const auto* entries = codes.get_ptr<const nlohmann::json::object_t*>();
        if (entries == nullptr)
        {
            throw std::invalid_argument(
                std::format("bank '{}' was not an object", bankKey));
        }
        for (const auto& [codeKey, name] : *entries)
        {
            auto code = parseNumber(codeKey);
            const auto* nameStr = name.get_ptr<const std::string*>();
            if (!code || *code > 0xFF || nameStr == nullptr)
            {
                throw std::invalid_argument(std::format(
                    "bad entry '{}' in bank '{}'", codeKey, bankKey));
            }
            names.insert_or_assign(
                std::pair{static_cast<uint8_t>(*bank),
                          static_cast<uint8_t>(*code)},
                *nameStr);
        }
    }
}

std::optional<JsonManufacturerTable> JsonManufacturerTable::fromJson(
    const nlohmann::json& table)
{
    const auto* obj = table.get_ptr<const nlohmann::json::object_t*>();
    if (obj == nullptr)
    {
        lg2::error("manufacturer table was not an object");
        return std::nullopt;
    }
    try
    {
        return JsonManufacturerTable(*obj);
    }
    catch (const std::invalid_argument& e)
    {
        lg2::error("Invalid manufacturer table: {ERR}", "ERR", e.what());
        return std::nullopt;
    }
}

std::optional<JsonManufacturerTable> JsonManufacturerTable::load(
    const std::filesystem::path& path)
{
    std::ifstream tableStream(path);
    if (!tableStream.good())
    {
        lg2::error("Cannot open manufacturer table {PATH}", "PATH",
                   path.string());
        return std::nullopt;
    }
    nlohmann::json data = nlohmann::json::parse(tableStream, nullptr, false);
    if (data.is_discarded())
    {
        lg2::error("Illegal manufacturer table {PATH}, cannot parse JSON",
                   "PATH", path.string());
        return std::nullopt;
    }
    return fromJson(data);
}

std::optional<std::string> JsonManufacturerTable::resolveName(
    uint8_t bank, uint8_t code) const
{
    auto it = names.find({bank, code});
    if (it == names.end())
    {
        // The MSB of the ID is an odd parity bit, tables list codes with and
        // without it.
        it = names.find({bank, static_cast<uint8_t>(code ^ 0x80)});
    }
    if (it == names.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::string manufacturerName(const ManufacturerLookup& lookup,
                             const ddr4::JedecId& id)
{
    auto name = lookup.resolveName(id.bank(), id.code);
    if (name)
    {
        return *name;
    }
    return std::format("Unknown (0x{:02X}{:02X})", id.continuation, id.code);
}

} // namespace spd_tools
