// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#pragma once

#include "spd_tools/ddr4.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <flat_map>
#include <optional>
#include <string>
#include <utility>

namespace spd_tools
{

// JEP106 bank/code to name resolution, kept out of the decoder.
class ManufacturerLookup
{
  public:
    virtual ~ManufacturerLookup() = default;

    // bank is 1 based, code is the identification byte as stored in SPD
    // (parity bit included or not).
    virtual std::optional<std::string> resolveName(uint8_t bank,
                                                   uint8_t code) const = 0;
};

// { "<bank>": { "0xNN": "Name", ... }, ... }
class JsonManufacturerTable : public ManufacturerLookup
{
  public:
    JsonManufacturerTable() = default;

    // Throws std::invalid_argument on a malformed table.
    explicit JsonManufacturerTable(const nlohmann::json::object_t& table);

    static std::optional<JsonManufacturerTable> fromJson(
        const nlohmann::json& table);

    static std::optional<JsonManufacturerTable> load(
        const std::filesystem::path& path);

    std::optional<std::string> resolveName(uint8_t bank,
                                           uint8_t code) const override;

    size_t size() const
    {
        return names.size();
    }

  private:
    std::flat_map<std::pair<uint8_t, uint8_t>, std::string> names;
};

// The resolved name, or "Unknown (0xCCNN)" with the raw bytes.
std::string manufacturerName(const ManufacturerLookup& lookup,
                             const ddr4::JedecId& id);

} // namespace spd_tools
