// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>

#ifndef SPD_TOOLS_CONFIG_FILE
#define SPD_TOOLS_CONFIG_FILE "/etc/spd-tools/programmer.json"
#endif

#ifndef SPD_TOOLS_MANUFACTURER_TABLE
#define SPD_TOOLS_MANUFACTURER_TABLE "/usr/share/spd-tools/manufacturers.json"
#endif

namespace spd_tools
{

// Settings of the USB-HID SPD programmer. Every key is optional, the defaults
// match the CH341 based BT programmer.
class ProgrammerConfig
{
  public:
    ProgrammerConfig() = default;

    // Throws std::invalid_argument for a key with a wrong type or an out of
    // range value.
    explicit ProgrammerConfig(const nlohmann::json::object_t& config);

    static std::optional<ProgrammerConfig> fromJson(const nlohmann::json& config);

    // A missing file yields the defaults, an unreadable or invalid one
    // nullopt.
    static std::optional<ProgrammerConfig> load(
        const std::filesystem::path& path);

    nlohmann::json toJson() const;

    uint16_t vendorId = 0x0483;
    uint16_t productId = 0x1230;
    uint8_t i2cAddress = 0x50;
    // bytes per read/write command, divides the page size
    uint8_t chunkSize = 8;
    std::chrono::milliseconds responseTimeout{500};
    std::chrono::milliseconds commandDelay{20};
    // EEPROM write cycle after each chunk write
    std::chrono::milliseconds writeDelay{100};
    std::chrono::milliseconds activationDelay{100};
    std::array<std::chrono::milliseconds, 2> pageSelectDelay{
        std::chrono::milliseconds{200}, std::chrono::milliseconds{400}};
    // attempts per chunk read, and the wait between them
    unsigned chunkRetries = 3;
    std::chrono::milliseconds retryDelay{50};
    // extra reads of a page that came back all zero
    unsigned blankPageRetries = 2;
    bool acceptBlankPages = false;
    // hidraw node to open instead of the first VID/PID match
    std::filesystem::path devicePath;
    std::filesystem::path manufacturerTable = SPD_TOOLS_MANUFACTURER_TABLE;
};

} // namespace spd_tools
