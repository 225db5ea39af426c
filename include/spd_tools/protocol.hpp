// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// ASCII command set of the BT USB-HID SPD programmer. Every command travels as
// one HID output report and is answered by one input report.
namespace spd_tools::protocol
{

// report ID 0 followed by the 64 byte payload
constexpr size_t reportPayloadSize = 64;
constexpr size_t reportSize = reportPayloadSize + 1;

// Wakes the programmer up, sent before every read or write.
constexpr std::string_view activationCommand = "BT-VER0010";

// DDR4 SPD page select: a write to the SPA0 (0x36) or SPA1 (0x37) address.
constexpr std::array<std::string_view, 2> pageSelectCommands = {
    "BT-I2C2WR360001", "BT-I2C2WR370001"};

// BT-I2C2RD<addr><offset><len>, all two digit hex
std::string readCommand(uint8_t address, uint8_t offset, uint8_t length);

// BT-I2C2WR<addr><offset><len><data as hex>
std::string writeCommand(uint8_t address, uint8_t offset,
                         std::span<const uint8_t> data);

// Throws RangeError when the command does not fit a report.
std::vector<uint8_t> encodeReport(std::string_view command);

// Printable ASCII of a reply report, everything else dropped.
std::string decodeReply(std::span<const uint8_t> report);

// ":DE AD BE EF ..." to bytes. nullopt for a reply without the leading colon
// or with fewer than length two digit hex tokens.
std::optional<std::vector<uint8_t>> parseReadReply(std::string_view reply,
                                                   size_t length);

} // namespace spd_tools::protocol
