// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#include "spd_tools/protocol.hpp"

#include "spd_tools/errors.hpp"
#include "spd_tools/utils.hpp"

#include <algorithm>
#include <format>

namespace spd_tools::protocol
{

std::string readCommand(uint8_t address, uint8_t offset, uint8_t length)
{
    return std::format("BT-I2C2RD{:02X}{:02X}{:02X}", address, offset, length);
}

std::string writeCommand(uint8_t address, uint8_t offset,
                         std::span<const uint8_t> data)
{
    return std::format("BT-I2C2WR{:02X}{:02X}{:02X}{}", address, offset,
                       data.size(), toHex(data, ""));
}

std::vector<uint8_t> encodeReport(std::string_view command)
{
    if (command.size() > reportPayloadSize)
    {
        throw RangeError("command",
                         std::format("'{}' exceeds the {} byte report", command,
                                     reportPayloadSize));
    }
    std::vector<uint8_t> report(reportSize, 0);
    std::ranges::copy(command, report.begin() + 1);
    return report;
}

std::string decodeReply(std::span<const uint8_t> report)
{
    std::string reply;
    for (uint8_t c : report)
    {
        if (c >= 32 && c <= 126)
        {
            reply.push_back(static_cast<char>(c));
        }
    }
    return reply;
}

std::optional<std::vector<uint8_t>> parseReadReply(std::string_view reply,
                                                   size_t length)
{
    if (!reply.starts_with(':'))
    {
        return std::nullopt;
    }
    reply.remove_prefix(1);

    std::vector<uint8_t> bytes;
    size_t pos = 0;
    while (pos < reply.size() && bytes.size() < length)
    {
        auto end = reply.find(' ', pos);
        if (end == std::string_view::npos)
        {
            end = reply.size();
        }
        std::string_view token = reply.substr(pos, end - pos);
        pos = end + 1;
        // Status words and padding are mixed into the dump, only two digit
        // tokens are data.
        if (token.size() != 2)
        {
            continue;
        }
        uint8_t byte = 0;
        bool fullMatch = false;
        auto [ptr, ec] = fromCharsWrapper(token, byte, fullMatch, 16);
        if (ec != std::errc{} || !fullMatch)
        {
            return std::nullopt;
        }
        bytes.push_back(byte);
    }
    if (bytes.size() != length)
    {
        return std::nullopt;
    }
    return bytes;
}

} // namespace spd_tools::protocol
