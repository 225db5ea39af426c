// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#include "spd_tools/utils.hpp"

#include <format>

namespace spd_tools
{

std::optional<uint32_t> parseNumber(std::string_view text)
{
    int base = 10;
    if (text.starts_with("0x") || text.starts_with("0X"))
    {
        text.remove_prefix(2);
        base = 16;
    }
    if (text.empty())
    {
        return std::nullopt;
    }
    uint32_t value = 0;
    bool fullMatch = false;
    auto [ptr, ec] = fromCharsWrapper(text, value, fullMatch, base);
    if (ec != std::errc{} || !fullMatch)
    {
        return std::nullopt;
    }
    return value;
}

std::optional<uint32_t> parseNumber(const nlohmann::json& value)
{
    if (const auto* number = value.get_ptr<const uint64_t*>())
    {
        if (*number > UINT32_MAX)
        {
            return std::nullopt;
        }
        return static_cast<uint32_t>(*number);
    }
    if (const auto* number = value.get_ptr<const int64_t*>())
    {
        if (*number < 0 || *number > UINT32_MAX)
        {
            return std::nullopt;
        }
        return static_cast<uint32_t>(*number);
    }
    if (const auto* text = value.get_ptr<const std::string*>())
    {
        return parseNumber(*text);
    }
    return std::nullopt;
}

std::optional<std::vector<uint8_t>> parseHexBytes(std::string_view text)
{
    std::vector<uint8_t> bytes;
    size_t pos = 0;
    while (pos < text.size())
    {
        if (text[pos] == ' ')
        {
            pos++;
            continue;
        }
        auto end = text.find(' ', pos);
        std::string_view token = text.substr(pos, end - pos);
        if (token.starts_with("0x") || token.starts_with("0X"))
        {
            token.remove_prefix(2);
        }
        uint8_t byte = 0;
        bool fullMatch = false;
        auto [ptr, ec] = fromCharsWrapper(token, byte, fullMatch, 16);
        if (token.empty() || token.size() > 2 || ec != std::errc{} ||
            !fullMatch)
        {
            return std::nullopt;
        }
        bytes.push_back(byte);
        pos = end == std::string_view::npos ? text.size() : end;
    }
    return bytes;
}

std::string toHex(std::span<const uint8_t> bytes, std::string_view separator)
{
    std::string result;
    for (size_t i = 0; i < bytes.size(); i++)
    {
        if (i != 0)
        {
            result += separator;
        }
        result += std::format("{:02X}", bytes[i]);
    }
    return result;
}

} // namespace spd_tools
