// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#pragma once

#include <nlohmann/json.hpp>

#include <charconv>
#include <cstdint>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace spd_tools
{

template <typename T>
std::from_chars_result fromCharsWrapper(const std::string_view& str, T& out,
                                        bool& fullMatch, int base = 10)
{
    auto result = std::from_chars(
        str.data(), std::next(str.begin(), str.size()), out, base);

    fullMatch = result.ptr == std::next(str.begin(), str.size());

    return result;
}

// "0x1F", "31" or 31. nullopt for anything else, negative numbers included.
std::optional<uint32_t> parseNumber(std::string_view text);
std::optional<uint32_t> parseNumber(const nlohmann::json& value);

// "DE AD be ef" style hex dumps, as printed by the programmer and accepted on
// the command line.
std::optional<std::vector<uint8_t>> parseHexBytes(std::string_view text);

std::string toHex(std::span<const uint8_t> bytes, std::string_view separator);

} // namespace spd_tools
