// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#include "spd_tools/byte_field.hpp"

#include "spd_tools/errors.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <string>

namespace spd_tools
{

namespace
{

void checkBounds(size_t bufferSize, const FieldSpec& spec)
{
    if (static_cast<size_t>(spec.offset) + spec.length > bufferSize)
    {
        throw RangeError(std::string(spec.name),
                         std::format("field 0x{:03X}+{} is outside a {} byte "
                                     "buffer",
                                     spec.offset, spec.length, bufferSize));
    }
}

void checkInteger(const FieldSpec& spec)
{
    if (spec.length == 0 || spec.length > 4)
    {
        throw RangeError(std::string(spec.name),
                         "integer fields are 1 to 4 bytes wide");
    }
}

uint32_t assemble(std::span<const uint8_t> buffer, const FieldSpec& spec)
{
    uint32_t raw = 0;
    for (size_t i = 0; i < spec.length; i++)
    {
        size_t index = spec.endian == Endian::little
                           ? spec.offset + spec.length - 1 - i
                           : spec.offset + i;
        raw = (raw << 8) | buffer[index];
    }
    return raw;
}

void scatter(std::span<uint8_t> buffer, const FieldSpec& spec, uint32_t raw)
{
    for (size_t i = 0; i < spec.length; i++)
    {
        size_t index = spec.endian == Endian::little
                           ? spec.offset + i
                           : spec.offset + spec.length - 1 - i;
        buffer[index] = static_cast<uint8_t>(raw & 0xFF);
        raw >>= 8;
    }
}

uint32_t placeMask(const FieldSpec& spec)
{
    if (spec.mask != 0)
    {
        return spec.mask;
    }
    return spec.length >= 4 ? 0xFFFFFFFFU : ((1U << (spec.length * 8)) - 1U);
}

} // namespace

uint32_t readUnsigned(std::span<const uint8_t> buffer, const FieldSpec& spec)
{
    checkInteger(spec);
    checkBounds(buffer.size(), spec);
    uint32_t raw = assemble(buffer, spec);
    if (spec.mask == 0)
    {
        return raw;
    }
    return (raw & spec.mask) >> spec.shift;
}

int32_t readSigned(std::span<const uint8_t> buffer, const FieldSpec& spec)
{
    uint32_t value = readUnsigned(buffer, spec);
    unsigned bits = spec.width();
    if (bits < 32 && (value & (1U << (bits - 1))) != 0U)
    {
        // sign extend
        value |= ~((1U << bits) - 1U);
    }
    return static_cast<int32_t>(value);
}

std::string readText(std::span<const uint8_t> buffer, const FieldSpec& spec)
{
    checkBounds(buffer.size(), spec);
    auto field = buffer.subspan(spec.offset, spec.length);
    std::string result;
    // Erased or foreign bytes are not text, only printable ASCII is kept.
    for (uint8_t byte : field)
    {
        if (byte >= 0x20 && byte < 0x7F)
        {
            result += static_cast<char>(byte);
        }
    }
    // Unused characters are coded as the pad character, some vendors use NUL.
    auto last = result.find_last_not_of(spec.pad);
    result.erase(last == std::string::npos ? 0 : last + 1);
    return result;
}

std::vector<uint8_t> readBytes(std::span<const uint8_t> buffer,
                               const FieldSpec& spec)
{
    checkBounds(buffer.size(), spec);
    auto field = buffer.subspan(spec.offset, spec.length);
    return {field.begin(), field.end()};
}

void writeUnsigned(std::span<uint8_t> buffer, const FieldSpec& spec,
                   uint32_t value)
{
    checkInteger(spec);
    checkBounds(buffer.size(), spec);
    if (value > spec.maxValue())
    {
        throw RangeError(std::string(spec.name),
                         std::format("{} does not fit in {} bits", value,
                                     spec.width()));
    }

    uint32_t mask = placeMask(spec);
    uint32_t raw = assemble(buffer, spec);
    raw = (raw & ~mask) | ((value << spec.shift) & mask);
    scatter(buffer, spec, raw);
}

void writeSigned(std::span<uint8_t> buffer, const FieldSpec& spec,
                 int32_t value)
{
    unsigned bits = spec.width();
    int64_t low = -(int64_t{1} << (bits - 1));
    int64_t high = (int64_t{1} << (bits - 1)) - 1;
    if (value < low || value > high)
    {
        throw RangeError(std::string(spec.name),
                         std::format("{} is outside [{}, {}]", value, low,
                                     high));
    }
    writeUnsigned(buffer, spec,
                  static_cast<uint32_t>(value) & spec.maxValue());
}

void writeText(std::span<uint8_t> buffer, const FieldSpec& spec,
               std::string_view value)
{
    checkBounds(buffer.size(), spec);
    if (value.size() > spec.length)
    {
        throw RangeError(std::string(spec.name),
                         std::format("'{}' is longer than {} characters", value,
                                     spec.length));
    }
    auto nonAscii = std::ranges::find_if(value, [](char c) {
        return (static_cast<uint8_t>(c) & 0x80U) != 0U;
    });
    if (nonAscii != value.end())
    {
        throw EncodingError(
            std::string(spec.name),
            std::format("non 7-bit character at position {}",
                        std::distance(value.begin(), nonAscii)));
    }

    auto field = buffer.subspan(spec.offset, spec.length);
    std::ranges::fill(field, static_cast<uint8_t>(spec.pad));
    std::ranges::copy(value, field.begin());
}

void writeBytes(std::span<uint8_t> buffer, const FieldSpec& spec,
                std::span<const uint8_t> value)
{
    checkBounds(buffer.size(), spec);
    if (value.size() != spec.length)
    {
        throw RangeError(std::string(spec.name),
                         std::format("expected {} bytes, got {}", spec.length,
                                     value.size()));
    }
    std::ranges::copy(value, buffer.begin() + spec.offset);
}

} // namespace spd_tools
