// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace spd_tools
{

enum class FieldKind : uint8_t
{
    unsignedInt,
    signedInt,
    text,
    bytes,
};

enum class Endian : uint8_t
{
    little,
    big,
};

// Static description of one field inside a fixed size buffer. Integer fields
// are 1 to 4 bytes wide; when mask is non zero the value is
// (assembled & mask) >> shift, otherwise the whole assembled value.
struct FieldSpec
{
    std::string_view name;
    uint16_t offset;
    uint8_t length;
    FieldKind kind;
    Endian endian;
    uint32_t mask;
    uint8_t shift;
    char pad;

    // Number of significant value bits.
    constexpr unsigned width() const
    {
        if (mask == 0)
        {
            return length * 8U;
        }
        unsigned bits = 0;
        for (uint32_t m = mask >> shift; m != 0; m >>= 1)
        {
            bits++;
        }
        return bits;
    }

    constexpr uint32_t maxValue() const
    {
        return width() >= 32 ? 0xFFFFFFFFU : ((1U << width()) - 1U);
    }
};

constexpr FieldSpec byteField(std::string_view name, uint16_t offset)
{
    return {name, offset, 1, FieldKind::unsignedInt, Endian::little, 0, 0, 0};
}

constexpr FieldSpec bitField(std::string_view name, uint16_t offset,
                             uint8_t mask, uint8_t shift)
{
    return {name,          offset, 1, FieldKind::unsignedInt,
            Endian::little, mask,  shift, 0};
}

constexpr FieldSpec signedByteField(std::string_view name, uint16_t offset)
{
    return {name, offset, 1, FieldKind::signedInt, Endian::little, 0, 0, 0};
}

constexpr FieldSpec wordField(std::string_view name, uint16_t offset,
                              Endian endian = Endian::little)
{
    return {name, offset, 2, FieldKind::unsignedInt, endian, 0, 0, 0};
}

constexpr FieldSpec textField(std::string_view name, uint16_t offset,
                              uint8_t length, char pad = ' ')
{
    return {name, offset, length, FieldKind::text, Endian::little, 0, 0, pad};
}

constexpr FieldSpec rawField(std::string_view name, uint16_t offset,
                             uint8_t length)
{
    return {name, offset, length, FieldKind::bytes, Endian::little, 0, 0, 0};
}

// Readers never fail on content, only on a spec that does not fit the buffer
// (RangeError).
uint32_t readUnsigned(std::span<const uint8_t> buffer, const FieldSpec& spec);

int32_t readSigned(std::span<const uint8_t> buffer, const FieldSpec& spec);

// Bytes outside printable ASCII are dropped, trailing pad characters are
// trimmed.
std::string readText(std::span<const uint8_t> buffer, const FieldSpec& spec);

std::vector<uint8_t> readBytes(std::span<const uint8_t> buffer,
                               const FieldSpec& spec);

// Writers patch only the bits the field covers and never resize the buffer.
// A value that does not fit the field throws RangeError, non 7-bit text
// throws EncodingError.
void writeUnsigned(std::span<uint8_t> buffer, const FieldSpec& spec,
                   uint32_t value);

void writeSigned(std::span<uint8_t> buffer, const FieldSpec& spec,
                 int32_t value);

void writeText(std::span<uint8_t> buffer, const FieldSpec& spec,
               std::string_view value);

void writeBytes(std::span<uint8_t> buffer, const FieldSpec& spec,
                std::span<const uint8_t> value);

} // namespace spd_tools
