// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#include "spd_tools/document.hpp"

#include "spd_tools/errors.hpp"

#include <phosphor-logging/lg2.hpp>

#include <format>
#include <utility>

namespace spd_tools
{

namespace
{

void checkRange(size_t offset, size_t length)
{
    if (offset > spdImageSize || length > spdImageSize - offset)
    {
        throw RangeError("offset",
                         std::format("{} bytes at 0x{:03X} do not fit in a {} "
                                     "byte image",
                                     length, offset, spdImageSize));
    }
}

} // namespace

std::vector<ByteChange> compareImages(const RawImage& a, const RawImage& b)
{
    std::vector<ByteChange> changes;
    for (size_t offset = 0; offset < spdImageSize; offset++)
    {
        if (a[offset] != b[offset])
        {
            changes.push_back({offset, a[offset], b[offset]});
        }
    }
    return changes;
}

SpdDocument::SpdDocument(const RawImage& image, std::string source) :
    working(image), original(image), origin(std::move(source))
{}

uint8_t SpdDocument::byteAt(size_t offset) const
{
    checkRange(offset, 1);
    return working[offset];
}

void SpdDocument::track(size_t offset)
{
    if (working[offset] != original[offset])
    {
        modifiedOffsets.insert(offset);
    }
    else
    {
        modifiedOffsets.erase(offset);
    }
}

void SpdDocument::setByte(size_t offset, uint8_t value)
{
    checkRange(offset, 1);
    working[offset] = value;
    track(offset);
}

void SpdDocument::setBytes(size_t offset, std::span<const uint8_t> values)
{
    checkRange(offset, values.size());
    for (size_t i = 0; i < values.size(); i++)
    {
        working[offset + i] = values[i];
        track(offset + i);
    }
}

void SpdDocument::resetByte(size_t offset)
{
    checkRange(offset, 1);
    working[offset] = original[offset];
    modifiedOffsets.erase(offset);
}

void SpdDocument::reset()
{
    working = original;
    modifiedOffsets.clear();
}

std::vector<ByteChange> SpdDocument::modifications() const
{
    std::vector<ByteChange> changes;
    changes.reserve(modifiedOffsets.size());
    for (size_t offset : modifiedOffsets)
    {
        changes.push_back({offset, original[offset], working[offset]});
    }
    return changes;
}

std::vector<ByteChange> SpdDocument::compareWith(const RawImage& other) const
{
    return compareImages(working, other);
}

ddr4::Ddr4Record SpdDocument::record() const
{
    return ddr4::decode(working);
}

xmp::XmpBlock SpdDocument::xmpBlock() const
{
    return xmp::decode(working);
}

void SpdDocument::replaceWorking(const RawImage& image)
{
    for (size_t offset = 0; offset < spdImageSize; offset++)
    {
        if (image[offset] != working[offset])
        {
            working[offset] = image[offset];
            track(offset);
        }
    }
}

void SpdDocument::applyRecord(const ddr4::Ddr4Record& record)
{
    replaceWorking(ddr4::encode(record, working));
}

void SpdDocument::applyXmp(const xmp::XmpBlock& block)
{
    replaceWorking(xmp::encode(block, working));
}

void SpdDocument::confirmOverwrite()
{
    lg2::info("Replacing SPD backup, {COUNT} bytes modified", "COUNT",
              modifiedOffsets.size());
    original = working;
    modifiedOffsets.clear();
}

RawImage SpdDocument::commit(bool forceChecksums) const
{
    RawImage image = working;
    if (forceChecksums)
    {
        ddr4::refreshChecksums(image);
        xmp::refreshChecksums(image);
    }
    else
    {
        ddr4::refreshChecksums(image, original);
        xmp::refreshChecksums(image, original);
    }
    return image;
}

} // namespace spd_tools
