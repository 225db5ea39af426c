// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#pragma once

#include "spd_tools/ddr4.hpp"
#include "spd_tools/spd_image.hpp"
#include "spd_tools/xmp.hpp"

#include <cstddef>
#include <cstdint>
#include <flat_set>
#include <span>
#include <string>
#include <vector>

namespace spd_tools
{

struct ByteChange
{
    size_t offset = 0;
    uint8_t before = 0;
    uint8_t after = 0;

    bool operator==(const ByteChange&) const = default;
};

// Every offset where a and b differ, as (offset, a[offset], b[offset]).
std::vector<ByteChange> compareImages(const RawImage& a, const RawImage& b);

// An SPD image being edited. The backup is the image as loaded and stays
// retrievable until confirmOverwrite() is called.
class SpdDocument
{
  public:
    // source names where the image came from: a file path or "device".
    explicit SpdDocument(const RawImage& image, std::string source = {});

    const RawImage& image() const
    {
        return working;
    }

    const RawImage& backup() const
    {
        return original;
    }

    const std::string& source() const
    {
        return origin;
    }

    // Throws RangeError for offsets past the end of the image.
    uint8_t byteAt(size_t offset) const;
    void setByte(size_t offset, uint8_t value);
    void setBytes(size_t offset, std::span<const uint8_t> values);

    void resetByte(size_t offset);
    void reset();

    bool modified() const
    {
        return !modifiedOffsets.empty();
    }

    bool isModified(size_t offset) const
    {
        return modifiedOffsets.contains(offset);
    }

    size_t modifiedCount() const
    {
        return modifiedOffsets.size();
    }

    // (offset, backup byte, working byte), by offset.
    std::vector<ByteChange> modifications() const;

    // (offset, working byte, other byte), by offset.
    std::vector<ByteChange> compareWith(const RawImage& other) const;

    ddr4::Ddr4Record record() const;
    xmp::XmpBlock xmpBlock() const;

    // Patch the working image through the codecs, see ddr4::encode() and
    // xmp::encode(). On error the document is left unchanged.
    void applyRecord(const ddr4::Ddr4Record& record);
    void applyXmp(const xmp::XmpBlock& block);

    // The working image becomes the new backup.
    void confirmOverwrite();

    // The image to hand to the device or to a file: the working image with
    // every CRC whose bytes changed against the backup recomputed, or every
    // CRC when forced.
    RawImage commit(bool forceChecksums = false) const;

  private:
    void replaceWorking(const RawImage& image);
    void track(size_t offset);

    RawImage working;
    RawImage original;
    std::string origin;
    std::flat_set<size_t> modifiedOffsets;
};

} // namespace spd_tools
