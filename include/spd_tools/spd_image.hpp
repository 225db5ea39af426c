// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>

namespace spd_tools
{

// DDR4 SPD EEPROM size and the transport's page split.
constexpr size_t spdImageSize = 512;
constexpr size_t spdPageSize = 256;
constexpr size_t spdPageCount = spdImageSize / spdPageSize;

// The only byte accurate representation of the module's EEPROM.
using RawImage = std::array<uint8_t, spdImageSize>;

// Returns nullopt unless the buffer is exactly spdImageSize bytes long.
std::optional<RawImage> imageFromBytes(std::span<const uint8_t> bytes);

inline std::span<const uint8_t, spdPageSize> pageOf(const RawImage& image,
                                                    size_t page)
{
    return std::span<const uint8_t, spdPageSize>(
        image.data() + (page * spdPageSize), spdPageSize);
}

// .bin files are the raw image without any framing. Throws InvalidFileSize
// when the file is not exactly 512 bytes and DeviceIoError when it cannot be
// read.
RawImage importImage(const std::filesystem::path& path);

void exportImage(const std::filesystem::path& path, const RawImage& image);

} // namespace spd_tools
