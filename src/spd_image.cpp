// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#include "spd_tools/spd_image.hpp"

#include "spd_tools/errors.hpp"

#include <phosphor-logging/lg2.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <vector>

namespace spd_tools
{

std::optional<RawImage> imageFromBytes(std::span<const uint8_t> bytes)
{
    if (bytes.size() != spdImageSize)
    {
        return std::nullopt;
    }
    RawImage image{};
    std::ranges::copy(bytes, image.begin());
    return image;
}

RawImage importImage(const std::filesystem::path& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.good())
    {
        lg2::error("Error opening file {PATH}", "PATH", path.string());
        throw DeviceIoError("unable to open " + path.string());
    }

    std::vector<uint8_t> content((std::istreambuf_iterator<char>(file)),
                                 std::istreambuf_iterator<char>());
    if (file.bad())
    {
        lg2::error("Error reading file {PATH}", "PATH", path.string());
        throw DeviceIoError("unable to read " + path.string());
    }

    auto image = imageFromBytes(content);
    if (!image)
    {
        lg2::error("Rejecting {PATH}: {SIZE} bytes is not a SPD image", "PATH",
                   path.string(), "SIZE", content.size());
        throw InvalidFileSize(content.size());
    }
    return *image;
}

void exportImage(const std::filesystem::path& path, const RawImage& image)
{
    std::ofstream file(path, std::ios_base::binary | std::ios_base::trunc);
    if (!file.good())
    {
        lg2::error("Error opening file {PATH}", "PATH", path.string());
        throw DeviceIoError("unable to open " + path.string());
    }
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    const char* charOffset = reinterpret_cast<const char*>(image.data());
    file.write(charOffset, image.size());
    if (!file.good())
    {
        lg2::error("Error writing file {PATH}", "PATH", path.string());
        throw DeviceIoError("unable to write " + path.string());
    }
}

} // namespace spd_tools
