// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#pragma once

#include <unistd.h>

#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <string_view>

namespace spd_tools::test
{

inline int randomSuffix()
{
    struct timespec ts{};
    clock_gettime(CLOCK_REALTIME, &ts);
    const unsigned int seed = ts.tv_nsec ^ getpid();
    srandom(seed);
    return random();
}

// Scratch directory under /tmp, removed with everything in it.
class TestDir
{
  public:
    TestDir() :
        dir(std::format("/tmp/test_spd_tools_{}", randomSuffix()))
    {
        std::filesystem::create_directory(dir);
    }

    ~TestDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    TestDir(const TestDir&) = delete;
    TestDir& operator=(const TestDir&) = delete;

    std::filesystem::path path(std::string_view name) const
    {
        return dir / name;
    }

    std::filesystem::path write(std::string_view name,
                                std::string_view content) const
    {
        std::filesystem::path file = path(name);
        std::ofstream stream(file, std::ios::binary);
        stream.write(content.data(),
                     static_cast<std::streamsize>(content.size()));
        return file;
    }

    const std::filesystem::path dir;
};

} // namespace spd_tools::test
