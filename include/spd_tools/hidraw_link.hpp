// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#pragma once

#include "spd_tools/config.hpp"
#include "spd_tools/hid_link.hpp"

#include <stdplus/fd/managed.hpp>

#include <memory>
#include <string>
#include <vector>

namespace spd_tools
{

// Linux hidraw node of the programmer.
class HidrawLink : public HidLink
{
  public:
    HidrawLink(stdplus::ManagedFd&& fd, std::string devnode);

    // Opens and locks the first hidraw node matching the configured
    // vendor/product. Throws DeviceNotFound, DeviceBusy or DeviceIoError.
    static std::unique_ptr<HidLink> open(const ProgrammerConfig& config);

    void writeReport(std::span<const uint8_t> report) override;

    std::vector<uint8_t> readReport(std::chrono::milliseconds timeout) override;

    const std::string& path() const
    {
        return devnode;
    }

  private:
    stdplus::ManagedFd fd;
    std::string devnode;
};

// /dev/hidrawN nodes whose USB parent carries vendorId:productId.
std::vector<std::string> findHidrawNodes(uint16_t vendorId,
                                         uint16_t productId);

} // namespace spd_tools
