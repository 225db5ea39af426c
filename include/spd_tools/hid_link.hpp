// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#pragma once

#include <chrono>
#include <cstdint>
#include <span>
#include <vector>

namespace spd_tools
{

// One open HID device. Implementations throw DeviceIoError on transport
// failures.
class HidLink
{
  public:
    virtual ~HidLink() = default;

    // report[0] is the report ID
    virtual void writeReport(std::span<const uint8_t> report) = 0;

    // Next input report, empty when nothing arrived within timeout.
    virtual std::vector<uint8_t> readReport(
        std::chrono::milliseconds timeout) = 0;
};

} // namespace spd_tools
