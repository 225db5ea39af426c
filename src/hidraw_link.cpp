// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#include "spd_tools/hidraw_link.hpp"

#include "spd_tools/errors.hpp"
#include "spd_tools/protocol.hpp"
#include "spd_tools/utils.hpp"
#include "udev_helpers.hpp"

#include <poll.h>
#include <sys/file.h>

#include <phosphor-logging/lg2.hpp>
#include <stdplus/fd/create.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <optional>
#include <system_error>

namespace spd_tools
{

namespace
{

std::optional<uint16_t> usbId(const UDevDevice& usb, const char* attr)
{
    std::string value = usb.getSysattrValue(attr);
    uint16_t id = 0;
    bool fullMatch = false;
    auto [ptr, ec] = fromCharsWrapper(value, id, fullMatch, 16);
    if (value.empty() || ec != std::errc{} || !fullMatch)
    {
        return std::nullopt;
    }
    return id;
}

} // namespace

std::vector<std::string> findHidrawNodes(uint16_t vendorId, uint16_t productId)
{
    UDev udev;
    if (!udev.valid())
    {
        throw DeviceIoError("unable to create a udev context");
    }

    UDevEnumerate enumerate = udev.createEnumerate();
    enumerate.addMatchSubsystem("hidraw");
    enumerate.scanDevices();

    std::vector<std::string> nodes;
    struct udev_list_entry* entry = nullptr;
    udev_list_entry_foreach(entry, enumerate.getListEntry())
    {
        const char* syspath = udev_list_entry_get_name(entry);
        UDevDevice hidraw = udev.createDeviceFromSyspath(syspath);
        if (!hidraw.valid())
        {
            continue;
        }
        UDevDevice usb =
            hidraw.getParentWithSubsystemDevtype("usb", "usb_device");
        if (!usb.valid())
        {
            continue;
        }
        if (usbId(usb, "idVendor") == vendorId &&
            usbId(usb, "idProduct") == productId)
        {
            std::string devnode = hidraw.getDevnode();
            lg2::debug("Found programmer {VID}:{PID} at {PATH}", "VID",
                       lg2::hex, vendorId, "PID", lg2::hex, productId, "PATH",
                       devnode);
            nodes.push_back(std::move(devnode));
        }
    }
    return nodes;
}

HidrawLink::HidrawLink(stdplus::ManagedFd&& fd, std::string devnode) :
    fd(std::move(fd)), devnode(std::move(devnode))
{}

std::unique_ptr<HidLink> HidrawLink::open(const ProgrammerConfig& config)
{
    std::string path = config.devicePath.string();
    if (path.empty())
    {
        std::vector<std::string> nodes =
            findHidrawNodes(config.vendorId, config.productId);
        if (nodes.empty())
        {
            lg2::error("No HID device {VID}:{PID}", "VID", lg2::hex,
                       config.vendorId, "PID", lg2::hex, config.productId);
            throw DeviceNotFound(std::format("no HID device {:04x}:{:04x}",
                                             config.vendorId,
                                             config.productId));
        }
        if (nodes.size() > 1)
        {
            lg2::warning("{COUNT} programmers attached, using {PATH}", "COUNT",
                         nodes.size(), "PATH", nodes.front());
        }
        path = nodes.front();
    }
    std::optional<stdplus::ManagedFd> fd;
    try
    {
        fd.emplace(stdplus::fd::open(path.c_str(),
                                     stdplus::fd::OpenAccess::ReadWrite));
    }
    catch (const std::system_error& e)
    {
        lg2::error("Unable to open HID device {PATH}: {ERR}", "PATH", path,
                   "ERR", e.what());
        if (e.code() == std::errc::device_or_resource_busy)
        {
            throw DeviceBusy(path + " is in use");
        }
        throw DeviceIoError(std::format("unable to open {}: {}", path,
                                        e.what()));
    }

    // Exclusive for the lifetime of the link, a second tool fails fast.
    if (::flock(fd->get(), LOCK_EX | LOCK_NB) != 0)
    {
        int err = errno;
        if (err == EWOULDBLOCK)
        {
            lg2::error("HID device {PATH} is locked by another process",
                       "PATH", path);
            throw DeviceBusy(path + " is locked by another process");
        }
        throw DeviceIoError(std::format("unable to lock {}: {}", path,
                                        std::strerror(err)));
    }

    lg2::info("Opened SPD programmer at {PATH}", "PATH", path);
    return std::make_unique<HidrawLink>(std::move(*fd), path);
}

void HidrawLink::writeReport(std::span<const uint8_t> report)
{
    try
    {
        auto written = fd.write(std::as_bytes(report));
        if (written.size() != report.size())
        {
            throw DeviceIoError(std::format("short write to {}: {} of {} "
                                            "bytes",
                                            devnode, written.size(),
                                            report.size()));
        }
    }
    catch (const std::system_error& e)
    {
        lg2::error("failed to write report: {ERR}", "ERR", e.what());
        throw DeviceIoError(std::format("write to {} failed: {}", devnode,
                                        e.what()));
    }
}

std::vector<uint8_t> HidrawLink::readReport(std::chrono::milliseconds timeout)
{
    struct pollfd pfd{};
    pfd.fd = fd.get();
    pfd.events = POLLIN;
    int ret = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ret < 0)
    {
        int err = errno;
        throw DeviceIoError(std::format("poll on {} failed: {}", devnode,
                                        std::strerror(err)));
    }
    if (ret == 0)
    {
        return {};
    }
    if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0)
    {
        lg2::error("HID device {PATH} went away", "PATH", devnode);
        throw DeviceIoError(devnode + " disconnected");
    }

    std::array<std::byte, protocol::reportSize> buffer{};
    try
    {
        auto received = fd.read(buffer);
        std::vector<uint8_t> report(received.size());
        std::ranges::transform(received, report.begin(), [](std::byte b) {
            return static_cast<uint8_t>(b);
        });
        return report;
    }
    catch (const std::system_error& e)
    {
        lg2::error("failed to read report: {ERR}", "ERR", e.what());
        throw DeviceIoError(std::format("read from {} failed: {}", devnode,
                                        e.what()));
    }
}

} // namespace spd_tools
