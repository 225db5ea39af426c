// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#pragma once

#include <libudev.h>

#include <phosphor-logging/lg2.hpp>

#include <string>
#include <utility>

namespace spd_tools
{

class UDevDevice
{
    friend class UDev;

  private:
    UDevDevice(struct udev_device* udev, bool owned) : ptr(udev), owned(owned)
    {}

  public:
    UDevDevice(const UDevDevice&) = delete;
    UDevDevice& operator=(const UDevDevice&) = delete;
    UDevDevice(UDevDevice&& other) noexcept :
        ptr(std::exchange(other.ptr, nullptr)), owned(other.owned)
    {}
    UDevDevice& operator=(UDevDevice&&) = delete;

    ~UDevDevice()
    {
        // parents belong to their child device
        if (owned && ptr != nullptr)
        {
            udev_device_unref(ptr);
        }
    }

    bool valid() const
    {
        return ptr != nullptr;
    }

    std::string getDevnode() const
    {
        const char* value = udev_device_get_devnode(ptr);
        if (value == nullptr)
        {
            return {};
        }
        return {value};
    }

    std::string getSysattrValue(const char* sysattr) const
    {
        const char* value = udev_device_get_sysattr_value(ptr, sysattr);
        if (value == nullptr)
        {
            lg2::debug("No value found for sysattr: {ATTR}", "ATTR", sysattr);
            return {};
        }
        return {value};
    }

    UDevDevice getParentWithSubsystemDevtype(const char* subsystem,
                                             const char* devtype) const
    {
        return {udev_device_get_parent_with_subsystem_devtype(ptr, subsystem,
                                                              devtype),
                false};
    }

  private:
    struct udev_device* ptr;
    bool owned;
};

class UDevEnumerate
{
    friend class UDev;

  public:
    UDevEnumerate(const UDevEnumerate&) = delete;
    UDevEnumerate& operator=(const UDevEnumerate&) = delete;

    ~UDevEnumerate()
    {
        udev_enumerate_unref(ptr);
    }

    int addMatchSubsystem(const char* subsystem)
    {
        return udev_enumerate_add_match_subsystem(ptr, subsystem);
    }

    int scanDevices()
    {
        return udev_enumerate_scan_devices(ptr);
    }

    struct udev_list_entry* getListEntry()
    {
        return udev_enumerate_get_list_entry(ptr);
    }

  private:
    explicit UDevEnumerate(struct udev* udev) : ptr(udev_enumerate_new(udev)) {}

    struct udev_enumerate* ptr;
};

class UDev
{
  public:
    UDev() : ptr(udev_new())
    {
        if (ptr == nullptr)
        {
            lg2::error("Can't create udev context, HID discovery failed");
        }
    }

    UDev(const UDev&) = delete;
    UDev& operator=(const UDev&) = delete;

    ~UDev()
    {
        udev_unref(ptr);
    }

    bool valid() const
    {
        return ptr != nullptr;
    }

    UDevDevice createDeviceFromSyspath(const char* syspath) const
    {
        struct udev_device* newPtr = udev_device_new_from_syspath(ptr, syspath);
        if (newPtr == nullptr)
        {
            lg2::error("Can't create udev device from syspath: {PATH}", "PATH",
                       syspath);
        }
        return {newPtr, true};
    }

    UDevEnumerate createEnumerate() const
    {
        return UDevEnumerate(ptr);
    }

  private:
    struct udev* ptr;
};

} // namespace spd_tools
