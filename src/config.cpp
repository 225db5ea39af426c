// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#include "spd_tools/config.hpp"

#include "spd_tools/spd_image.hpp"
#include "spd_tools/utils.hpp"

#include <phosphor-logging/lg2.hpp>

#include <format>
#include <fstream>
#include <stdexcept>
#include <string>

namespace spd_tools
{

namespace
{

const nlohmann::json* findConfigProp(const nlohmann::json::object_t& config,
                                     const std::string& name)
{
    auto nameIt = config.find(name);
    if (nameIt == config.end())
    {
        return nullptr;
    }
    return &nameIt->second;
}

uint32_t getNumberProp(const nlohmann::json::object_t& config,
                       const std::string& name, uint32_t current,
                       uint32_t max)
{
    const nlohmann::json* value = findConfigProp(config, name);
    if (value == nullptr)
    {
        return current;
    }

    auto number = parseNumber(*value);
    if (!number)
    {
        throw std::invalid_argument(
            std::format("property '{}' has wrong type", name));
    }
    if (*number > max)
    {
        throw std::invalid_argument(
            std::format("property '{}' value {} exceeds {}", name, *number,
                        max));
    }
    return *number;
}

std::chrono::milliseconds getDelayProp(const nlohmann::json& value,
                                       const std::string& name)
{
    auto number = parseNumber(value);
    if (!number || *number > 60000)
    {
        throw std::invalid_argument(
            std::format("property '{}' is not a delay in ms", name));
    }
    return std::chrono::milliseconds{*number};
}

std::chrono::milliseconds getDelayProp(const nlohmann::json::object_t& config,
                                       const std::string& name,
                                       std::chrono::milliseconds current)
{
    const nlohmann::json* value = findConfigProp(config, name);
    if (value == nullptr)
    {
        return current;
    }
    return getDelayProp(*value, name);
}

std::filesystem::path getPathProp(const nlohmann::json::object_t& config,
                                  const std::string& name,
                                  const std::filesystem::path& current)
{
    const nlohmann::json* value = findConfigProp(config, name);
    if (value == nullptr)
    {
        return current;
    }
    const auto* path = value->get_ptr<const std::string*>();
    if (path == nullptr)
    {
        throw std::invalid_argument(
            std::format("property '{}' has wrong type", name));
    }
    return *path;
}

} // namespace

std::optional<ProgrammerConfig> ProgrammerConfig::fromJson(
    const nlohmann::json& config)
{
    const nlohmann::json::object_t* obj =
        config.get_ptr<const nlohmann::json::object_t*>();

    if (obj == nullptr)
    {
        lg2::error("programmer config was not an object");
        return std::nullopt;
    }

    try
    {
        return ProgrammerConfig(*obj);
    }
    catch (const std::invalid_argument& e)
    {
        lg2::error("Invalid programmer config: {ERR}", "ERR", e.what());
        return std::nullopt;
    }
}

std::optional<ProgrammerConfig> ProgrammerConfig::load(
    const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        // File is optional.
        lg2::info("No programmer config at {PATH}, using defaults", "PATH",
                  path.string());
        return ProgrammerConfig();
    }

    std::ifstream configStream(path);
    if (!configStream.good())
    {
        lg2::error("Cannot open programmer config {PATH}", "PATH",
                   path.string());
        return std::nullopt;
    }

    nlohmann::json data = nlohmann::json::parse(configStream, nullptr, false);
    if (data.is_discarded())
    {
        lg2::error("Illegal programmer config {PATH}, cannot parse JSON",
                   "PATH", path.string());
        return std::nullopt;
    }
    return fromJson(data);
}

ProgrammerConfig::ProgrammerConfig(const nlohmann::json::object_t& config)
{
    vendorId = static_cast<uint16_t>(
        getNumberProp(config, "VendorId", vendorId, 0xFFFF));
    productId = static_cast<uint16_t>(
        getNumberProp(config, "ProductId", productId, 0xFFFF));
    i2cAddress = static_cast<uint8_t>(
        getNumberProp(config, "I2CAddress", i2cAddress, 0x7F));

    chunkSize = static_cast<uint8_t>(
        getNumberProp(config, "ChunkSize", chunkSize, 16));
    if (chunkSize == 0 || spdPageSize % chunkSize != 0)
    {
        throw std::invalid_argument(
            std::format("property 'ChunkSize' {} does not divide a page",
                        chunkSize));
    }

    responseTimeout =
        getDelayProp(config, "ResponseTimeoutMs", responseTimeout);
    commandDelay = getDelayProp(config, "CommandDelayMs", commandDelay);
    writeDelay = getDelayProp(config, "WriteDelayMs", writeDelay);
    activationDelay =
        getDelayProp(config, "ActivationDelayMs", activationDelay);

    if (const auto* value = findConfigProp(config, "PageSelectDelayMs"))
    {
        const auto* delays = value->get_ptr<const nlohmann::json::array_t*>();
        if (delays == nullptr || delays->size() != pageSelectDelay.size())
        {
            throw std::invalid_argument(
                "property 'PageSelectDelayMs' must be an array of 2 delays");
        }
        for (size_t page = 0; page < pageSelectDelay.size(); page++)
        {
            pageSelectDelay[page] =
                getDelayProp((*delays)[page], "PageSelectDelayMs");
        }
    }

    chunkRetries = getNumberProp(config, "ChunkRetries", chunkRetries, 100);
    if (chunkRetries == 0)
    {
        throw std::invalid_argument(
            "property 'ChunkRetries' must be at least 1");
    }
    retryDelay = getDelayProp(config, "RetryDelayMs", retryDelay);
    blankPageRetries =
        getNumberProp(config, "BlankPageRetries", blankPageRetries, 100);

    if (const auto* value = findConfigProp(config, "AcceptBlankPages"))
    {
        const auto* flag = value->get_ptr<const bool*>();
        if (flag == nullptr)
        {
            throw std::invalid_argument(
                "property 'AcceptBlankPages' has wrong type");
        }
        acceptBlankPages = *flag;
    }

    devicePath = getPathProp(config, "DevicePath", devicePath);
    manufacturerTable =
        getPathProp(config, "ManufacturerTable", manufacturerTable);
}

nlohmann::json ProgrammerConfig::toJson() const
{
    nlohmann::json::object_t res;

    res["VendorId"] = std::format("0x{:04X}", vendorId);
    res["ProductId"] = std::format("0x{:04X}", productId);
    res["I2CAddress"] = std::format("0x{:02X}", i2cAddress);
    res["ChunkSize"] = chunkSize;
    res["ResponseTimeoutMs"] = responseTimeout.count();
    res["CommandDelayMs"] = commandDelay.count();
    res["WriteDelayMs"] = writeDelay.count();
    res["ActivationDelayMs"] = activationDelay.count();
    res["PageSelectDelayMs"] = nlohmann::json::array_t{
        pageSelectDelay[0].count(), pageSelectDelay[1].count()};
    res["ChunkRetries"] = chunkRetries;
    res["RetryDelayMs"] = retryDelay.count();
    res["BlankPageRetries"] = blankPageRetries;
    res["AcceptBlankPages"] = acceptBlankPages;
    res["DevicePath"] = devicePath.string();
    res["ManufacturerTable"] = manufacturerTable.string();

    return res;
}

} // namespace spd_tools
