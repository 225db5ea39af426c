// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#include "spd_tools/jedec.hpp"

#include "spd_tools/errors.hpp"

#include <boost/crc.hpp>

#include <algorithm>
#include <array>
#include <format>
#include <string>
#include <utility>

namespace spd_tools::jedec
{

namespace
{

struct SpeedBin
{
    uint16_t mts;
    int32_t tckPs;
};

// Cycle times as programmed in SPD/XMP for each bin, fastest first.
constexpr std::array<SpeedBin, 19> speedBins = {{
    {5000, 400},
    {4800, 416},
    {4600, 434},
    {4400, 454},
    {4266, 468},
    {4133, 484},
    {4000, 500},
    {3866, 517},
    {3733, 535},
    {3600, 555},
    {3466, 577},
    {3333, 600},
    {3200, 625},
    {2933, 682},
    {2666, 750},
    {2400, 833},
    {2133, 938},
    {1866, 1071},
    {1600, 1250},
}};

constexpr uint8_t casLowRangeBase = 7;
constexpr uint8_t casHighRangeBase = 23;
constexpr uint8_t casBitCount = 30;

} // namespace

uint16_t calcCRC16(std::span<const uint8_t> data)
{
    // crc_xmodem_t == crc_optimal<16, 0x1021, 0, 0, false, false>
    boost::crc_xmodem_t result;
    result.process_bytes(data.data(), data.size());
    return result.checksum();
}

std::optional<int32_t> mediumTimebasePs(uint8_t code)
{
    switch (code & 0x03)
    {
        case 0x00:
            return 125;
        case 0x01:
            return 250;
        case 0x02:
            return 1000;
        default:
            return std::nullopt;
    }
}

std::optional<int32_t> fineTimebasePs(uint8_t code)
{
    if ((code & 0x03) == 0x00)
    {
        return 1;
    }
    return std::nullopt;
}

std::optional<uint8_t> mediumTimebaseCode(int32_t ps)
{
    for (uint8_t code = 0; code < 3; code++)
    {
        if (mediumTimebasePs(code) == ps)
        {
            return code;
        }
    }
    return std::nullopt;
}

int32_t decodeTiming(std::span<const uint8_t> buffer, const TimingSpec& spec,
                     const Timebase& timebase)
{
    int32_t units = static_cast<int32_t>(readUnsigned(buffer, spec.medium));
    if (spec.upper)
    {
        units |= static_cast<int32_t>(readUnsigned(buffer, *spec.upper)) << 8;
    }
    int32_t fine = spec.fine ? readSigned(buffer, *spec.fine) : 0;
    return (units * timebase.mediumPs) + (fine * timebase.finePs);
}

void encodeTiming(std::span<uint8_t> buffer, const TimingSpec& spec,
                  const Timebase& timebase, int32_t ps)
{
    if (ps < 0)
    {
        throw RangeError(std::string(spec.name),
                         std::format("negative timing {} ps", ps));
    }

    int32_t units = 0;
    int32_t fine = 0;
    if (spec.fine)
    {
        units = (ps + (timebase.mediumPs / 2)) / timebase.mediumPs;
        int32_t remainder = ps - (units * timebase.mediumPs);
        if (remainder % timebase.finePs != 0)
        {
            throw RangeError(std::string(spec.name),
                             std::format("{} ps is not a multiple of the fine "
                                         "timebase",
                                         ps));
        }
        fine = remainder / timebase.finePs;
    }
    else
    {
        units = (ps + timebase.mediumPs - 1) / timebase.mediumPs;
    }

    uint32_t maxUnits = spec.medium.maxValue();
    if (spec.upper)
    {
        maxUnits |= spec.upper->maxValue() << 8;
    }
    if (static_cast<uint32_t>(units) > maxUnits)
    {
        throw RangeError(std::string(spec.name),
                         std::format("{} ps needs {} timebase units, at most "
                                     "{} fit",
                                     ps, units, maxUnits));
    }

    // Check everything before touching the buffer so a failed encode leaves
    // it unchanged.
    if (spec.fine)
    {
        unsigned bits = spec.fine->width();
        if (fine < -(1 << (bits - 1)) || fine >= (1 << (bits - 1)))
        {
            throw RangeError(std::string(spec.name),
                             std::format("fine offset {} does not fit", fine));
        }
    }

    writeUnsigned(buffer, spec.medium,
                  static_cast<uint32_t>(units) & spec.medium.maxValue());
    if (spec.upper)
    {
        writeUnsigned(buffer, *spec.upper, static_cast<uint32_t>(units) >> 8);
    }
    if (spec.fine)
    {
        writeSigned(buffer, *spec.fine, fine);
    }
}

std::vector<uint8_t> decodeCasLatencies(uint32_t bitmap)
{
    const uint8_t kBase = (bitmap & casRangeBit) != 0U ? casHighRangeBase
                                                        : casLowRangeBase;
    std::vector<uint8_t> result;
    for (uint8_t bit = 0; bit < casBitCount; bit++)
    {
        if ((bitmap & (1U << bit)) != 0U)
        {
            result.push_back(kBase + bit);
        }
    }
    return result;
}

uint32_t encodeCasLatencies(std::string_view field,
                            const std::vector<uint8_t>& latencies)
{
    if (latencies.empty())
    {
        return 0;
    }

    auto [lowest, highest] = std::ranges::minmax(latencies);
    uint8_t base = 0;
    uint32_t bitmap = 0;
    if (lowest >= casLowRangeBase && highest < casLowRangeBase + casBitCount)
    {
        base = casLowRangeBase;
    }
    else if (lowest >= casHighRangeBase &&
             highest < casHighRangeBase + casBitCount)
    {
        base = casHighRangeBase;
        bitmap |= casRangeBit;
    }
    else
    {
        throw RangeError(std::string(field),
                         std::format("CL{}..CL{} does not fit one CAS latency "
                                     "range",
                                     lowest, highest));
    }

    for (uint8_t cl : latencies)
    {
        bitmap |= 1U << (cl - base);
    }
    return bitmap;
}

double clockMhz(int32_t tckPs)
{
    if (tckPs <= 0)
    {
        return 0.0;
    }
    return 1000000.0 / tckPs;
}

double dataRateMts(int32_t tckPs)
{
    return clockMhz(tckPs) * 2;
}

int32_t tckForDataRate(uint32_t mts)
{
    if (mts == 0)
    {
        throw RangeError("dataRate", "data rate must be positive");
    }
    auto found = std::ranges::find(speedBins, mts, &SpeedBin::mts);
    if (found != speedBins.end())
    {
        return found->tckPs;
    }
    return static_cast<int32_t>(2000000U / mts);
}

std::optional<uint16_t> speedGrade(int32_t tckPs)
{
    if (tckPs <= 0)
    {
        return std::nullopt;
    }
    for (const auto& bin : speedBins)
    {
        if (bin.tckPs >= tckPs)
        {
            return bin.mts;
        }
    }
    return std::nullopt;
}

uint32_t clocksFor(int32_t timingPs, int32_t tckPs)
{
    if (timingPs <= 0 || tckPs <= 0)
    {
        return 0;
    }
    // Temp = tXX * 1000 / tCK; nCK = (Temp + 974) / 1000
    int64_t temp = (static_cast<int64_t>(timingPs) * 1000) / tckPs;
    return static_cast<uint32_t>((temp + 974) / 1000);
}

std::optional<uint8_t> bcdToInt(uint8_t byte)
{
    uint8_t high = byte >> 4;
    uint8_t low = byte & 0x0F;
    if (high > 9 || low > 9)
    {
        return std::nullopt;
    }
    return static_cast<uint8_t>((high * 10) + low);
}

uint8_t intToBcd(uint8_t value)
{
    return static_cast<uint8_t>(((value / 10) << 4) | (value % 10));
}

} // namespace spd_tools::jedec
