// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#pragma once

#include "spd_tools/byte_field.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Encodings shared by the DDR4 base block and the XMP profiles, JESD21-C
// Annex L.
namespace spd_tools::jedec
{

// Calculate the crc16 for the SPD content. The crc16 algorithm is defined
// in JEDEC
uint16_t calcCRC16(std::span<const uint8_t> data);

// Medium / fine timebase pair in picoseconds.
struct Timebase
{
    int32_t mediumPs;
    int32_t finePs;

    bool operator==(const Timebase&) const = default;
};

// The only timebase DDR4 defines (MTB 125 ps, FTB 1 ps).
constexpr Timebase ddr4Timebase{125, 1};

// byte 17 [3:2]
// 00: 125 ps
// 01: 250 ps
// 10: 1 ns
// 11: Reserved
std::optional<int32_t> mediumTimebasePs(uint8_t code);

// byte 17 [1:0]
// 00: 1 ps
// All others reserved
std::optional<int32_t> fineTimebasePs(uint8_t code);

std::optional<uint8_t> mediumTimebaseCode(int32_t ps);

// A timing parameter stored as medium timebase units, optionally widened by
// an upper bit field and corrected by a signed fine offset:
// ps = units * mediumPs + fine * finePs
struct TimingSpec
{
    std::string_view name;
    FieldSpec medium;
    std::optional<FieldSpec> upper;
    std::optional<FieldSpec> fine;
};

int32_t decodeTiming(std::span<const uint8_t> buffer, const TimingSpec& spec,
                     const Timebase& timebase);

// The medium value is rounded to the nearest unit and the remainder stored as
// fine offset. Without a fine field the value is rounded up.
void encodeTiming(std::span<uint8_t> buffer, const TimingSpec& spec,
                  const Timebase& timebase, int32_t ps);

// CAS latency bitmap, 4 bytes little endian. Bit 31 selects the range:
// 0: bit 0 is CL7  (CL7 ~ CL36)
// 1: bit 0 is CL23 (CL23 ~ CL52)
// Bit 30 is reserved and left untouched.
constexpr uint32_t casRangeBit = 0x80000000U;
constexpr uint32_t casBitmapMask = 0x3FFFFFFFU;

std::vector<uint8_t> decodeCasLatencies(uint32_t bitmap);

uint32_t encodeCasLatencies(std::string_view field,
                            const std::vector<uint8_t>& latencies);

// Clock frequency in MHz for a cycle time.
double clockMhz(int32_t tckPs);

// Data rate in MT/s (two transfers per clock).
double dataRateMts(int32_t tckPs);

// Cycle time to program for a data rate, rounded down so the resulting rate
// is never below the request.
int32_t tckForDataRate(uint32_t mts);

// Fastest standard (JEDEC or common XMP) speed bin the cycle time supports.
std::optional<uint16_t> speedGrade(int32_t tckPs);

// Number of clocks needed to honour a timing, the JEDEC rounding algorithm
// with its 2.5% guard band.
uint32_t clocksFor(int32_t timingPs, int32_t tckPs);

// BCD byte to value, nullopt if a nibble is not a decimal digit.
std::optional<uint8_t> bcdToInt(uint8_t byte);

uint8_t intToBcd(uint8_t value);

} // namespace spd_tools::jedec
