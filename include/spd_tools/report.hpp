// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#pragma once

#include "spd_tools/ddr4.hpp"
#include "spd_tools/document.hpp"
#include "spd_tools/manufacturer.hpp"
#include "spd_tools/xmp.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace spd_tools
{

// Decoded DDR4 fields. Members the decoder left empty are reported as null,
// timings in picoseconds.
nlohmann::json recordToJson(const ddr4::Ddr4Record& record,
                            const ManufacturerLookup& lookup);

nlohmann::json xmpToJson(const xmp::XmpBlock& block);

// { "Source", "RawData", "Decoded", "Advisories", "Xmp", "Modifications" }
nlohmann::json documentReport(const SpdDocument& document,
                              const ManufacturerLookup& lookup);

// Human readable version of documentReport().
std::string textReport(const SpdDocument& document,
                       const ManufacturerLookup& lookup);

} // namespace spd_tools
