// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#pragma once

#include "spd_tools/document.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace spd_tools
{

// Names setField() accepts besides raw offsets, DDR4 fields first, then the
// fields of XMP profile 1 and 2 prefixed "xmp1." / "xmp2.".
std::vector<std::string> editableFields();

// Sets one decoded field from its text form and patches the document through
// the codecs:
//   partNumber           text, 7-bit ASCII, at most 20 characters
//   serialNumber         4 hex bytes, "1A2B3C4D" or "1A 2B 3C 4D"
//   manufacturerId       continuation and code, "0x80CE"
//   manufacturingDate    "2024-17" (year-week)
//   casLatencies         "16,18,20"
//   dataRate             MT/s, programs tCKmin
//   tCKmin, tAA, ...     picoseconds
//   xmp1.voltage         millivolts
//   xmp1.enabled         0 or 1
//   0x140                raw byte at an offset
// Throws RangeError for an unknown field or unparsable value, and whatever
// the codecs throw for values the image cannot hold.
void setField(SpdDocument& document, std::string_view name,
              std::string_view value);

} // namespace spd_tools
