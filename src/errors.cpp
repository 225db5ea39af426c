// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#include "spd_tools/errors.hpp"

#include <format>
#include <utility>

namespace spd_tools
{

const char* errorKindName(ErrorKind kind) noexcept
{
    switch (kind)
    {
        case ErrorKind::deviceNotFound:
            return "DeviceNotFound";
        case ErrorKind::deviceBusy:
            return "DeviceBusy";
        case ErrorKind::deviceIo:
            return "DeviceIoError";
        case ErrorKind::readFault:
            return "ReadFault";
        case ErrorKind::writeVerificationFailed:
            return "WriteVerificationFailed";
        case ErrorKind::invalidFileSize:
            return "InvalidFileSize";
        case ErrorKind::rangeError:
            return "RangeError";
        case ErrorKind::encodingError:
            return "EncodingError";
        case ErrorKind::cancelled:
            return "OperationCancelled";
    }
    return "Unknown";
}

ReadFault::ReadFault(size_t offset, const std::string& message) :
    SpdError(ErrorKind::readFault,
             std::format("read fault at offset 0x{:03X}: {}", offset, message)),
    offset(offset)
{}

WriteVerificationFailed::WriteVerificationFailed(size_t offset,
                                                 uint8_t expected,
                                                 uint8_t actual) :
    SpdError(ErrorKind::writeVerificationFailed,
             std::format("write verification failed at offset 0x{:03X}: "
                         "expected 0x{:02X}, read back 0x{:02X}",
                         offset, expected, actual)),
    offset(offset), expected(expected), actual(actual)
{}

InvalidFileSize::InvalidFileSize(size_t actualSize) :
    SpdError(ErrorKind::invalidFileSize,
             std::format("SPD image must be 512 bytes, got {}", actualSize)),
    actualSize(actualSize)
{}

RangeError::RangeError(std::string field, const std::string& message) :
    SpdError(ErrorKind::rangeError, std::format("{}: {}", field, message)),
    field(std::move(field))
{}

EncodingError::EncodingError(std::string field, const std::string& message) :
    SpdError(ErrorKind::encodingError, std::format("{}: {}", field, message)),
    field(std::move(field))
{}

OperationCancelled::OperationCancelled(size_t transferred) :
    SpdError(ErrorKind::cancelled,
             std::format("operation cancelled after {} bytes", transferred)),
    transferred(transferred)
{}

} // namespace spd_tools
