// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace spd_tools
{

enum class ErrorKind
{
    deviceNotFound,
    deviceBusy,
    deviceIo,
    readFault,
    writeVerificationFailed,
    invalidFileSize,
    rangeError,
    encodingError,
    cancelled,
};

const char* errorKindName(ErrorKind kind) noexcept;

// Base of every call-aborting failure. Advisory conditions (non DDR4 image,
// checksum mismatch) are never thrown, they are flagged on the decoded record.
class SpdError : public std::runtime_error
{
  public:
    SpdError(ErrorKind kind, const std::string& message) :
        std::runtime_error(message), errorKind(kind)
    {}

    ErrorKind kind() const noexcept
    {
        return errorKind;
    }

  private:
    ErrorKind errorKind;
};

struct DeviceNotFound final : public SpdError
{
    explicit DeviceNotFound(const std::string& message) :
        SpdError(ErrorKind::deviceNotFound, message)
    {}
};

struct DeviceBusy final : public SpdError
{
    explicit DeviceBusy(const std::string& message) :
        SpdError(ErrorKind::deviceBusy, message)
    {}
};

struct DeviceIoError final : public SpdError
{
    explicit DeviceIoError(const std::string& message) :
        SpdError(ErrorKind::deviceIo, message)
    {}
};

// A page or chunk could not be read back, offset is absolute (0..511).
struct ReadFault final : public SpdError
{
    ReadFault(size_t offset, const std::string& message);

    size_t offset;
};

struct WriteVerificationFailed final : public SpdError
{
    WriteVerificationFailed(size_t offset, uint8_t expected, uint8_t actual);

    // first mismatching absolute offset
    size_t offset;
    uint8_t expected;
    uint8_t actual;
};

struct InvalidFileSize final : public SpdError
{
    explicit InvalidFileSize(size_t actualSize);

    size_t actualSize;
};

struct RangeError final : public SpdError
{
    RangeError(std::string field, const std::string& message);

    std::string field;
};

struct EncodingError final : public SpdError
{
    EncodingError(std::string field, const std::string& message);

    std::string field;
};

struct OperationCancelled final : public SpdError
{
    explicit OperationCancelled(size_t transferred);

    // bytes handled before the cancellation was observed
    size_t transferred;
};

} // namespace spd_tools
