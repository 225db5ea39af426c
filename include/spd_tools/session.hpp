// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#pragma once

#include "spd_tools/config.hpp"
#include "spd_tools/hid_link.hpp"
#include "spd_tools/spd_image.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace spd_tools
{

enum class SessionState
{
    disconnected,
    connecting,
    connected,
    reading,
    writing,
};

std::string_view sessionStateName(SessionState state);

// Called after every chunk with (bytes transferred, total bytes).
using ProgressFunc = std::function<void(size_t, size_t)>;

using LinkOpener =
    std::function<std::unique_ptr<HidLink>(const ProgrammerConfig&)>;

// One open programmer. At most one read or write runs at a time, a second
// request fails with DeviceBusy instead of queueing. Errors abort the running
// operation and leave the session connected.
class Session
{
  public:
    // Throws DeviceNotFound / DeviceBusy / DeviceIoError from the opener.
    static std::unique_ptr<Session> connect(const ProgrammerConfig& config,
                                            const LinkOpener& opener);

    // Opens the hidraw programmer.
    static std::unique_ptr<Session> connect(const ProgrammerConfig& config);

    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) = delete;
    Session& operator=(Session&&) = delete;

    SessionState state() const
    {
        return currentState.load();
    }

    // Page 0 then page 1, each selected before its bytes are read. A page
    // that reads back all zero is read again up to BlankPageRetries times
    // before ReadFault. Cancellation is honoured between chunks.
    RawImage readImage(const ProgressFunc& progress = {},
                       std::stop_token stop = {});

    // Writes each page in chunks and verifies it by reading it back. The
    // first mismatch raises WriteVerificationFailed, nothing is retried.
    void writeImage(const RawImage& image, const ProgressFunc& progress = {},
                    std::stop_token stop = {});

    // DeviceBusy while a read or write holds the session.
    void disconnect();

  private:
    explicit Session(const ProgrammerConfig& config);

    class Operation;

    static constexpr size_t maxStaleReplies = 16;

    void drainStaleReplies();
    std::string transact(std::string_view command,
                         std::chrono::milliseconds delay);
    void activate();
    void selectPage(size_t page);
    std::vector<uint8_t> readChunk(size_t page, uint8_t offset);
    void writeChunk(uint8_t offset, std::span<const uint8_t> data);
    void readPage(size_t page, std::span<uint8_t> out, size_t base,
                  size_t total, const ProgressFunc& progress,
                  const std::stop_token& stop);
    void close() noexcept;

    ProgrammerConfig config;
    std::unique_ptr<HidLink> link;
    std::atomic<SessionState> currentState{SessionState::disconnected};
    std::atomic<bool> busy{false};
};

} // namespace spd_tools
