// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#include "spd_tools/session.hpp"

#include "spd_tools/errors.hpp"
#include "spd_tools/hidraw_link.hpp"
#include "spd_tools/protocol.hpp"

#include <phosphor-logging/lg2.hpp>

#include <algorithm>
#include <array>
#include <format>
#include <iterator>
#include <thread>

namespace spd_tools
{

namespace
{

void pause(std::chrono::milliseconds delay)
{
    if (delay.count() > 0)
    {
        std::this_thread::sleep_for(delay);
    }
}

void notify(const ProgressFunc& progress, size_t transferred, size_t total)
{
    if (progress)
    {
        progress(transferred, total);
    }
}

void checkStop(const std::stop_token& stop, size_t transferred)
{
    if (stop.stop_requested())
    {
        lg2::info("SPD transfer cancelled after {BYTES} bytes", "BYTES",
                  transferred);
        throw OperationCancelled(transferred);
    }
}

bool allZero(std::span<const uint8_t> bytes)
{
    return std::ranges::all_of(bytes, [](uint8_t b) { return b == 0; });
}

} // namespace

std::string_view sessionStateName(SessionState state)
{
    switch (state)
    {
        case SessionState::disconnected:
            return "Disconnected";
        case SessionState::connecting:
            return "Connecting";
        case SessionState::connected:
            return "Connected";
        case SessionState::reading:
            return "Reading";
        case SessionState::writing:
            return "Writing";
    }
    return "Unknown";
}

// Claims the session for one read or write and hands it back in the
// Connected state however the operation ends.
class Session::Operation
{
  public:
    Operation(Session& session, SessionState state) : session(session)
    {
        bool expected = false;
        if (!session.busy.compare_exchange_strong(expected, true))
        {
            lg2::error("SPD programmer is busy with another transfer");
            throw DeviceBusy("another read or write is in progress");
        }
        if (!session.link)
        {
            session.busy = false;
            throw DeviceIoError("session is disconnected");
        }
        session.currentState = state;
    }

    ~Operation()
    {
        session.currentState = SessionState::connected;
        session.busy = false;
    }

    Operation(const Operation&) = delete;
    Operation& operator=(const Operation&) = delete;

  private:
    Session& session;
};

Session::Session(const ProgrammerConfig& config) : config(config) {}

Session::~Session()
{
    close();
}

std::unique_ptr<Session> Session::connect(const ProgrammerConfig& config,
                                          const LinkOpener& opener)
{
    // "std::make_unique<Session>()" won't work because the constructor is
    // private.
    std::unique_ptr<Session> session(new Session(config));
    session->currentState = SessionState::connecting;
    session->link = opener(config);
    if (!session->link)
    {
        throw DeviceNotFound("no programmer link was opened");
    }
    session->currentState = SessionState::connected;
    return session;
}

std::unique_ptr<Session> Session::connect(const ProgrammerConfig& config)
{
    return connect(config, &HidrawLink::open);
}

void Session::disconnect()
{
    bool expected = false;
    if (!busy.compare_exchange_strong(expected, true))
    {
        lg2::error("Refusing to close the SPD programmer during a transfer");
        throw DeviceBusy("cannot disconnect during a transfer");
    }
    close();
    busy = false;
}

void Session::close() noexcept
{
    if (link)
    {
        lg2::info("Closing SPD programmer session");
    }
    link.reset();
    currentState = SessionState::disconnected;
}

void Session::drainStaleReplies()
{
    // Replies carry no offset, a late one must not be taken for the answer
    // to the next command.
    for (size_t i = 0; i < maxStaleReplies; i++)
    {
        std::vector<uint8_t> report =
            link->readReport(std::chrono::milliseconds{0});
        if (report.empty())
        {
            return;
        }
        lg2::warning("Discarding late programmer reply '{REPLY}'", "REPLY",
                     protocol::decodeReply(report));
    }
    throw DeviceIoError(std::format("programmer keeps sending reports, more "
                                    "than {} unsolicited",
                                    maxStaleReplies));
}

std::string Session::transact(std::string_view command,
                              std::chrono::milliseconds delay)
{
    drainStaleReplies();
    link->writeReport(protocol::encodeReport(command));
    pause(delay);
    std::vector<uint8_t> report = link->readReport(config.responseTimeout);
    if (report.empty())
    {
        lg2::debug("No reply to {CMD}", "CMD", std::string(command));
        return {};
    }
    return protocol::decodeReply(report);
}

void Session::activate()
{
    transact(protocol::activationCommand, config.commandDelay);
    pause(config.activationDelay);
}

void Session::selectPage(size_t page)
{
    lg2::info("Selecting SPD page {PAGE}", "PAGE", page);
    transact(protocol::pageSelectCommands[page], config.commandDelay);
    pause(config.pageSelectDelay[page]);
}

std::vector<uint8_t> Session::readChunk(size_t page, uint8_t offset)
{
    std::string command =
        protocol::readCommand(config.i2cAddress, offset, config.chunkSize);
    for (unsigned attempt = 1; attempt <= config.chunkRetries; attempt++)
    {
        std::string reply = transact(command, config.commandDelay);
        auto bytes = protocol::parseReadReply(reply, config.chunkSize);
        if (bytes)
        {
            return *bytes;
        }
        lg2::warning("Bad reply '{REPLY}' reading SPD offset {OFFSET}, "
                     "attempt {ATTEMPT}",
                     "REPLY", reply, "OFFSET", lg2::hex,
                     (page * spdPageSize) + offset, "ATTEMPT", attempt);
        pause(config.retryDelay);
    }

    size_t absolute = (page * spdPageSize) + offset;
    lg2::error("Giving up on SPD offset {OFFSET}", "OFFSET", lg2::hex,
               absolute);
    throw ReadFault(absolute,
                    std::format("no valid reply after {} attempts",
                                config.chunkRetries));
}

void Session::writeChunk(uint8_t offset, std::span<const uint8_t> data)
{
    transact(protocol::writeCommand(config.i2cAddress, offset, data),
             config.writeDelay);
}

void Session::readPage(size_t page, std::span<uint8_t> out, size_t base,
                       size_t total, const ProgressFunc& progress,
                       const std::stop_token& stop)
{
    for (unsigned attempt = 0;; attempt++)
    {
        selectPage(page);
        for (size_t offset = 0; offset < spdPageSize;
             offset += config.chunkSize)
        {
            checkStop(stop, base + offset);
            std::vector<uint8_t> chunk =
                readChunk(page, static_cast<uint8_t>(offset));
            std::ranges::copy(chunk, out.begin() + offset);
            notify(progress, base + offset + chunk.size(), total);
        }

        if (config.acceptBlankPages || !allZero(out))
        {
            return;
        }
        if (attempt >= config.blankPageRetries)
        {
            lg2::error("SPD page {PAGE} read back all zero {COUNT} times",
                       "PAGE", page, "COUNT", attempt + 1);
            throw ReadFault(page * spdPageSize,
                            std::format("page {} read back all zero, check "
                                        "the module contact",
                                        page));
        }
        lg2::warning("SPD page {PAGE} read back all zero, retrying", "PAGE",
                     page);
    }
}

RawImage Session::readImage(const ProgressFunc& progress, std::stop_token stop)
{
    Operation operation(*this, SessionState::reading);

    RawImage image{};
    activate();
    for (size_t page = 0; page < spdPageCount; page++)
    {
        auto out = std::span(image).subspan(page * spdPageSize, spdPageSize);
        readPage(page, out, page * spdPageSize, spdImageSize, progress, stop);
    }
    lg2::info("Read {SIZE} byte SPD image", "SIZE", image.size());
    return image;
}

void Session::writeImage(const RawImage& image, const ProgressFunc& progress,
                         std::stop_token stop)
{
    Operation operation(*this, SessionState::writing);

    // every byte is written once and read back once
    const size_t total = spdImageSize * 2;
    size_t transferred = 0;

    activate();
    for (size_t page = 0; page < spdPageCount; page++)
    {
        selectPage(page);
        auto expected = pageOf(image, page);
        for (size_t offset = 0; offset < spdPageSize;
             offset += config.chunkSize)
        {
            checkStop(stop, transferred);
            writeChunk(static_cast<uint8_t>(offset),
                       expected.subspan(offset, config.chunkSize));
            transferred += config.chunkSize;
            notify(progress, transferred, total);
        }

        std::array<uint8_t, spdPageSize> actual{};
        for (size_t offset = 0; offset < spdPageSize;
             offset += config.chunkSize)
        {
            checkStop(stop, transferred);
            std::vector<uint8_t> chunk =
                readChunk(page, static_cast<uint8_t>(offset));
            std::ranges::copy(chunk, actual.begin() + offset);
            transferred += chunk.size();
            notify(progress, transferred, total);
        }

        auto [want, got] = std::ranges::mismatch(expected, actual);
        if (want != expected.end())
        {
            size_t offset = (page * spdPageSize) +
                            std::distance(expected.begin(), want);
            lg2::error("SPD write verification failed at {OFFSET}: wrote "
                       "{EXPECTED}, read {ACTUAL}",
                       "OFFSET", lg2::hex, offset, "EXPECTED", lg2::hex, *want,
                       "ACTUAL", lg2::hex, *got);
            throw WriteVerificationFailed(offset, *want, *got);
        }
        lg2::info("SPD page {PAGE} written and verified", "PAGE", page);
    }
}

} // namespace spd_tools
