// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 spd-tools authors

#include "spd_tools/config.hpp"
#include "spd_tools/document.hpp"
#include "spd_tools/errors.hpp"
#include "spd_tools/field_edit.hpp"
#include "spd_tools/manufacturer.hpp"
#include "spd_tools/report.hpp"
#include "spd_tools/session.hpp"
#include "spd_tools/spd_image.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <phosphor-logging/lg2.hpp>

#include <algorithm>
#include <array>
#include <csignal>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <print>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace spd_tools;

namespace
{

constexpr int exitFailure = 1;
constexpr int exitUsage = 2;

struct Options
{
    std::filesystem::path configPath = SPD_TOOLS_CONFIG_FILE;
    std::filesystem::path output;
    std::filesystem::path backupPath = "spd-backup.bin";
    bool confirm = false;
    std::vector<std::string> positional;
};

void usage()
{
    std::println(stderr, "usage: spd-tool [--config <file>] <command> ...\n"
                         "\n"
                         "  info <file>                          decode an image\n"
                         "  json <file>                          decode an image as JSON\n"
                         "  read <out>                           read the module\n"
                         "  write <in> [--backup <file>] [--confirm]\n"
                         "                                       write the module\n"
                         "  verify <file>                        compare the module with a file\n"
                         "  set <file> <field> <value> -o <out>  edit one field\n"
                         "  diff <a> <b>                         compare two images\n"
                         "  fields                               list editable fields");
}

std::optional<Options> parseOptions(int argc, char** argv)
{
    Options options;
    std::vector<std::string_view> args(argv + 1, argv + argc);
    for (size_t i = 0; i < args.size(); i++)
    {
        std::string_view arg = args[i];
        bool hasValue = i + 1 < args.size();
        if ((arg == "--config" || arg == "-c") && hasValue)
        {
            options.configPath = args[++i];
        }
        else if ((arg == "--output" || arg == "-o") && hasValue)
        {
            options.output = args[++i];
        }
        else if (arg == "--backup" && hasValue)
        {
            options.backupPath = args[++i];
        }
        else if (arg == "--confirm")
        {
            options.confirm = true;
        }
        else if (arg.starts_with("-") && arg.size() > 1)
        {
            std::println(stderr, "unknown option {}", arg);
            return std::nullopt;
        }
        else
        {
            options.positional.emplace_back(arg);
        }
    }
    return options;
}

std::unique_ptr<ManufacturerLookup> loadManufacturers(
    const ProgrammerConfig& config)
{
    auto table = JsonManufacturerTable::load(config.manufacturerTable);
    if (!table)
    {
        lg2::warning("Manufacturer names unavailable, showing raw IDs");
        return std::make_unique<JsonManufacturerTable>();
    }
    return std::make_unique<JsonManufacturerTable>(std::move(*table));
}

void printProgress(std::string_view verb, size_t transferred, size_t total)
{
    std::print(stderr, "\r{} {:3}/{} bytes", verb, transferred, total);
    if (transferred == total)
    {
        std::println(stderr, "");
    }
}

// Runs a device transfer on a worker thread while the main thread waits for
// SIGINT/SIGTERM, which cancel the transfer at the next chunk boundary.
void runTransfer(const std::function<void(std::stop_token)>& transfer)
{
    boost::asio::io_context io;
    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    std::stop_source stop;

    signals.async_wait(
        [&stop](const boost::system::error_code& ec, int signal) {
            if (ec)
            {
                return;
            }
            lg2::info("Signal {SIGNAL} received, cancelling transfer",
                      "SIGNAL", signal);
            stop.request_stop();
        });

    std::exception_ptr failure;
    std::jthread worker([&]() {
        try
        {
            transfer(stop.get_token());
        }
        catch (...)
        {
            failure = std::current_exception();
        }
        boost::asio::post(io, [&signals]() { signals.cancel(); });
    });

    io.run();
    worker.join();
    if (failure)
    {
        std::rethrow_exception(failure);
    }
}

RawImage readModule(Session& session)
{
    RawImage image{};
    runTransfer([&](std::stop_token stop) {
        image = session.readImage(
            [](size_t done, size_t total) {
                printProgress("Reading", done, total);
            },
            stop);
    });
    return image;
}

void printChanges(const std::vector<ByteChange>& changes)
{
    for (const auto& change : changes)
    {
        std::println("0x{:03X}: 0x{:02X} -> 0x{:02X}", change.offset,
                     change.before, change.after);
    }
    std::println("{} byte(s) differ", changes.size());
}

int cmdInfo(const Options& options, const ProgrammerConfig& config)
{
    SpdDocument document(importImage(options.positional.at(1)),
                         options.positional.at(1));
    auto lookup = loadManufacturers(config);
    std::print("{}", textReport(document, *lookup));
    return 0;
}

int cmdJson(const Options& options, const ProgrammerConfig& config)
{
    SpdDocument document(importImage(options.positional.at(1)),
                         options.positional.at(1));
    auto lookup = loadManufacturers(config);
    std::println("{}", documentReport(document, *lookup).dump(4));
    return 0;
}

int cmdRead(const Options& options, const ProgrammerConfig& config)
{
    auto session = Session::connect(config);
    RawImage image = readModule(*session);
    exportImage(options.positional.at(1), image);
    std::println("Saved {} bytes to {}", image.size(),
                 options.positional.at(1));
    return 0;
}

int cmdWrite(const Options& options, const ProgrammerConfig& config)
{
    RawImage target = importImage(options.positional.at(1));
    auto session = Session::connect(config);

    SpdDocument document(readModule(*session), "device");
    exportImage(options.backupPath, document.backup());
    std::println("Module backup saved to {}", options.backupPath.string());

    document.setBytes(0, target);
    RawImage image = document.commit();
    auto changes = compareImages(document.backup(), image);
    printChanges(changes);
    if (changes.empty())
    {
        std::println("Module already holds this image, nothing to write");
        return 0;
    }
    if (!options.confirm)
    {
        std::println("Run again with --confirm to write the module");
        return 0;
    }

    runTransfer([&](std::stop_token stop) {
        session->writeImage(
            image,
            [](size_t done, size_t total) {
                printProgress("Writing", done, total);
            },
            stop);
    });
    document.setBytes(0, image);
    document.confirmOverwrite();
    std::println("Module written and verified");
    return 0;
}

int cmdVerify(const Options& options, const ProgrammerConfig& config)
{
    RawImage expected = importImage(options.positional.at(1));
    auto session = Session::connect(config);
    auto changes = compareImages(expected, readModule(*session));
    printChanges(changes);
    return changes.empty() ? 0 : exitFailure;
}

int cmdSet(const Options& options, const ProgrammerConfig&)
{
    if (options.output.empty())
    {
        std::println(stderr, "set needs -o <out>");
        return exitUsage;
    }
    SpdDocument document(importImage(options.positional.at(1)),
                         options.positional.at(1));
    setField(document, options.positional.at(2), options.positional.at(3));
    RawImage image = document.commit();
    exportImage(options.output, image);
    printChanges(compareImages(document.backup(), image));
    return 0;
}

int cmdDiff(const Options& options, const ProgrammerConfig&)
{
    auto changes = compareImages(importImage(options.positional.at(1)),
                                 importImage(options.positional.at(2)));
    printChanges(changes);
    return changes.empty() ? 0 : exitFailure;
}

int cmdFields(const Options&, const ProgrammerConfig&)
{
    for (const auto& name : editableFields())
    {
        std::println("{}", name);
    }
    return 0;
}

struct Command
{
    std::string_view name;
    size_t arguments;
    int (*run)(const Options&, const ProgrammerConfig&);
};

constexpr std::array<Command, 8> commands = {{
    {"info", 1, cmdInfo},
    {"json", 1, cmdJson},
    {"read", 1, cmdRead},
    {"write", 1, cmdWrite},
    {"verify", 1, cmdVerify},
    {"set", 3, cmdSet},
    {"diff", 2, cmdDiff},
    {"fields", 0, cmdFields},
}};

} // namespace

int main(int argc, char** argv)
{
    auto options = parseOptions(argc, argv);
    if (!options || options->positional.empty())
    {
        usage();
        return exitUsage;
    }

    const std::string& name = options->positional.front();
    auto command = std::ranges::find(commands, name, &Command::name);
    if (command == commands.end() ||
        options->positional.size() != command->arguments + 1)
    {
        usage();
        return exitUsage;
    }

    auto config = ProgrammerConfig::load(options->configPath);
    if (!config)
    {
        std::println(stderr, "invalid configuration {}",
                     options->configPath.string());
        return exitFailure;
    }

    try
    {
        return command->run(*options, *config);
    }
    catch (const SpdError& e)
    {
        std::println(stderr, "{}: {}", errorKindName(e.kind()), e.what());
    }
    catch (const std::exception& e)
    {
        lg2::error("spd-tool {CMD} failed: {ERR}", "CMD", name, "ERR",
                   e.what());
        std::println(stderr, "error: {}", e.what());
    }
    return exitFailure;
}
