//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "engine/application.hpp"
#include "engine/config.hpp"
#include "setup_logging.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

namespace
{

void printUsage(const char* const program)
{
    std::cerr << "Usage: " << program << " <config.toml> [SPDLOG_LEVEL=...]\n";
}

devtopo::engine::Config::Ptr loadConfig(const std::string& cfg_file_path)
{
    try
    {
        return devtopo::engine::Config::make(cfg_file_path);

    } catch (const std::exception& ex)
    {
        std::cerr << "Failed to load configuration file (path='" << cfg_file_path << "').\n" << ex.what() << '\n';
    }
    return nullptr;
}

}  // namespace

int main(const int argc, const char** const argv)
{
    // The configuration file is the first argument which is not a `SPDLOG_...=` one.
    std::string cfg_file_path;
    for (int i = 1; i < argc; i++)
    {
        const std::string arg_str = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (0 != arg_str.compare(0, 7, "SPDLOG_"))
        {
            cfg_file_path = arg_str;
            break;
        }
    }
    if (cfg_file_path.empty())
    {
        printUsage(argv[0]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        return EXIT_FAILURE;
    }

    const auto config = loadConfig(cfg_file_path);
    if (!config)
    {
        return EXIT_FAILURE;
    }
    if (!devtopo::cli::setupLogging(argc, argv, *config))
    {
        return EXIT_FAILURE;
    }

    spdlog::info("DEVTOPO dump started (ver='{}.{}', config='{}').", VERSION_MAJOR, VERSION_MINOR, cfg_file_path);
    int result = EXIT_SUCCESS;
    try
    {
        devtopo::engine::Application application;
        if (const auto failure_str = application.init(*config))
        {
            spdlog::critical("Failed to init application: {}", failure_str.value());
            std::cerr << "Failed to init application: " << failure_str.value() << '\n';
            result = EXIT_FAILURE;
        }
        else if (const auto dump_failure_str = application.dump(std::cout))
        {
            spdlog::error("Failed to dump descriptors: {}", dump_failure_str.value());
            std::cerr << "Failed to dump descriptors: " << dump_failure_str.value() << '\n';
            result = EXIT_FAILURE;
        }

    } catch (const std::exception& ex)
    {
        spdlog::critical("Unhandled exception: {}", ex.what());
        result = EXIT_FAILURE;
    }
    spdlog::info("DEVTOPO dump terminated (result={}).", result);

    return result;
}
