//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVTOPO_CLI_SETUP_LOGGING_HPP_INCLUDED
#define DEVTOPO_CLI_SETUP_LOGGING_HPP_INCLUDED

#include "engine/config.hpp"

#include <spdlog/cfg/argv.h>
#include <spdlog/cfg/helpers.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <string>

namespace devtopo
{
namespace cli
{

/// Applies `[logging]` levels of the configuration to the registered loggers.
///
/// `level` accepts the `SPDLOG_LEVEL` syntax (like `info,dm=trace`);
/// `flush_level` is a single level name which applies to all loggers.
///
inline void applyConfigLevels(const engine::Config& config)
{
    if (const auto level = config.getLoggingLevel())
    {
        spdlog::cfg::helpers::load_levels(level.value());
    }

    if (const auto flush_level_name = config.getLoggingFlushLevel())
    {
        const auto flush_level = spdlog::level::from_str(flush_level_name.value());
        if ((flush_level == spdlog::level::off) && (flush_level_name.value() != "off"))
        {
            spdlog::warn("Unknown flush level '{}' is ignored.", flush_level_name.value());
            return;
        }
        spdlog::apply_all([flush_level](const std::shared_ptr<spdlog::logger>& logger) {
            //
            logger->flush_on(flush_level);
        });
    }
}

/// Routes the default and the `dm`/`engine` loggers into one rotating log file.
///
/// Levels come from the configuration, and then from `SPDLOG_LEVEL=` command line argument.
///
/// @return `false` if the log file can't be set up.
///
inline bool setupLogging(const int argc, const char** const argv, const engine::Config& config)
{
    constexpr std::size_t MaxFiles    = 4;
    constexpr std::size_t MaxFileSize = 16UL * 1048576UL;

    const auto log_file_path = config.getLoggingFile().value_or("./devtopo-cli.log");
    try
    {
        const auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_st>(log_file_path, MaxFileSize, MaxFiles);
        sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%P] [%n] [%l] %v");

        spdlog::drop_all();
        spdlog::set_default_logger(std::make_shared<spdlog::logger>("", sink));
        for (const char* const subsystem : {"dm", "engine"})
        {
            spdlog::register_logger(std::make_shared<spdlog::logger>(subsystem, sink));
        }

    } catch (const spdlog::spdlog_ex& ex)
    {
        std::cerr << "Failed to open log file (path='" << log_file_path << "'): " << ex.what() << '\n';
        return false;
    }

    applyConfigLevels(config);
    spdlog::cfg::load_argv_levels(argc, argv);
    return true;
}

}  // namespace cli
}  // namespace devtopo

#endif  // DEVTOPO_CLI_SETUP_LOGGING_HPP_INCLUDED
