//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVTOPO_COMMON_LOGGING_HPP_INCLUDED
#define DEVTOPO_COMMON_LOGGING_HPP_INCLUDED

#include <devtopo/errors.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace devtopo
{
namespace common
{

using Logger    = spdlog::logger;
using LoggerPtr = std::shared_ptr<Logger>;

/// Gets a subsystem logger by its name.
///
/// Loggers which were not registered by the logging setup are cloned from the default one
/// (and so share its sinks and level).
///
inline LoggerPtr getLogger(const std::string& name) noexcept
{
    if (auto logger = spdlog::get(name))
    {
        return logger;
    }

    auto default_logger = spdlog::default_logger();
    CETL_DEBUG_ASSERT(default_logger, "default");

    auto logger = default_logger->clone(name);
    CETL_DEBUG_ASSERT(logger, name.c_str());

    try
    {
        spdlog::register_logger(logger);

    } catch (const spdlog::spdlog_ex&)
    {
        // Lost the race - another thread has registered the same name just now.
        if (auto registered = spdlog::get(name))
        {
            return registered;
        }
    }
    return logger;
}

}  // namespace common
}  // namespace devtopo

template <>
struct fmt::formatter<devtopo::ErrorCode> : formatter<int>
{
    template <typename FormatContext>
    auto format(const devtopo::ErrorCode error_code, FormatContext& ctx) const
    {
        return formatter<int>::format(static_cast<int>(error_code), ctx);
    }
};

#endif  // DEVTOPO_COMMON_LOGGING_HPP_INCLUDED
