//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVTOPO_ENGINE_CONFIG_HPP_INCLUDED
#define DEVTOPO_ENGINE_CONFIG_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace devtopo
{
namespace engine
{

class Config
{
public:
    using Ptr = std::shared_ptr<Config>;

    /// One `[[node.endpoints]]` entry, as it is in the configuration file.
    ///
    /// Missing keys are left empty (or default). Keys which are present, but have a wrong type
    /// or an out of range value, are listed in `invalid_keys` (as dotted paths, f.e. `device_type.revision`);
    /// it is up to the composition to reject such entries.
    ///
    struct EndpointEntry
    {
        cetl::optional<std::uint16_t> id;
        cetl::optional<std::uint16_t> device_type_id;
        std::uint16_t                 device_type_revision;
        std::vector<std::uint32_t>    clusters;
        std::vector<std::string>      invalid_keys;
    };

    /// Loads configuration from the given TOML file.
    ///
    /// Throws on I/O or syntax errors.
    ///
    CETL_NODISCARD static Ptr make(std::string file_path);

    /// Loads configuration from the given TOML text.
    ///
    CETL_NODISCARD static Ptr makeFromString(const std::string& content);

    Config(const Config&)                = delete;
    Config(Config&&) noexcept            = delete;
    Config& operator=(const Config&)     = delete;
    Config& operator=(Config&&) noexcept = delete;

    virtual ~Config() = default;

    /// @return `"standard"` if not configured, or empty if it's not a string.
    ///
    CETL_NODISCARD virtual auto getPartsMatcher() const -> cetl::optional<std::string>      = 0;
    CETL_NODISCARD virtual auto getEndpoints() const -> std::vector<EndpointEntry>          = 0;
    CETL_NODISCARD virtual auto getLoggingFile() const -> cetl::optional<std::string>       = 0;
    CETL_NODISCARD virtual auto getLoggingLevel() const -> cetl::optional<std::string>      = 0;
    CETL_NODISCARD virtual auto getLoggingFlushLevel() const -> cetl::optional<std::string> = 0;

protected:
    Config() = default;

};  // Config

}  // namespace engine
}  // namespace devtopo

#endif  // DEVTOPO_ENGINE_CONFIG_HPP_INCLUDED
