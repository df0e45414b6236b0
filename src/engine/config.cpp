//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "config.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <toml.hpp>

#include <cstdint>
#include <exception>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace devtopo
{
namespace engine
{
namespace
{

constexpr std::uint16_t DefaultDeviceTypeRevision = 1;

class ConfigImpl final : public Config
{
public:
    using TomlConf  = toml::ordered_type_config;
    using TomlValue = toml::basic_value<TomlConf>;

    explicit ConfigImpl(TomlValue&& root)
        : root_{std::move(root)}
    {
    }

    // Config

    auto getPartsMatcher() const -> cetl::optional<std::string> override
    {
        const auto* const toml_node    = findKey(root_, "node");
        const auto* const toml_matcher = (toml_node != nullptr) ? findKey(*toml_node, "parts_matcher") : nullptr;
        if (toml_matcher == nullptr)
        {
            return std::string{"standard"};
        }
        if (!toml_matcher->is_string())
        {
            return cetl::nullopt;
        }
        return toml_matcher->as_string();
    }

    auto getEndpoints() const -> std::vector<EndpointEntry> override
    {
        std::vector<EndpointEntry> entries;

        const auto* const toml_endpoints = findArray("node", "endpoints");
        if (toml_endpoints == nullptr)
        {
            return entries;
        }

        entries.reserve(toml_endpoints->size());
        for (const auto& toml_endpoint : *toml_endpoints)
        {
            entries.push_back(toEndpointEntry(toml_endpoint));
        }
        return entries;
    }

    auto getLoggingFile() const -> cetl::optional<std::string> override
    {
        return findIn<std::string>(root_, "logging", "file");
    }

    auto getLoggingLevel() const -> cetl::optional<std::string> override
    {
        return findIn<std::string>(root_, "logging", "level");
    }

    auto getLoggingFlushLevel() const -> cetl::optional<std::string> override
    {
        return findIn<std::string>(root_, "logging", "flush_level");
    }

private:
    static EndpointEntry toEndpointEntry(const TomlValue& toml_endpoint)
    {
        EndpointEntry entry{{}, {}, DefaultDeviceTypeRevision, {}, {}};

        if (const auto* const toml_id = findKey(toml_endpoint, "id"))
        {
            entry.id = toUnsigned<std::uint16_t>(*toml_id);
            if (!entry.id)
            {
                entry.invalid_keys.emplace_back("id");
            }
        }

        if (const auto* const toml_device_type = findKey(toml_endpoint, "device_type"))
        {
            if (!toml_device_type->is_table())
            {
                entry.invalid_keys.emplace_back("device_type");
            }
            if (const auto* const toml_dtype = findKey(*toml_device_type, "id"))
            {
                entry.device_type_id = toUnsigned<std::uint16_t>(*toml_dtype);
                if (!entry.device_type_id)
                {
                    entry.invalid_keys.emplace_back("device_type.id");
                }
            }
            if (const auto* const toml_drev = findKey(*toml_device_type, "revision"))
            {
                const auto revision = toUnsigned<std::uint16_t>(*toml_drev);
                if (revision)
                {
                    entry.device_type_revision = revision.value();
                }
                else
                {
                    entry.invalid_keys.emplace_back("device_type.revision");
                }
            }
        }

        if (const auto* const toml_clusters = findKey(toml_endpoint, "clusters"))
        {
            if (!toClusterIds(*toml_clusters, entry.clusters))
            {
                entry.clusters.clear();
                entry.invalid_keys.emplace_back("clusters");
            }
        }

        return entry;
    }

    /// @return `false` if it's not an array, or any of its items is not a valid cluster id.
    ///
    static bool toClusterIds(const TomlValue& toml_clusters, std::vector<std::uint32_t>& cluster_ids)
    {
        if (!toml_clusters.is_array())
        {
            return false;
        }
        for (const auto& toml_cluster : toml_clusters.as_array())
        {
            const auto cluster_id = toUnsigned<std::uint32_t>(toml_cluster);
            if (!cluster_id)
            {
                return false;
            }
            cluster_ids.push_back(cluster_id.value());
        }
        return true;
    }

    /// Integer value which fits into `T`, or empty for anything else.
    ///
    template <typename T>
    static cetl::optional<T> toUnsigned(const TomlValue& value)
    {
        if (!value.is_integer())
        {
            return cetl::nullopt;
        }
        const auto integer = value.as_integer();
        if ((integer < 0) || (static_cast<std::uint64_t>(integer) > std::numeric_limits<T>::max()))
        {
            return cetl::nullopt;
        }
        return static_cast<T>(integer);
    }

    /// Finds a direct key of a table; `nullptr` if it's missing (or `table` is not a table at all).
    ///
    static const TomlValue* findKey(const TomlValue& table, const std::string& key)
    {
        if (!table.is_table())
        {
            return nullptr;
        }
        const auto& toml_table = table.as_table();
        const auto  found      = toml_table.find(key);
        return (found != toml_table.end()) ? &found->second : nullptr;
    }

    template <typename T, typename... Keys>
    static cetl::optional<T> findIn(const TomlValue& value, Keys&&... keys)
    {
        try
        {
            return cetl::make_optional(toml::find<T>(value, std::forward<Keys>(keys)...));

        } catch (const std::exception&)
        {
            return cetl::nullopt;
        }
    }

    template <typename... Keys>
    const TomlValue::array_type* findArray(Keys&&... keys) const
    {
        try
        {
            return &toml::find(root_, std::forward<Keys>(keys)...).as_array();

        } catch (const std::exception&)
        {
            return nullptr;
        }
    }

    TomlValue root_;

};  // ConfigImpl

}  // namespace

Config::Ptr Config::make(std::string file_path)
{
    auto root = toml::parse<ConfigImpl::TomlConf>(file_path);
    return std::make_shared<ConfigImpl>(std::move(root));
}

Config::Ptr Config::makeFromString(const std::string& content)
{
    auto root = toml::parse_str<ConfigImpl::TomlConf>(content);
    return std::make_shared<ConfigImpl>(std::move(root));
}

}  // namespace engine
}  // namespace devtopo
