//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "application.hpp"

#include "config.hpp"
#include "text_encoder.hpp"

#include <devtopo/dm/attr_data.hpp>
#include <devtopo/dm/cluster.hpp>
#include <devtopo/dm/descriptor_cluster.hpp>
#include <devtopo/dm/node.hpp>
#include <devtopo/dm/types.hpp>
#include <devtopo/errors.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace devtopo
{
namespace engine
{
namespace
{

struct DumpedAttr
{
    dm::AttrId  id;
    const char* name;
};

const std::array<DumpedAttr, 6> DumpedAttrs{{
    {static_cast<dm::AttrId>(dm::DescriptorAttr::DeviceTypeList), "DeviceTypeList"},
    {static_cast<dm::AttrId>(dm::DescriptorAttr::ServerList), "ServerList"},
    {static_cast<dm::AttrId>(dm::DescriptorAttr::ClientList), "ClientList"},
    {static_cast<dm::AttrId>(dm::DescriptorAttr::PartsList), "PartsList"},
    {static_cast<dm::AttrId>(dm::GlobalAttr::FeatureMap), "FeatureMap"},
    {static_cast<dm::AttrId>(dm::GlobalAttr::AttributeList), "AttributeList"},
}};

dm::Cluster makeClusterMetadata(const dm::ClusterId cluster_id)
{
    if (cluster_id == dm::DescriptorClusterId)
    {
        return dm::DescriptorCluster::metadata();
    }
    return dm::Cluster{cluster_id, 1, 0, {}};
}

}  // namespace

Application::Application(utils::Rand rand)
    : rand_{std::move(rand)}
{
}

cetl::optional<std::string> Application::init(const Config& config)
{
    // 1. Compose the node from the configured endpoints.
    //
    if (auto error = composeNode(config))
    {
        return error;
    }

    // 2. Create the Descriptor cluster handler with the configured parts matcher.
    //
    const auto parts_matcher_opt = config.getPartsMatcher();
    if (!parts_matcher_opt)
    {
        return std::string{"Parts matcher 'node.parts_matcher' is not a string."};
    }
    const auto& parts_matcher = parts_matcher_opt.value();
    if (parts_matcher == "standard")
    {
        descriptor_ = dm::DescriptorCluster::make(rand_);
    }
    else if (parts_matcher == "aggregator")
    {
        descriptor_ = dm::DescriptorCluster::makeAggregator(rand_);
    }
    else
    {
        return fmt::format("Unknown parts matcher '{}'.", parts_matcher);
    }

    logger_->info("Node composed (endpoints={}, parts_matcher='{}', dataver={}).",
                  node_.endpoints.size(),
                  parts_matcher,
                  descriptor_->dataver().get());
    return cetl::nullopt;
}

cetl::optional<std::string> Application::composeNode(const Config& config)
{
    const auto entries = config.getEndpoints();
    if (entries.empty())
    {
        return std::string{"No endpoints are configured."};
    }

    std::vector<dm::Endpoint> endpoints;
    endpoints.reserve(entries.size());
    for (const auto& entry : entries)
    {
        if (!entry.invalid_keys.empty())
        {
            return fmt::format("Endpoint #{} has invalid '{}'.", endpoints.size(), entry.invalid_keys.front());
        }
        if (!entry.id)
        {
            return fmt::format("Endpoint #{} has no valid 'id'.", endpoints.size());
        }
        const auto endpoint_id = entry.id.value();
        if (!entry.device_type_id)
        {
            return fmt::format("Endpoint {} has no valid 'device_type.id'.", endpoint_id);
        }
        const auto is_dup = std::any_of(endpoints.cbegin(), endpoints.cend(), [endpoint_id](const auto& endpoint) {
            //
            return endpoint.id == endpoint_id;
        });
        if (is_dup)
        {
            return fmt::format("Duplicate endpoint id {}.", endpoint_id);
        }

        dm::Endpoint endpoint{endpoint_id, {entry.device_type_id.value(), entry.device_type_revision}, {}};
        endpoint.clusters.reserve(entry.clusters.size());
        for (const auto cluster_id : entry.clusters)
        {
            endpoint.clusters.push_back(makeClusterMetadata(cluster_id));
        }

        const auto has_descriptor =
            std::any_of(endpoint.clusters.cbegin(), endpoint.clusters.cend(), [](const auto& cluster) {
                //
                return cluster.id == dm::DescriptorClusterId;
            });
        if (!has_descriptor)
        {
            logger_->warn("Endpoint {} does not list the Descriptor cluster.", endpoint_id);
        }

        logger_->debug("Endpoint {} (device_type=0x{:04X}, rev={}, clusters={}).",
                       endpoint_id,
                       endpoint.device_type.dtype,
                       endpoint.device_type.drev,
                       endpoint.clusters.size());
        endpoints.push_back(std::move(endpoint));
    }

    node_.endpoints = std::move(endpoints);
    return cetl::nullopt;
}

Application::ReadResult::Var Application::readAttribute(const dm::EndptId                 endpoint_id,
                                                        const dm::AttrId                  attr_id,
                                                        const cetl::optional<dm::DataVer> dataver_filter)
{
    CETL_DEBUG_ASSERT(descriptor_, "Application is not initialized.");

    std::string         text;
    TextAttrDataEncoder encoder{text, dataver_filter};

    const dm::AttrDetails details{node_, endpoint_id, dm::DescriptorClusterId, attr_id};
    if (const auto failure = descriptor_->read(details, encoder))
    {
        logger_->warn("Failed to read attribute (ep={}, attr=0x{:04X}, err={}).", endpoint_id, attr_id, *failure);
        return *failure;
    }
    return text;
}

cetl::optional<std::string> Application::dump(std::ostream& out)
{
    for (const auto& endpoint : node_.endpoints)
    {
        for (const auto& attr : DumpedAttrs)
        {
            auto read_result = readAttribute(endpoint.id, attr.id);
            if (const auto* const failure = cetl::get_if<Failure>(&read_result))
            {
                return fmt::format("Failed to read '{}' of endpoint {} (err={}).", attr.name, endpoint.id, *failure);
            }
            const auto text = cetl::get<ReadResult::Success>(std::move(read_result));

            out << "ep=" << endpoint.id << ' ' << attr.name << ": " << text << '\n';
        }
    }
    return cetl::nullopt;
}

}  // namespace engine
}  // namespace devtopo
