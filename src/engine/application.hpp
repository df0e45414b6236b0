//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVTOPO_ENGINE_APPLICATION_HPP_INCLUDED
#define DEVTOPO_ENGINE_APPLICATION_HPP_INCLUDED

#include "config.hpp"
#include "logging.hpp"

#include <devtopo/dm/descriptor_cluster.hpp>
#include <devtopo/dm/node.hpp>
#include <devtopo/dm/types.hpp>
#include <devtopo/errors.hpp>
#include <devtopo/utils/rand.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <ostream>
#include <string>

namespace devtopo
{
namespace engine
{

/// Composes a node from the configuration, and serves reads of its Descriptor cluster.
///
class Application
{
public:
    struct ReadResult
    {
        /// Rendered value; empty if the read was skipped by the data version filter.
        using Success = std::string;
        using Failure = devtopo::Failure;
        using Var     = cetl::variant<Success, Failure>;
    };

    explicit Application(utils::Rand rand = &utils::sysRand);

    CETL_NODISCARD cetl::optional<std::string> init(const Config& config);

    const dm::Node& node() const noexcept
    {
        return node_;
    }

    /// Valid only after successful `init`.
    ///
    dm::DescriptorCluster& descriptor() noexcept
    {
        CETL_DEBUG_ASSERT(descriptor_, "Application is not initialized.");
        return *descriptor_;
    }

    /// Reads an attribute of the Descriptor cluster on the given endpoint.
    ///
    CETL_NODISCARD ReadResult::Var readAttribute(const dm::EndptId                 endpoint_id,
                                                 const dm::AttrId                  attr_id,
                                                 const cetl::optional<dm::DataVer> dataver_filter = cetl::nullopt);

    /// Prints the Descriptor cluster attributes of every endpoint, one line per attribute.
    ///
    CETL_NODISCARD cetl::optional<std::string> dump(std::ostream& out);

private:
    CETL_NODISCARD cetl::optional<std::string> composeNode(const Config& config);

    utils::Rand                rand_;
    common::LoggerPtr          logger_{common::getLogger("engine")};
    dm::Node                   node_{0, {}};
    dm::DescriptorCluster::Ptr descriptor_;

};  // Application

}  // namespace engine
}  // namespace devtopo

#endif  // DEVTOPO_ENGINE_APPLICATION_HPP_INCLUDED
