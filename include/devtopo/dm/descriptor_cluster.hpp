//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVTOPO_DM_DESCRIPTOR_CLUSTER_HPP_INCLUDED
#define DEVTOPO_DM_DESCRIPTOR_CLUSTER_HPP_INCLUDED

#include "cluster.hpp"
#include "dataver.hpp"
#include "devtopo/errors.hpp"
#include "devtopo/utils/rand.hpp"
#include "handler.hpp"
#include "types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <memory>

namespace devtopo
{
namespace dm
{

constexpr ClusterId     DescriptorClusterId       = 0x001D;
constexpr std::uint16_t DescriptorClusterRevision = 1;

/// Attributes of the Descriptor cluster. Values are the wire attribute ids.
///
enum class DescriptorAttr : AttrId
{
    DeviceTypeList = 0,
    ServerList     = 1,
    ClientList     = 2,
    PartsList      = 3,

};  // DescriptorAttr

struct DescriptorAttrResult
{
    using Success = DescriptorAttr;
    using Failure = devtopo::Failure;
    using Var     = cetl::variant<Success, Failure>;
};

/// Maps a wire attribute id to the Descriptor cluster attribute.
///
/// Any id outside of the declared set fails with `UnknownAttribute`.
///
CETL_NODISCARD DescriptorAttrResult::Var toDescriptorAttr(const AttrId attr_id) noexcept;

/// Policy which decides what endpoints are the "parts" of an endpoint.
///
class PartsMatcher
{
public:
    PartsMatcher(const PartsMatcher&)                = delete;
    PartsMatcher(PartsMatcher&&) noexcept            = delete;
    PartsMatcher& operator=(const PartsMatcher&)     = delete;
    PartsMatcher& operator=(PartsMatcher&&) noexcept = delete;

    virtual ~PartsMatcher() = default;

    /// Checks whether `endpoint` belongs to the parts list of `our_endpoint`.
    ///
    /// Has to be pure - no side effects, and the same answer for the same arguments.
    ///
    CETL_NODISCARD virtual bool describe(const EndptId our_endpoint, const EndptId endpoint) const noexcept = 0;

protected:
    PartsMatcher() = default;

};  // PartsMatcher

/// Flat composite device - the root endpoint is composed of all other endpoints.
///
class StandardPartsMatcher final : public PartsMatcher
{
public:
    StandardPartsMatcher() = default;

    CETL_NODISCARD bool describe(const EndptId our_endpoint, const EndptId endpoint) const noexcept override
    {
        return (our_endpoint == RootEndptId) && (endpoint != our_endpoint);
    }

};  // StandardPartsMatcher

/// Bridge (aggregator) - every endpoint lists all other non-root endpoints as its peers.
///
class AggregatorPartsMatcher final : public PartsMatcher
{
public:
    AggregatorPartsMatcher() = default;

    CETL_NODISCARD bool describe(const EndptId our_endpoint, const EndptId endpoint) const noexcept override
    {
        return (endpoint != our_endpoint) && (endpoint != RootEndptId);
    }

};  // AggregatorPartsMatcher

/// Handler of the Descriptor cluster.
///
/// Answers reads of the device types, server/client clusters and parts lists of an endpoint,
/// as well as global attributes (via the system attribute reader).
///
class DescriptorCluster : public NonBlockingHandler, public ChangeNotifier
{
public:
    using Ptr = std::unique_ptr<DescriptorCluster>;

    /// Gets metadata of the Descriptor cluster.
    ///
    static const Cluster& metadata();

    /// Makes the cluster handler with the standard parts matcher.
    ///
    CETL_NODISCARD static Ptr make(const utils::Rand& rand);

    /// Makes the cluster handler with the aggregator parts matcher.
    ///
    CETL_NODISCARD static Ptr makeAggregator(const utils::Rand& rand);

    /// Makes the cluster handler with a custom parts matcher.
    ///
    /// The matcher and the system attribute reader must outlive the handler.
    ///
    CETL_NODISCARD static Ptr makeMatching(const PartsMatcher&          matcher,
                                           const utils::Rand&           rand,
                                           const SystemAttributeReader& system_reader);

    /// Gets data version of the cluster instance.
    ///
    /// Mutators of the data exposed by the cluster (f.e. the node composition)
    /// are expected to call `dataver().changed()`.
    ///
    virtual Dataver& dataver() noexcept = 0;

protected:
    DescriptorCluster() = default;

};  // DescriptorCluster

}  // namespace dm
}  // namespace devtopo

#endif  // DEVTOPO_DM_DESCRIPTOR_CLUSTER_HPP_INCLUDED
