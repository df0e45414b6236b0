//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVTOPO_DM_NODE_HPP_INCLUDED
#define DEVTOPO_DM_NODE_HPP_INCLUDED

#include "cluster.hpp"
#include "devtopo/errors.hpp"
#include "devtopo/tlv/tlv_types.hpp"
#include "devtopo/tlv/writer.hpp"
#include "types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <vector>

namespace devtopo
{
namespace dm
{

struct DeviceType
{
    std::uint16_t dtype;
    std::uint16_t drev;

    /// Encodes the device type as a structure with `0: dtype` and `1: drev` fields.
    ///
    CETL_NODISCARD cetl::optional<Failure> toTlv(tlv::Writer& tw, const tlv::Tag tag) const;

    friend bool operator==(const DeviceType& lhs, const DeviceType& rhs) noexcept
    {
        return (lhs.dtype == rhs.dtype) && (lhs.drev == rhs.drev);
    }

};  // DeviceType

struct Endpoint
{
    EndptId              id;
    DeviceType           device_type;
    std::vector<Cluster> clusters;

};  // Endpoint

/// Read-only (from the cluster handlers perspective) collection of endpoints of a device.
///
/// Order of endpoints is the iteration order of all lists built from the node.
///
struct Node
{
    std::uint16_t         id;
    std::vector<Endpoint> endpoints;

    const Endpoint* findEndpoint(const EndptId endpoint_id) const noexcept;

};  // Node

}  // namespace dm
}  // namespace devtopo

#endif  // DEVTOPO_DM_NODE_HPP_INCLUDED
