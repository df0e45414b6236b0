//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVTOPO_DM_CLUSTER_HPP_INCLUDED
#define DEVTOPO_DM_CLUSTER_HPP_INCLUDED

#include "types.hpp"

#include <cetl/pf20/cetlpf.hpp>

#include <cstdint>

namespace devtopo
{
namespace dm
{

/// Access rights of an attribute (bit flags).
///
enum class Access : std::uint16_t
{
    None            = 0x0000,
    Read            = 0x0001,
    Write           = 0x0002,
    FabricScoped    = 0x0004,
    FabricSensitive = 0x0008,
    NeedView        = 0x0010,
    NeedOperate     = 0x0020,
    NeedManage      = 0x0040,
    NeedAdmin       = 0x0080,
    TimedOnly       = 0x0100,

    RV = Read | NeedView,

};  // Access

/// Qualities of an attribute (bit flags).
///
enum class Quality : std::uint8_t
{
    None       = 0x00,
    Scene      = 0x01,
    Persistent = 0x02,
    Fixed      = 0x04,
    Nullable   = 0x08,

};  // Quality

constexpr Access operator|(const Access lhs, const Access rhs) noexcept
{
    return static_cast<Access>(static_cast<std::uint16_t>(lhs) | static_cast<std::uint16_t>(rhs));
}

constexpr bool hasAll(const Access set, const Access flags) noexcept
{
    return (static_cast<std::uint16_t>(set) & static_cast<std::uint16_t>(flags)) == static_cast<std::uint16_t>(flags);
}

/// Global attributes which every cluster may expose.
///
enum class GlobalAttr : AttrId
{
    GeneratedCmdList = 0xFFF8,
    AcceptedCmdList  = 0xFFF9,
    EventList        = 0xFFFA,
    AttributeList    = 0xFFFB,
    FeatureMap       = 0xFFFC,
    ClusterRevision  = 0xFFFD,

};  // GlobalAttr

constexpr bool isSystemAttr(const AttrId attr_id) noexcept
{
    return attr_id >= static_cast<AttrId>(GlobalAttr::GeneratedCmdList);
}

struct Attribute
{
    AttrId  id;
    Access  access;
    Quality quality;

};  // Attribute

/// Immutable cluster metadata - identity and attribute table.
///
struct Cluster
{
    ClusterId                   id;
    std::uint16_t               revision;
    std::uint32_t               feature_map;
    cetl::span<const Attribute> attributes;

    const Attribute* findAttribute(const AttrId attr_id) const noexcept
    {
        for (const auto& attr : attributes)
        {
            if (attr.id == attr_id)
            {
                return &attr;
            }
        }
        return nullptr;
    }

};  // Cluster

constexpr Attribute FeatureMapAttr{static_cast<AttrId>(GlobalAttr::FeatureMap), Access::RV, Quality::None};
constexpr Attribute AttributeListAttr{static_cast<AttrId>(GlobalAttr::AttributeList), Access::RV, Quality::None};
constexpr Attribute ClusterRevisionAttr{static_cast<AttrId>(GlobalAttr::ClusterRevision), Access::RV, Quality::None};

}  // namespace dm
}  // namespace devtopo

#endif  // DEVTOPO_DM_CLUSTER_HPP_INCLUDED
