//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVTOPO_DM_TYPES_HPP_INCLUDED
#define DEVTOPO_DM_TYPES_HPP_INCLUDED

#include <cstdint>

namespace devtopo
{
namespace dm
{

using EndptId   = std::uint16_t;
using ClusterId = std::uint32_t;
using AttrId    = std::uint32_t;
using DataVer   = std::uint32_t;

/// Id of the root endpoint of a node.
///
constexpr EndptId RootEndptId = 0;

}  // namespace dm
}  // namespace devtopo

#endif  // DEVTOPO_DM_TYPES_HPP_INCLUDED
