//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "devtopo/dm/node.hpp"

#include "devtopo/dm/types.hpp"
#include "devtopo/errors.hpp"
#include "devtopo/tlv/tlv_types.hpp"
#include "devtopo/tlv/writer.hpp"

#include <cetl/pf17/cetlpf.hpp>

namespace devtopo
{
namespace dm
{

cetl::optional<Failure> DeviceType::toTlv(tlv::Writer& tw, const tlv::Tag tag) const
{
    if (const auto failure = tw.startStruct(tag))
    {
        return failure;
    }
    if (const auto failure = tw.u16(tlv::Tag::context(0), dtype))
    {
        return failure;
    }
    if (const auto failure = tw.u16(tlv::Tag::context(1), drev))
    {
        return failure;
    }
    return tw.endContainer();
}

const Endpoint* Node::findEndpoint(const EndptId endpoint_id) const noexcept
{
    for (const auto& endpoint : endpoints)
    {
        if (endpoint.id == endpoint_id)
        {
            return &endpoint;
        }
    }
    return nullptr;
}

}  // namespace dm
}  // namespace devtopo
