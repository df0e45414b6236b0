//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVTOPO_DM_ATTR_DATA_HPP_INCLUDED
#define DEVTOPO_DM_ATTR_DATA_HPP_INCLUDED

#include "cluster.hpp"
#include "devtopo/errors.hpp"
#include "devtopo/tlv/tlv_types.hpp"
#include "devtopo/tlv/writer.hpp"
#include "node.hpp"
#include "types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <memory>

namespace devtopo
{
namespace dm
{

/// Details of a single (already validated and expanded) attribute read request.
///
struct AttrDetails
{
    const Node& node;
    EndptId     endpoint_id;
    ClusterId   cluster_id;
    AttrId      attr_id;

    bool isSystem() const noexcept
    {
        return isSystemAttr(attr_id);
    }

};  // AttrDetails

/// Abstract interface of a writer of one attribute value.
///
/// The value is written via `tlv()` under the `dataTag()` tag, and then the writer has to be completed.
/// A writer which is destroyed without successful completion discards everything it has written.
///
class AttrDataWriter
{
public:
    using Ptr = std::unique_ptr<AttrDataWriter>;

    static constexpr tlv::Tag dataTag() noexcept
    {
        return tlv::Tag::context(2);
    }

    AttrDataWriter(const AttrDataWriter&)                = delete;
    AttrDataWriter(AttrDataWriter&&) noexcept            = delete;
    AttrDataWriter& operator=(const AttrDataWriter&)     = delete;
    AttrDataWriter& operator=(AttrDataWriter&&) noexcept = delete;

    virtual ~AttrDataWriter() = default;

    virtual tlv::Writer& tlv() = 0;

    /// Finalizes the attribute response frame.
    ///
    CETL_NODISCARD virtual cetl::optional<Failure> complete() = 0;

protected:
    AttrDataWriter() = default;

};  // AttrDataWriter

/// Abstract interface of an encoder of one attribute response.
///
class AttrDataEncoder
{
public:
    /// Caller already has the data of the requested version - nothing to encode.
    struct Skipped
    {};

    struct BeginResult
    {
        using Success = AttrDataWriter::Ptr;
        using Failure = devtopo::Failure;
        using Var     = cetl::variant<Success, AttrDataEncoder::Skipped, Failure>;
    };

    AttrDataEncoder(const AttrDataEncoder&)                = delete;
    AttrDataEncoder(AttrDataEncoder&&) noexcept            = delete;
    AttrDataEncoder& operator=(const AttrDataEncoder&)     = delete;
    AttrDataEncoder& operator=(AttrDataEncoder&&) noexcept = delete;

    virtual ~AttrDataEncoder() = default;

    /// Begins the response for the given data version of the cluster.
    ///
    /// @return Either a writer bound to the version, or `Skipped` if the requester's
    ///         data version filter matches the given one.
    ///
    CETL_NODISCARD virtual BeginResult::Var withDataver(const DataVer dataver) = 0;

protected:
    AttrDataEncoder() = default;

};  // AttrDataEncoder

}  // namespace dm
}  // namespace devtopo

#endif  // DEVTOPO_DM_ATTR_DATA_HPP_INCLUDED
