//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "devtopo/dm/attr_data.hpp"
#include "devtopo/dm/cluster.hpp"
#include "devtopo/dm/handler.hpp"
#include "devtopo/dm/types.hpp"
#include "devtopo/errors.hpp"
#include "devtopo/tlv/writer.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

namespace devtopo
{
namespace dm
{
namespace
{

class GlobalAttributeReader final : public SystemAttributeReader
{
public:
    GlobalAttributeReader() = default;

    // SystemAttributeReader

    CETL_NODISCARD cetl::optional<Failure> read(const Cluster&  cluster,
                                                const AttrId    attr_id,
                                                AttrDataWriter& writer) const override
    {
        // Only attributes declared (as readable) by the cluster itself are served.
        const auto* const attr = cluster.findAttribute(attr_id);
        if ((attr == nullptr) || !hasAll(attr->access, Access::Read))
        {
            return ErrorCode::UnknownAttribute;
        }

        auto& tw = writer.tlv();
        switch (static_cast<GlobalAttr>(attr_id))
        {
        case GlobalAttr::FeatureMap:
            if (const auto failure = tw.u32(AttrDataWriter::dataTag(), cluster.feature_map))
            {
                return failure;
            }
            break;
        case GlobalAttr::AttributeList:
            if (const auto failure = encodeAttributeIds(cluster, tw))
            {
                return failure;
            }
            break;
        case GlobalAttr::ClusterRevision:
            if (const auto failure = tw.u16(AttrDataWriter::dataTag(), cluster.revision))
            {
                return failure;
            }
            break;
        default:
            return ErrorCode::UnknownAttribute;
        }

        return writer.complete();
    }

private:
    CETL_NODISCARD static cetl::optional<Failure> encodeAttributeIds(const Cluster& cluster, tlv::Writer& tw)
    {
        if (const auto failure = tw.startArray(AttrDataWriter::dataTag()))
        {
            return failure;
        }
        for (const auto& attr : cluster.attributes)
        {
            if (const auto failure = tw.u32(tlv::Tag::anonymous(), attr.id))
            {
                return failure;
            }
        }
        return tw.endContainer();
    }

};  // GlobalAttributeReader

}  // namespace

const SystemAttributeReader& SystemAttributeReader::getDefault()
{
    static const GlobalAttributeReader reader{};
    return reader;
}

}  // namespace dm
}  // namespace devtopo
