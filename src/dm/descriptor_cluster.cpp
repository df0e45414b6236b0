//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "devtopo/dm/descriptor_cluster.hpp"

#include "devtopo/dm/attr_data.hpp"
#include "devtopo/dm/cluster.hpp"
#include "devtopo/dm/dataver.hpp"
#include "devtopo/dm/handler.hpp"
#include "devtopo/dm/node.hpp"
#include "devtopo/dm/types.hpp"
#include "devtopo/errors.hpp"
#include "devtopo/tlv/tlv_types.hpp"
#include "devtopo/tlv/writer.hpp"
#include "devtopo/utils/rand.hpp"
#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <array>
#include <memory>
#include <utility>

namespace devtopo
{
namespace dm
{
namespace
{

const std::array<Attribute, 6> DescriptorAttributes{{
    FeatureMapAttr,
    AttributeListAttr,
    {static_cast<AttrId>(DescriptorAttr::DeviceTypeList), Access::RV, Quality::None},
    {static_cast<AttrId>(DescriptorAttr::ServerList), Access::RV, Quality::None},
    {static_cast<AttrId>(DescriptorAttr::PartsList), Access::RV, Quality::None},
    {static_cast<AttrId>(DescriptorAttr::ClientList), Access::RV, Quality::None},
}};

class DescriptorClusterImpl final : public DescriptorCluster
{
public:
    DescriptorClusterImpl(const PartsMatcher&          matcher,
                          const utils::Rand&           rand,
                          const SystemAttributeReader& system_reader)
        : matcher_{matcher}
        , system_reader_{system_reader}
        , dataver_{rand}
        , logger_{common::getLogger("dm")}
    {
        logger_->trace("DescriptorCluster(dataver={}).", dataver_.get());
    }

    // Handler

    CETL_NODISCARD cetl::optional<Failure> read(const AttrDetails& attr, AttrDataEncoder& encoder) override
    {
        auto begin_result = encoder.withDataver(dataver_.get());
        if (const auto* const failure = cetl::get_if<Failure>(&begin_result))
        {
            return *failure;
        }
        if (cetl::holds_alternative<AttrDataEncoder::Skipped>(begin_result))
        {
            logger_->trace("Descriptor read is skipped - same data version (ep={}, attr=0x{:04X}).",
                           attr.endpoint_id,
                           attr.attr_id);
            return cetl::nullopt;
        }
        const auto writer = cetl::get<AttrDataWriter::Ptr>(std::move(begin_result));
        CETL_DEBUG_ASSERT(writer, "");

        if (attr.isSystem())
        {
            return system_reader_.read(metadata(), attr.attr_id, *writer);
        }

        const auto attr_result = toDescriptorAttr(attr.attr_id);
        if (const auto* const failure = cetl::get_if<Failure>(&attr_result))
        {
            logger_->debug("Unknown descriptor attribute (ep={}, attr=0x{:04X}).", attr.endpoint_id, attr.attr_id);
            return *failure;
        }

        auto& tw = writer->tlv();
        if (const auto failure = encode(cetl::get<DescriptorAttr>(attr_result), attr.node, attr.endpoint_id, tw))
        {
            logger_->debug("Failed to encode descriptor attribute (ep={}, attr=0x{:04X}, err={}).",
                           attr.endpoint_id,
                           attr.attr_id,
                           *failure);
            return failure;
        }
        return writer->complete();
    }

    // ChangeNotifier

    CETL_NODISCARD bool consumeChange() override
    {
        return dataver_.consumeChange();
    }

    // DescriptorCluster

    Dataver& dataver() noexcept override
    {
        return dataver_;
    }

private:
    CETL_NODISCARD cetl::optional<Failure> encode(const DescriptorAttr attr,
                                                  const Node&          node,
                                                  const EndptId        endpoint_id,
                                                  tlv::Writer&         tw) const
    {
        const auto tag = AttrDataWriter::dataTag();
        switch (attr)
        {
        case DescriptorAttr::DeviceTypeList:
            return encodeDeviceTypeList(node, endpoint_id, tag, tw);
        case DescriptorAttr::ServerList:
            return encodeServerList(node, endpoint_id, tag, tw);
        case DescriptorAttr::ClientList:
            return encodeClientList(node, endpoint_id, tag, tw);
        case DescriptorAttr::PartsList:
            return encodePartsList(node, endpoint_id, tag, tw);
        }
        return ErrorCode::UnknownAttribute;
    }

    CETL_NODISCARD static cetl::optional<Failure> encodeDeviceTypeList(const Node&    node,
                                                                       const EndptId  endpoint_id,
                                                                       const tlv::Tag tag,
                                                                       tlv::Writer&   tw)
    {
        if (const auto failure = tw.startArray(tag))
        {
            return failure;
        }
        for (const auto& endpoint : node.endpoints)
        {
            if (endpoint.id == endpoint_id)
            {
                if (const auto failure = endpoint.device_type.toTlv(tw, tlv::Tag::anonymous()))
                {
                    return failure;
                }
            }
        }
        return tw.endContainer();
    }

    CETL_NODISCARD static cetl::optional<Failure> encodeServerList(const Node&    node,
                                                                   const EndptId  endpoint_id,
                                                                   const tlv::Tag tag,
                                                                   tlv::Writer&   tw)
    {
        if (const auto failure = tw.startArray(tag))
        {
            return failure;
        }
        for (const auto& endpoint : node.endpoints)
        {
            if (endpoint.id == endpoint_id)
            {
                for (const auto& cluster : endpoint.clusters)
                {
                    if (const auto failure = tw.u32(tlv::Tag::anonymous(), cluster.id))
                    {
                        return failure;
                    }
                }
            }
        }
        return tw.endContainer();
    }

    CETL_NODISCARD cetl::optional<Failure> encodePartsList(const Node&    node,
                                                           const EndptId  endpoint_id,
                                                           const tlv::Tag tag,
                                                           tlv::Writer&   tw) const
    {
        if (const auto failure = tw.startArray(tag))
        {
            return failure;
        }
        for (const auto& endpoint : node.endpoints)
        {
            if (matcher_.describe(endpoint_id, endpoint.id))
            {
                if (const auto failure = tw.u16(tlv::Tag::anonymous(), endpoint.id))
                {
                    return failure;
                }
            }
        }
        return tw.endContainer();
    }

    // No client clusters are supported - always an empty array.
    CETL_NODISCARD static cetl::optional<Failure> encodeClientList(const Node&,
                                                                   const EndptId,
                                                                   const tlv::Tag tag,
                                                                   tlv::Writer&   tw)
    {
        if (const auto failure = tw.startArray(tag))
        {
            return failure;
        }
        return tw.endContainer();
    }

    const PartsMatcher&          matcher_;
    const SystemAttributeReader& system_reader_;
    Dataver                      dataver_;
    common::LoggerPtr            logger_;

};  // DescriptorClusterImpl

}  // namespace

DescriptorAttrResult::Var toDescriptorAttr(const AttrId attr_id) noexcept
{
    switch (attr_id)
    {
    case static_cast<AttrId>(DescriptorAttr::DeviceTypeList):
        return DescriptorAttr::DeviceTypeList;
    case static_cast<AttrId>(DescriptorAttr::ServerList):
        return DescriptorAttr::ServerList;
    case static_cast<AttrId>(DescriptorAttr::ClientList):
        return DescriptorAttr::ClientList;
    case static_cast<AttrId>(DescriptorAttr::PartsList):
        return DescriptorAttr::PartsList;
    default:
        return ErrorCode::UnknownAttribute;
    }
}

const Cluster& DescriptorCluster::metadata()
{
    static const Cluster cluster{DescriptorClusterId,
                                 DescriptorClusterRevision,
                                 0,
                                 {DescriptorAttributes.data(), DescriptorAttributes.size()}};
    return cluster;
}

DescriptorCluster::Ptr DescriptorCluster::make(const utils::Rand& rand)
{
    static const StandardPartsMatcher matcher{};
    return makeMatching(matcher, rand, SystemAttributeReader::getDefault());
}

DescriptorCluster::Ptr DescriptorCluster::makeAggregator(const utils::Rand& rand)
{
    static const AggregatorPartsMatcher matcher{};
    return makeMatching(matcher, rand, SystemAttributeReader::getDefault());
}

DescriptorCluster::Ptr DescriptorCluster::makeMatching(const PartsMatcher&          matcher,
                                                       const utils::Rand&           rand,
                                                       const SystemAttributeReader& system_reader)
{
    return std::make_unique<DescriptorClusterImpl>(matcher, rand, system_reader);
}

}  // namespace dm
}  // namespace devtopo
