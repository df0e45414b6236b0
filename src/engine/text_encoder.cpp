//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "text_encoder.hpp"

#include <devtopo/dm/attr_data.hpp>
#include <devtopo/dm/types.hpp>
#include <devtopo/errors.hpp>
#include <devtopo/tlv/tlv_types.hpp>
#include <devtopo/tlv/writer.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <iterator>
#include <memory>
#include <string>

namespace devtopo
{
namespace engine
{
namespace
{

class TextAttrDataWriter final : public dm::AttrDataWriter
{
public:
    explicit TextAttrDataWriter(std::string& out)
        : out_{out}
    {
    }

    // MARK: AttrDataWriter

    tlv::Writer& tlv() override
    {
        return tw_;
    }

    CETL_NODISCARD cetl::optional<Failure> complete() override
    {
        if (!tw_.isComplete())
        {
            return ErrorCode::InvalidData;
        }
        out_ = tw_.text();
        return cetl::nullopt;
    }

private:
    std::string& out_;
    TextWriter   tw_;

};  // TextAttrDataWriter

}  // namespace

// MARK: - TextWriter

cetl::optional<Failure> TextWriter::u16(const tlv::Tag tag, const std::uint16_t value)
{
    if (const auto failure = beginElement(tag))
    {
        return failure;
    }
    fmt::format_to(std::back_inserter(buffer_), "{}", value);
    return cetl::nullopt;
}

cetl::optional<Failure> TextWriter::u32(const tlv::Tag tag, const std::uint32_t value)
{
    if (const auto failure = beginElement(tag))
    {
        return failure;
    }
    fmt::format_to(std::back_inserter(buffer_), "{}", value);
    return cetl::nullopt;
}

cetl::optional<Failure> TextWriter::startStruct(const tlv::Tag tag)
{
    return startContainer(tag, '{', '}');
}

cetl::optional<Failure> TextWriter::startArray(const tlv::Tag tag)
{
    return startContainer(tag, '[', ']');
}

cetl::optional<Failure> TextWriter::endContainer()
{
    if (open_.empty())
    {
        return ErrorCode::InvalidData;
    }
    buffer_.push_back(open_.back().closing);
    open_.pop_back();
    return cetl::nullopt;
}

cetl::optional<Failure> TextWriter::beginElement(const tlv::Tag tag)
{
    if (open_.empty())
    {
        // Single value per attribute.
        if (has_root_)
        {
            return ErrorCode::InvalidData;
        }
        has_root_ = true;
        return cetl::nullopt;
    }

    auto& container = open_.back();
    if (container.has_items)
    {
        fmt::format_to(std::back_inserter(buffer_), ", ");
    }
    container.has_items = true;

    if (container.in_struct && !tag.isAnonymous())
    {
        fmt::format_to(std::back_inserter(buffer_), "{}: ", tag.number());
    }
    return cetl::nullopt;
}

cetl::optional<Failure> TextWriter::startContainer(const tlv::Tag tag, const char opening, const char closing)
{
    if (const auto failure = beginElement(tag))
    {
        return failure;
    }
    buffer_.push_back(opening);
    open_.push_back({closing, opening == '{', false});
    return cetl::nullopt;
}

// MARK: - TextAttrDataEncoder

TextAttrDataEncoder::BeginResult::Var TextAttrDataEncoder::withDataver(const dm::DataVer dataver)
{
    if (dataver_filter_ && (dataver_filter_.value() == dataver))
    {
        return Skipped{};
    }
    return dm::AttrDataWriter::Ptr{std::make_unique<TextAttrDataWriter>(out_)};
}

}  // namespace engine
}  // namespace devtopo
