//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVTOPO_ENGINE_TEXT_ENCODER_HPP_INCLUDED
#define DEVTOPO_ENGINE_TEXT_ENCODER_HPP_INCLUDED

#include <devtopo/dm/attr_data.hpp>
#include <devtopo/dm/types.hpp>
#include <devtopo/errors.hpp>
#include <devtopo/tlv/tlv_types.hpp>
#include <devtopo/tlv/writer.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace devtopo
{
namespace engine
{

/// Renders attribute values as human readable text.
///
/// Structures are rendered as `{0: 22, 1: 1}`, arrays as `[1, 2]`. Tags of the items are shown inside of
/// structures only; the tag of the top level element (the attribute data slot) is omitted.
/// Exactly one top level element may be written.
///
class TextWriter final : public tlv::Writer
{
public:
    TextWriter() = default;

    // MARK: tlv::Writer

    CETL_NODISCARD cetl::optional<Failure> u16(const tlv::Tag tag, const std::uint16_t value) override;
    CETL_NODISCARD cetl::optional<Failure> u32(const tlv::Tag tag, const std::uint32_t value) override;
    CETL_NODISCARD cetl::optional<Failure> startStruct(const tlv::Tag tag) override;
    CETL_NODISCARD cetl::optional<Failure> startArray(const tlv::Tag tag) override;
    CETL_NODISCARD cetl::optional<Failure> endContainer() override;

    std::size_t depth() const noexcept
    {
        return open_.size();
    }

    /// `true` once the top level element is written in full.
    ///
    bool isComplete() const noexcept
    {
        return has_root_ && open_.empty();
    }

    std::string text() const
    {
        return fmt::to_string(buffer_);
    }

private:
    struct Container
    {
        char closing;
        bool in_struct;
        bool has_items;
    };

    CETL_NODISCARD cetl::optional<Failure> beginElement(const tlv::Tag tag);
    CETL_NODISCARD cetl::optional<Failure> startContainer(const tlv::Tag tag, const char opening, const char closing);

    fmt::memory_buffer     buffer_;
    std::vector<Container> open_;
    bool                   has_root_{false};

};  // TextWriter

/// Attribute data encoder which renders the value as text into the given string.
///
/// The string is assigned only when the writer is completed, so a failed or skipped read leaves it untouched.
///
class TextAttrDataEncoder final : public dm::AttrDataEncoder
{
public:
    TextAttrDataEncoder(std::string& out, const cetl::optional<dm::DataVer> dataver_filter)
        : out_{out}
        , dataver_filter_{dataver_filter}
    {
    }

    // MARK: AttrDataEncoder

    CETL_NODISCARD BeginResult::Var withDataver(const dm::DataVer dataver) override;

private:
    std::string&                      out_;
    const cetl::optional<dm::DataVer> dataver_filter_;

};  // TextAttrDataEncoder

}  // namespace engine
}  // namespace devtopo

#endif  // DEVTOPO_ENGINE_TEXT_ENCODER_HPP_INCLUDED
