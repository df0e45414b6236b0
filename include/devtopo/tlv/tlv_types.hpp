//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVTOPO_TLV_TYPES_HPP_INCLUDED
#define DEVTOPO_TLV_TYPES_HPP_INCLUDED

#include <cstdint>

namespace devtopo
{
namespace tlv
{

/// Element tag.
///
/// Only anonymous and one-byte context-specific tags are used by the data model.
///
class Tag final
{
public:
    enum class Control : std::uint8_t
    {
        Anonymous = 0x00,
        Context   = 0x20,

    };  // Control

    static constexpr Tag anonymous() noexcept
    {
        return Tag{Control::Anonymous, 0};
    }

    static constexpr Tag context(const std::uint8_t number) noexcept
    {
        return Tag{Control::Context, number};
    }

    constexpr Control control() const noexcept
    {
        return control_;
    }

    constexpr std::uint8_t number() const noexcept
    {
        return number_;
    }

    constexpr bool isAnonymous() const noexcept
    {
        return control_ == Control::Anonymous;
    }

    friend constexpr bool operator==(const Tag& lhs, const Tag& rhs) noexcept
    {
        return (lhs.control_ == rhs.control_) && (lhs.number_ == rhs.number_);
    }

    friend constexpr bool operator!=(const Tag& lhs, const Tag& rhs) noexcept
    {
        return !(lhs == rhs);
    }

private:
    constexpr Tag(const Control control, const std::uint8_t number) noexcept
        : control_{control}
        , number_{number}
    {
    }

    Control      control_;
    std::uint8_t number_;

};  // Tag

}  // namespace tlv
}  // namespace devtopo

#endif  // DEVTOPO_TLV_TYPES_HPP_INCLUDED
