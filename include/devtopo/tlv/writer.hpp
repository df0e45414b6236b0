//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVTOPO_TLV_WRITER_HPP_INCLUDED
#define DEVTOPO_TLV_WRITER_HPP_INCLUDED

#include "devtopo/errors.hpp"
#include "tlv_types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>

namespace devtopo
{
namespace tlv
{

/// Abstract interface of a serializer of attribute values.
///
/// The data model only emits elements through this interface; the actual encoding
/// (and its buffer management) belongs to the interaction layer which implements it.
/// Implementations report exhausted capacity as `NoSpace`, and malformed nesting as `InvalidData`.
///
class Writer
{
public:
    Writer(const Writer&)                = delete;
    Writer(Writer&&) noexcept            = delete;
    Writer& operator=(const Writer&)     = delete;
    Writer& operator=(Writer&&) noexcept = delete;

    virtual ~Writer() = default;

    CETL_NODISCARD virtual cetl::optional<Failure> u16(const Tag tag, const std::uint16_t value) = 0;
    CETL_NODISCARD virtual cetl::optional<Failure> u32(const Tag tag, const std::uint32_t value) = 0;

    CETL_NODISCARD virtual cetl::optional<Failure> startStruct(const Tag tag) = 0;
    CETL_NODISCARD virtual cetl::optional<Failure> startArray(const Tag tag)  = 0;

    /// Closes the most recently started container.
    ///
    CETL_NODISCARD virtual cetl::optional<Failure> endContainer() = 0;

protected:
    Writer() = default;

};  // Writer

}  // namespace tlv
}  // namespace devtopo

#endif  // DEVTOPO_TLV_WRITER_HPP_INCLUDED
