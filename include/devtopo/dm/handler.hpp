//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVTOPO_DM_HANDLER_HPP_INCLUDED
#define DEVTOPO_DM_HANDLER_HPP_INCLUDED

#include "attr_data.hpp"
#include "cluster.hpp"
#include "devtopo/errors.hpp"
#include "types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

namespace devtopo
{
namespace dm
{

/// Abstract interface of a cluster attributes handler.
///
class Handler
{
public:
    Handler(const Handler&)                = delete;
    Handler(Handler&&) noexcept            = delete;
    Handler& operator=(const Handler&)     = delete;
    Handler& operator=(Handler&&) noexcept = delete;

    virtual ~Handler() = default;

    CETL_NODISCARD virtual cetl::optional<Failure> read(const AttrDetails& attr, AttrDataEncoder& encoder) = 0;

protected:
    Handler() = default;

};  // Handler

/// Marks handlers which complete a read without suspending, waiting or doing blocking I/O.
///
class NonBlockingHandler : public Handler
{
protected:
    NonBlockingHandler() = default;

};  // NonBlockingHandler

/// Abstract interface of an edge-triggered change notifier.
///
class ChangeNotifier
{
public:
    ChangeNotifier(const ChangeNotifier&)                = delete;
    ChangeNotifier(ChangeNotifier&&) noexcept            = delete;
    ChangeNotifier& operator=(const ChangeNotifier&)     = delete;
    ChangeNotifier& operator=(ChangeNotifier&&) noexcept = delete;

    virtual ~ChangeNotifier() = default;

    /// @return `true` once per change (or burst of changes) since the previous consumption.
    ///
    CETL_NODISCARD virtual bool consumeChange() = 0;

protected:
    ChangeNotifier() = default;

};  // ChangeNotifier

/// Abstract interface of a reader of global (system) attributes of a cluster.
///
/// The reader answers from the cluster metadata only, and completes the writer on success.
///
class SystemAttributeReader
{
public:
    /// Gets the reader of `FeatureMap`, `AttributeList` and `ClusterRevision` global attributes.
    ///
    static const SystemAttributeReader& getDefault();

    SystemAttributeReader(const SystemAttributeReader&)                = delete;
    SystemAttributeReader(SystemAttributeReader&&) noexcept            = delete;
    SystemAttributeReader& operator=(const SystemAttributeReader&)     = delete;
    SystemAttributeReader& operator=(SystemAttributeReader&&) noexcept = delete;

    virtual ~SystemAttributeReader() = default;

    CETL_NODISCARD virtual cetl::optional<Failure> read(const Cluster&  cluster,
                                                        const AttrId    attr_id,
                                                        AttrDataWriter& writer) const = 0;

protected:
    SystemAttributeReader() = default;

};  // SystemAttributeReader

}  // namespace dm
}  // namespace devtopo

#endif  // DEVTOPO_DM_HANDLER_HPP_INCLUDED
