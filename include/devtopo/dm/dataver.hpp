//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVTOPO_DM_DATAVER_HPP_INCLUDED
#define DEVTOPO_DM_DATAVER_HPP_INCLUDED

#include "devtopo/utils/rand.hpp"
#include "types.hpp"

#include <cetl/cetl.hpp>

#include <atomic>

namespace devtopo
{
namespace dm
{

/// Data version of a cluster instance.
///
/// The version is advanced on every change of the cluster data, and the change is also
/// latched into a single-slot "changed" flag. Consumption of the flag is edge-triggered -
/// a burst of changes between two consumptions is reported once.
///
/// `changed` may be called by mutators concurrently with readers of `get` and `consumeChange`.
///
class Dataver final
{
public:
    /// Constructs the version with a random initial value (as the interaction model requires).
    ///
    explicit Dataver(const utils::Rand& rand);

    explicit Dataver(const DataVer initial) noexcept
        : version_{initial}
        , changed_{false}
    {
    }

    Dataver(const Dataver&)                = delete;
    Dataver(Dataver&&) noexcept            = delete;
    Dataver& operator=(const Dataver&)     = delete;
    Dataver& operator=(Dataver&&) noexcept = delete;

    ~Dataver() = default;

    CETL_NODISCARD DataVer get() const noexcept
    {
        return version_.load(std::memory_order_acquire);
    }

    /// Advances the version (wrapping around at 2^32) and raises the change flag.
    ///
    /// @return The new version.
    ///
    DataVer changed() noexcept
    {
        const DataVer new_version = version_.fetch_add(1, std::memory_order_acq_rel) + 1;
        changed_.store(true, std::memory_order_release);
        return new_version;
    }

    /// Consumes a pending change (if any).
    ///
    /// @return `true` exactly once per burst of `changed` calls.
    ///
    CETL_NODISCARD bool consumeChange() noexcept
    {
        return changed_.exchange(false, std::memory_order_acq_rel);
    }

private:
    std::atomic<DataVer> version_;
    std::atomic<bool>    changed_;

};  // Dataver

}  // namespace dm
}  // namespace devtopo

#endif  // DEVTOPO_DM_DATAVER_HPP_INCLUDED
