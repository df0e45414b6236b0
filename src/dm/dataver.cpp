//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "devtopo/dm/dataver.hpp"

#include "devtopo/dm/types.hpp"
#include "devtopo/utils/rand.hpp"

#include <cetl/cetl.hpp>

#include <array>
#include <cstdint>

namespace devtopo
{
namespace dm
{
namespace
{

DataVer randomVersion(const utils::Rand& rand)
{
    CETL_DEBUG_ASSERT(rand, "");

    std::array<std::uint8_t, sizeof(DataVer)> buffer{};
    rand({buffer.data(), buffer.size()});

    // Big-endian, so the same random bytes give the same version on any host.
    DataVer version = 0;
    for (const auto byte : buffer)
    {
        version = (version << 8U) | byte;  // NOLINT(*-magic-numbers)
    }
    return version;
}

}  // namespace

Dataver::Dataver(const utils::Rand& rand)
    : version_{randomVersion(rand)}
    , changed_{false}
{
}

}  // namespace dm
}  // namespace devtopo
