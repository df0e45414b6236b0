//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "devtopo/utils/rand.hpp"

#include <cetl/pf20/cetlpf.hpp>

#include <cstdint>
#include <random>

namespace devtopo
{
namespace utils
{

void sysRand(cetl::span<std::uint8_t> buffer)
{
    std::random_device device;

    std::random_device::result_type bits      = 0;
    std::size_t                     bits_left = 0;
    for (auto& byte : buffer)
    {
        if (bits_left == 0)
        {
            bits      = device();
            bits_left = sizeof(bits);
        }
        byte = static_cast<std::uint8_t>(bits);
        bits >>= 8U;  // NOLINT(*-magic-numbers)
        --bits_left;
    }
}

}  // namespace utils
}  // namespace devtopo
