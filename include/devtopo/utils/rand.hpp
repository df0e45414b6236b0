//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVTOPO_UTILS_RAND_HPP_INCLUDED
#define DEVTOPO_UTILS_RAND_HPP_INCLUDED

#include <cetl/pf20/cetlpf.hpp>

#include <cstdint>
#include <functional>

namespace devtopo
{
namespace utils
{

/// Source of random bytes - fills the whole given buffer.
///
using Rand = std::function<void(cetl::span<std::uint8_t> buffer)>;

/// Fills the buffer from the system entropy source (`std::random_device`).
///
void sysRand(cetl::span<std::uint8_t> buffer);

}  // namespace utils
}  // namespace devtopo

#endif  // DEVTOPO_UTILS_RAND_HPP_INCLUDED
