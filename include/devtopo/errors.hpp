//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVTOPO_ERRORS_HPP_INCLUDED
#define DEVTOPO_ERRORS_HPP_INCLUDED

#include <cerrno>

namespace devtopo
{

/// Defines error codes of data model and attribute value serialization.
///
/// Maps to `errno` values, hence `int` inheritance and zero on success.
///
enum class ErrorCode : int  // NOLINT
{
    Success          = 0,
    UnknownAttribute = ENOENT,
    NoSpace          = ENOSPC,
    InvalidData      = EINVAL,

};  // ErrorCode

using Failure = ErrorCode;

}  // namespace devtopo

#endif  // DEVTOPO_ERRORS_HPP_INCLUDED
