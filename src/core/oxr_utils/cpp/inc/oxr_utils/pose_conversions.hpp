// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <openxr/openxr.h>
#include <rig_math/rig_types.hpp>

namespace rigtrack
{

// Convert XrPosef (OpenXR) to a 4x4 rigid transform in column-vector convention
// (rotation in the upper 3x3 block, position in column 3). Units and axes are OpenXR's.
// The quaternion is used as given; a non-unit quaternion yields a non-orthonormal matrix.
constexpr Matrix4 to_matrix(const XrPosef& pose)
{
    const double x = pose.orientation.x;
    const double y = pose.orientation.y;
    const double z = pose.orientation.z;
    const double w = pose.orientation.w;

    return {
        1.0 - 2.0 * (y * y + z * z), 2.0 * (x * y - z * w),       2.0 * (x * z + y * w),       pose.position.x,
        2.0 * (x * y + z * w),       1.0 - 2.0 * (x * x + z * z), 2.0 * (y * z - x * w),       pose.position.y,
        2.0 * (x * z - y * w),       2.0 * (y * z + x * w),       1.0 - 2.0 * (x * x + y * y), pose.position.z,
        0.0,                         0.0,                         0.0,                         1.0,
    };
}

} // namespace rigtrack
