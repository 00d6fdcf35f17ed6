// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>

namespace rigtrack
{

struct Vec3
{
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

// 4x4 matrix, row-major storage: element (row, col) lives at m[row * 4 + col].
// Whether the basis vectors occupy rows or columns is a property of the call site,
// see matrix_to_frame() in coordinate_conversion.hpp.
using Matrix4 = std::array<double, 16>;

constexpr Matrix4 identity_matrix()
{
    return { 1.0, 0.0, 0.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0, 0.0, 1.0 };
}

// Orthonormal coordinate frame: origin in application units plus unit X/Y/Z axes.
// Frames built from malformed matrices may violate orthonormality, see is_orthonormal().
struct CoordinateFrame
{
    Vec3 origin;
    Vec3 x_axis{ 1.0, 0.0, 0.0 };
    Vec3 y_axis{ 0.0, 1.0, 0.0 };
    Vec3 z_axis{ 0.0, 0.0, 1.0 };
};

// Origin + X/Y axes view of a CoordinateFrame. The normal is implied (X cross Y).
struct DerivedPlane
{
    Vec3 origin;
    Vec3 x_axis{ 1.0, 0.0, 0.0 };
    Vec3 y_axis{ 0.0, 1.0, 0.0 };
};

} // namespace rigtrack
