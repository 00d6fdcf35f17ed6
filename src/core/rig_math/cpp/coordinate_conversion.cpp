// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/rig_math/coordinate_conversion.hpp"

#include "inc/rig_math/transform_math.hpp"

#include <cmath>

namespace rigtrack
{

namespace
{

// Reads vector `n` (0..3) of the matrix, either row n or column n
Vec3 basis_vector(const Matrix4& m, int n, bool transpose)
{
    if (transpose)
    {
        return { m[0 * 4 + n], m[1 * 4 + n], m[2 * 4 + n] };
    }
    return { m[n * 4 + 0], m[n * 4 + 1], m[n * 4 + 2] };
}

void set_basis_vector(Matrix4& m, int n, const Vec3& v, double w, bool transpose)
{
    if (transpose)
    {
        m[0 * 4 + n] = v.x;
        m[1 * 4 + n] = v.y;
        m[2 * 4 + n] = v.z;
        m[3 * 4 + n] = w;
    }
    else
    {
        m[n * 4 + 0] = v.x;
        m[n * 4 + 1] = v.y;
        m[n * 4 + 2] = v.z;
        m[n * 4 + 3] = w;
    }
}

bool near(double value, double expected, double tolerance)
{
    return std::fabs(value - expected) <= tolerance;
}

} // anonymous namespace

CoordinateFrame matrix_to_frame(const Matrix4& m, bool transpose)
{
    CoordinateFrame frame;
    frame.x_axis = basis_vector(m, 0, transpose);
    frame.y_axis = basis_vector(m, 1, transpose);
    frame.z_axis = basis_vector(m, 2, transpose);
    frame.origin = basis_vector(m, 3, transpose);
    return frame;
}

Matrix4 frame_to_matrix(const CoordinateFrame& frame, bool transpose)
{
    Matrix4 m{};
    set_basis_vector(m, 0, frame.x_axis, 0.0, transpose);
    set_basis_vector(m, 1, frame.y_axis, 0.0, transpose);
    set_basis_vector(m, 2, frame.z_axis, 0.0, transpose);
    set_basis_vector(m, 3, frame.origin, 1.0, transpose);
    return m;
}

DerivedPlane frame_to_plane(const CoordinateFrame& frame)
{
    DerivedPlane plane;
    plane.origin = frame.origin;
    plane.x_axis = frame.x_axis;
    plane.y_axis = frame.y_axis;
    return plane;
}

Vec3 plane_normal(const DerivedPlane& plane)
{
    return cross(plane.x_axis, plane.y_axis);
}

CoordinateFrame plane_to_frame(const DerivedPlane& plane)
{
    CoordinateFrame frame;
    frame.origin = plane.origin;
    frame.x_axis = plane.x_axis;
    frame.y_axis = plane.y_axis;
    frame.z_axis = plane_normal(plane);
    return frame;
}

Matrix4 plane_to_matrix(const DerivedPlane& plane, bool transpose)
{
    return frame_to_matrix(plane_to_frame(plane), transpose);
}

bool is_orthonormal(const CoordinateFrame& frame, double tolerance)
{
    const Vec3& x = frame.x_axis;
    const Vec3& y = frame.y_axis;
    const Vec3& z = frame.z_axis;

    if (!near(dot(x, x), 1.0, tolerance) || !near(dot(y, y), 1.0, tolerance) || !near(dot(z, z), 1.0, tolerance))
    {
        return false;
    }
    if (!near(dot(x, y), 0.0, tolerance) || !near(dot(y, z), 0.0, tolerance) || !near(dot(z, x), 0.0, tolerance))
    {
        return false;
    }

    // Mirrored bases are orthonormal but not rigid
    return near(dot(cross(x, y), z), 1.0, tolerance);
}

std::optional<CoordinateFrame> orthonormalize(const CoordinateFrame& frame)
{
    CoordinateFrame result;
    result.origin = frame.origin;

    if (!normalize(frame.x_axis, result.x_axis))
    {
        return std::nullopt;
    }
    if (!normalize(cross(result.x_axis, frame.y_axis), result.z_axis))
    {
        return std::nullopt;
    }
    result.y_axis = cross(result.z_axis, result.x_axis);
    return result;
}

} // namespace rigtrack
