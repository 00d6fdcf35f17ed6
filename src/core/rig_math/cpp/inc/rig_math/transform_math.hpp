// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "rig_types.hpp"

#include <cmath>

namespace rigtrack
{

constexpr Vec3 add(const Vec3& a, const Vec3& b)
{
    return { a.x + b.x, a.y + b.y, a.z + b.z };
}

constexpr Vec3 subtract(const Vec3& a, const Vec3& b)
{
    return { a.x - b.x, a.y - b.y, a.z - b.z };
}

constexpr Vec3 scale(const Vec3& v, double s)
{
    return { v.x * s, v.y * s, v.z * s };
}

constexpr double dot(const Vec3& a, const Vec3& b)
{
    return a.x * b.x + a.y * b.y + a.z * b.z;
}

constexpr Vec3 cross(const Vec3& a, const Vec3& b)
{
    return { a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x };
}

inline double length(const Vec3& v)
{
    return std::sqrt(dot(v, v));
}

// Returns false and leaves out untouched if v is (numerically) zero length
inline bool normalize(const Vec3& v, Vec3& out, double epsilon = 1e-12)
{
    double len = length(v);
    if (len <= epsilon)
    {
        return false;
    }
    out = scale(v, 1.0 / len);
    return true;
}

// Plain 4x4 product a * b, both in row-major storage
constexpr Matrix4 multiply(const Matrix4& a, const Matrix4& b)
{
    Matrix4 result{};
    for (int row = 0; row < 4; ++row)
    {
        for (int col = 0; col < 4; ++col)
        {
            double sum = 0.0;
            for (int k = 0; k < 4; ++k)
            {
                sum += a[row * 4 + k] * b[k * 4 + col];
            }
            result[row * 4 + col] = sum;
        }
    }
    return result;
}

constexpr Matrix4 transpose(const Matrix4& m)
{
    Matrix4 result{};
    for (int row = 0; row < 4; ++row)
    {
        for (int col = 0; col < 4; ++col)
        {
            result[col * 4 + row] = m[row * 4 + col];
        }
    }
    return result;
}

/*!
 * @brief Inverse of a rigid transform in column-vector convention ([R t; 0 1]).
 *
 * Computed as [R^T, -R^T t]. The result is only meaningful when the upper 3x3 block
 * is a rotation; no general inversion is attempted.
 */
constexpr Matrix4 rigid_inverse(const Matrix4& m)
{
    Matrix4 result = identity_matrix();
    for (int row = 0; row < 3; ++row)
    {
        for (int col = 0; col < 3; ++col)
        {
            result[row * 4 + col] = m[col * 4 + row];
        }
    }
    for (int row = 0; row < 3; ++row)
    {
        result[row * 4 + 3] =
            -(result[row * 4 + 0] * m[3] + result[row * 4 + 1] * m[7] + result[row * 4 + 2] * m[11]);
    }
    return result;
}

// Rotation of +90 degrees about X in column-vector convention: (x, y, z) -> (x, -z, y).
// Maps a Y-up frame onto a Z-up frame; the former -Z forward becomes +Y.
constexpr Matrix4 y_up_to_z_up()
{
    return { 1.0, 0.0, 0.0, 0.0, 0.0, 0.0, -1.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0, 0.0, 0.0, 1.0 };
}

} // namespace rigtrack
