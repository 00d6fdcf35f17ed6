// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "rig_types.hpp"

#include <optional>

namespace rigtrack
{

// Values for the `transpose` flag of the conversions below.
// kBasisInRows:    row 0 = X axis, row 1 = Y axis, row 2 = Z axis, row 3 = origin (row-vector convention).
// kBasisInColumns: column 0 = X axis, ..., column 3 = origin (column-vector convention, as OpenXR/OpenVR poses).
// Every call site picks one of these explicitly. Mixing them up yields a valid-looking but rotated
// or mirrored frame.
inline constexpr bool kBasisInRows = false;
inline constexpr bool kBasisInColumns = true;

/*!
 * @brief Reinterprets a 4x4 matrix as an origin plus three basis vectors.
 *
 * No validation is done here: a matrix that is not a rigid transform yields a
 * non-orthonormal frame. Use is_orthonormal() / orthonormalize() to check or repair.
 */
CoordinateFrame matrix_to_frame(const Matrix4& m, bool transpose);

// Inverse of matrix_to_frame() for the same flag. The remaining row/column is (0, 0, 0, 1).
Matrix4 frame_to_matrix(const CoordinateFrame& frame, bool transpose);

// Plane origin = frame origin, plane X/Y = frame X/Y. The frame Z axis becomes the implied normal.
DerivedPlane frame_to_plane(const CoordinateFrame& frame);

// X cross Y
Vec3 plane_normal(const DerivedPlane& plane);

CoordinateFrame plane_to_frame(const DerivedPlane& plane);

// Used when a caller supplies a plane and a matrix is needed (calibration).
Matrix4 plane_to_matrix(const DerivedPlane& plane, bool transpose);

/*!
 * @brief Checks that the axes are unit length, mutually orthogonal and right-handed.
 *
 * @param tolerance Allowed absolute deviation for each length, dot product and the
 *                  handedness triple product.
 */
bool is_orthonormal(const CoordinateFrame& frame, double tolerance);

/*!
 * @brief Rebuilds a right-handed orthonormal basis from the frame's X and Y axes.
 *
 * X is normalized, Z = normalize(X x Y), Y = Z x X. The input Z axis is ignored.
 * The origin is kept as is.
 *
 * @return The repaired frame, or std::nullopt if X is zero length or X and Y are parallel.
 */
std::optional<CoordinateFrame> orthonormalize(const CoordinateFrame& frame);

} // namespace rigtrack
