// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "device_types.hpp"
#include "tracking_config.hpp"

#include <rig_math/rig_types.hpp>

namespace rigtrack
{

// All matrices here use the column-vector convention (kBasisInColumns).

/*!
 * @brief Re-express a raw runtime pose in application space.
 *
 * Applies the same axis alignment and unit scale to every device class: the rotation
 * block is pre-multiplied by the Y-up to Z-up rotation when config.z_up is set, and the
 * translation is aligned the same way and scaled by config.units_per_meter.
 */
Matrix4 to_application_space(const Matrix4& raw, const TrackingConfig& config);

// Fixed mounting offset of a generic tracker puck: -90 degrees about the puck's local X.
// Brings the puck's mounting-face normal onto the tracked object's Z axis.
Matrix4 generic_tracker_mount_offset();

/*!
 * @brief Class-specific correction.
 *
 * GenericTracker: m * generic_tracker_mount_offset(). Every other class is returned
 * unchanged. Pure and deterministic.
 */
Matrix4 correct(const Matrix4& m, DeviceClass device_class);

} // namespace rigtrack
