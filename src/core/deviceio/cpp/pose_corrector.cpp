// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/deviceio/pose_corrector.hpp"

#include <rig_math/transform_math.hpp>

namespace rigtrack
{

Matrix4 to_application_space(const Matrix4& raw, const TrackingConfig& config)
{
    Matrix4 result = config.z_up ? multiply(y_up_to_z_up(), raw) : raw;

    result[3] *= config.units_per_meter;
    result[7] *= config.units_per_meter;
    result[11] *= config.units_per_meter;
    return result;
}

Matrix4 generic_tracker_mount_offset()
{
    // Rx(-90): (x, y, z) -> (x, z, -y)
    return { 1.0, 0.0, 0.0, 0.0, 0.0, 0.0, 1.0, 0.0, 0.0, -1.0, 0.0, 0.0, 0.0, 0.0, 0.0, 1.0 };
}

Matrix4 correct(const Matrix4& m, DeviceClass device_class)
{
    if (device_class == DeviceClass::GenericTracker)
    {
        return multiply(m, generic_tracker_mount_offset());
    }
    return m;
}

} // namespace rigtrack
