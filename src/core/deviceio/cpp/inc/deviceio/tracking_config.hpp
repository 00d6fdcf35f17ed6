// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string_view>

namespace rigtrack
{

// What to do with a corrected pose whose basis is not orthonormal
enum class DegeneratePosePolicy
{
    PassThrough, // convert as is, the frame may be skewed
    Orthonormalize, // rebuild the basis from X and Y, reject if that is impossible
    Reject, // leave the slot untouched and report MalformedPose
};

std::optional<DegeneratePosePolicy> parse_degenerate_pose_policy(std::string_view text);

/**
 * @brief Configuration of the pose pipeline.
 */
struct TrackingConfig
{
    double units_per_meter = 1.0;

    // Re-express the runtime's Y-up space as Z-up (former -Z forward becomes +Y)
    bool z_up = true;

    DegeneratePosePolicy degenerate_pose_policy = DegeneratePosePolicy::Orthonormalize;
    double orthonormal_tolerance = 1e-4;

    // Trigger value above which trigger_pressed is reported
    float trigger_press_threshold = 0.05f;

    /**
     * @brief Overlay RIGTRACK_* environment variables on a base configuration.
     *
     * Recognized: RIGTRACK_UNITS_PER_METER, RIGTRACK_Z_UP (0/1),
     * RIGTRACK_DEGENERATE_POSE (pass/normalize/reject), RIGTRACK_TRIGGER_THRESHOLD.
     * Values that do not parse are reported on std::cerr and ignored.
     */
    static TrackingConfig from_environment(const TrackingConfig& base);

    // Overlay on the default configuration
    static TrackingConfig from_environment();
};

} // namespace rigtrack
