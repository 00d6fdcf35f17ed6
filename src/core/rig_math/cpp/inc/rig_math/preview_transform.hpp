// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "coordinate_conversion.hpp"

#include <array>
#include <optional>

namespace rigtrack
{

// What the rendering collaborator can do with a transform. Negotiated once at startup.
struct RenderCapabilities
{
    bool supports_transform = false;
};

using PreviewTransform = std::array<double, 16>;

// Transform in the rendering collaborator's layout:
//   X axis, 0, Y axis, 0, Z axis, 0, origin, 1
// Empty when the collaborator cannot apply transforms.
inline std::optional<PreviewTransform> make_preview_transform(const CoordinateFrame& frame,
                                                              const RenderCapabilities& capabilities)
{
    if (!capabilities.supports_transform)
    {
        return std::nullopt;
    }
    return frame_to_matrix(frame, kBasisInRows);
}

} // namespace rigtrack
