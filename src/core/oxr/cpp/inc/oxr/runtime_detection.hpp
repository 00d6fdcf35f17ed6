// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <vector>

namespace rigtrack
{

struct RuntimeDetection
{
    bool found = false;
    std::string manifest_path;
    // Every location checked, in order; used to build the failure message
    std::vector<std::string> searched;
};

// Locate the active OpenXR runtime manifest the loader would use:
// XR_RUNTIME_JSON, then the XDG config locations for openxr/1/active_runtime.json
RuntimeDetection detect_openxr_runtime();

// Message for ConnectionSession::report_failure() when nothing was found
std::string describe_missing_runtime(const RuntimeDetection& detection);

} // namespace rigtrack
