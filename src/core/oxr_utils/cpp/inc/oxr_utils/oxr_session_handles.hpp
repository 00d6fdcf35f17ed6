// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <openxr/openxr.h>

namespace rigtrack
{

// OpenXR handles the device runtime works against. The runtime resolves every entry
// point through xrGetInstanceProcAddr, so it does not need to link the OpenXR loader.
struct OpenXRSessionHandles
{
    XrInstance instance = XR_NULL_HANDLE;
    XrSession session = XR_NULL_HANDLE;
    XrSpace space = XR_NULL_HANDLE; // base space every device pose is reported in
    PFN_xrGetInstanceProcAddr xrGetInstanceProcAddr = nullptr;
};

} // namespace rigtrack
