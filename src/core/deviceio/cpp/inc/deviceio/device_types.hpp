// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <rig_math/rig_types.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace rigtrack
{

// Semantic role a tracked device is queried by
enum class DeviceClass
{
    HMD,
    Controller,
    Lighthouse,
    GenericTracker,
};

inline constexpr std::array<DeviceClass, 4> kAllDeviceClasses = {
    DeviceClass::HMD,
    DeviceClass::Controller,
    DeviceClass::Lighthouse,
    DeviceClass::GenericTracker,
};

constexpr std::string_view to_string(DeviceClass device_class)
{
    switch (device_class)
    {
    case DeviceClass::HMD:
        return "HMD";
    case DeviceClass::Controller:
        return "Controller";
    case DeviceClass::Lighthouse:
        return "Lighthouse";
    case DeviceClass::GenericTracker:
        return "GenericTracker";
    }
    return "Unknown";
}

// Device category as reported by the hardware runtime, before classification
enum class RuntimeDeviceKind
{
    Invalid,
    HMD,
    Controller,
    GenericTracker,
    TrackingReference,
    DisplayRedirect,
    Unknown,
};

constexpr std::string_view to_string(RuntimeDeviceKind kind)
{
    switch (kind)
    {
    case RuntimeDeviceKind::Invalid:
        return "Invalid";
    case RuntimeDeviceKind::HMD:
        return "HMD";
    case RuntimeDeviceKind::Controller:
        return "Controller";
    case RuntimeDeviceKind::GenericTracker:
        return "GenericTracker";
    case RuntimeDeviceKind::TrackingReference:
        return "TrackingReference";
    case RuntimeDeviceKind::DisplayRedirect:
        return "DisplayRedirect";
    case RuntimeDeviceKind::Unknown:
        return "Unknown";
    }
    return "Unknown";
}

// Opaque runtime identifier, only meaningful within the poll it was enumerated in
using DeviceHandle = uint64_t;

struct DeviceDescriptor
{
    DeviceHandle handle = 0;
    RuntimeDeviceKind kind = RuntimeDeviceKind::Unknown;
    std::string name;
    std::string serial;
};

// Raw pose in runtime space: column-vector convention, metres, runtime axes
struct RawPose
{
    Matrix4 matrix = identity_matrix();
    bool valid = false;
};

struct ControllerInputs
{
    bool trigger_pressed = false;
    bool trigger_clicked = false;
    float trigger_value = 0.0f; // 0.0 = released, 1.0 = fully pressed
    bool touchpad_touched = false;
    bool touchpad_clicked = false;
    float touchpad_x = 0.0f; // -1.0 = left, 1.0 = right
    float touchpad_y = 0.0f; // -1.0 = bottom, 1.0 = top
};

// Everything captured about one device during one poll
struct RawDevice
{
    DeviceDescriptor descriptor;
    RawPose pose;
    ControllerInputs inputs;
};

} // namespace rigtrack
