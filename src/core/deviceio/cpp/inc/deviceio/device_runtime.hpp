// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "device_types.hpp"

#include <string_view>
#include <vector>

namespace rigtrack
{

// Interface to the hardware runtime (OpenXR, or a fake in tests)
// The core treats everything returned here as authoritative for the current poll.
// All methods are synchronous and may throw std::runtime_error; ConnectionSession
// is the boundary that turns those into ConnectionState.
class IDeviceRuntime
{
public:
    virtual ~IDeviceRuntime() = default;

    virtual std::string_view get_name() const = 0;

    // Handshake with the runtime - throws std::runtime_error on failure
    virtual void connect() = 0;
    virtual bool is_connected() const = 0;

    /**
     * @brief Latch the runtime state for a new poll.
     *
     * Implementations sync input state, pick the sample time used by
     * get_raw_pose(), and refresh their device list if the runtime reports a change.
     * Handles returned by a previous enumerate_devices() are invalid afterwards.
     */
    virtual void begin_poll() = 0;

    // Devices currently known to the runtime, in the runtime's enumeration order
    virtual std::vector<DeviceDescriptor> enumerate_devices() = 0;

    virtual RawPose get_raw_pose(DeviceHandle handle) = 0;

    // Only meaningful for controllers; other devices report released inputs
    virtual ControllerInputs get_button_state(DeviceHandle handle) = 0;
};

} // namespace rigtrack
