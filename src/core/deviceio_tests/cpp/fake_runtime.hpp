// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <deviceio/connection_session.hpp>
#include <deviceio/device_runtime.hpp>

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace rigtrack
{
namespace testing
{

struct FakeDevice
{
    DeviceDescriptor descriptor;
    RawPose pose;
    ControllerInputs inputs;
};

// Devices and failures the test scripts; the runtime reads them on every call
struct FakeRig
{
    std::vector<FakeDevice> devices;
    std::string connect_error; // non-empty: connect() throws with this message
    std::string poll_error; // non-empty: begin_poll() throws with this message
    int begin_poll_calls = 0;
    int button_state_calls = 0;
};

// Column-vector pose with identity rotation at (x, y, z)
inline RawPose translation_pose(double x, double y, double z)
{
    RawPose pose;
    pose.matrix = identity_matrix();
    pose.matrix[3] = x;
    pose.matrix[7] = y;
    pose.matrix[11] = z;
    pose.valid = true;
    return pose;
}

inline FakeDevice make_device(DeviceHandle handle, RuntimeDeviceKind kind, std::string name, RawPose pose = {})
{
    FakeDevice device;
    device.descriptor.handle = handle;
    device.descriptor.kind = kind;
    device.descriptor.name = std::move(name);
    device.descriptor.serial = "SN-" + std::to_string(handle);
    device.pose = pose;
    return device;
}

class FakeRuntime : public IDeviceRuntime
{
public:
    explicit FakeRuntime(std::shared_ptr<FakeRig> rig) : rig_(std::move(rig))
    {
    }

    std::string_view get_name() const override
    {
        return "FakeRuntime";
    }

    void connect() override
    {
        if (!rig_->connect_error.empty())
        {
            throw std::runtime_error(rig_->connect_error);
        }
        connected_ = true;
    }

    bool is_connected() const override
    {
        return connected_;
    }

    void begin_poll() override
    {
        ++rig_->begin_poll_calls;
        if (!rig_->poll_error.empty())
        {
            throw std::runtime_error(rig_->poll_error);
        }
    }

    std::vector<DeviceDescriptor> enumerate_devices() override
    {
        std::vector<DeviceDescriptor> result;
        for (const auto& device : rig_->devices)
        {
            result.push_back(device.descriptor);
        }
        return result;
    }

    RawPose get_raw_pose(DeviceHandle handle) override
    {
        const FakeDevice* device = find(handle);
        return device ? device->pose : RawPose{};
    }

    ControllerInputs get_button_state(DeviceHandle handle) override
    {
        ++rig_->button_state_calls;
        const FakeDevice* device = find(handle);
        return device ? device->inputs : ControllerInputs{};
    }

private:
    const FakeDevice* find(DeviceHandle handle) const
    {
        for (const auto& device : rig_->devices)
        {
            if (device.descriptor.handle == handle)
            {
                return &device;
            }
        }
        return nullptr;
    }

    std::shared_ptr<FakeRig> rig_;
    bool connected_ = false;
};

// Session over a FakeRuntime, already connected (unless the rig scripts a connect error)
inline std::unique_ptr<ConnectionSession> make_session(const std::shared_ptr<FakeRig>& rig)
{
    auto session = std::make_unique<ConnectionSession>(std::make_unique<FakeRuntime>(rig));
    session->connect();
    return session;
}

} // namespace testing
} // namespace rigtrack
