// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/deviceio/connection_session.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>

namespace rigtrack
{

ConnectionSession::ConnectionSession(std::unique_ptr<IDeviceRuntime> runtime) : runtime_(std::move(runtime))
{
    if (!runtime_)
    {
        throw std::invalid_argument("ConnectionSession: runtime cannot be null");
    }
}

ConnectionSession::~ConnectionSession() = default;

bool ConnectionSession::connect()
{
    try
    {
        runtime_->connect();
    }
    catch (const std::exception& e)
    {
        set_failure(e.what());
        return false;
    }

    state_.success = true;
    state_.error_message.clear();
    std::cout << "ConnectionSession: Connected to " << runtime_->get_name() << std::endl;
    return true;
}

bool ConnectionSession::update()
{
    if (!runtime_->is_connected())
    {
        // Keep the reason recorded by connect(), if any
        if (state_.success || state_.error_message.empty())
        {
            set_failure(std::string(runtime_->get_name()) + " is not connected");
        }
        return false;
    }

    std::vector<RawDevice> devices;
    try
    {
        runtime_->begin_poll();

        for (auto& descriptor : runtime_->enumerate_devices())
        {
            RawDevice device;
            device.pose = runtime_->get_raw_pose(descriptor.handle);
            if (classify(descriptor.kind) == DeviceClass::Controller)
            {
                device.inputs = runtime_->get_button_state(descriptor.handle);
            }
            device.descriptor = std::move(descriptor);
            devices.push_back(std::move(device));
        }
    }
    catch (const std::exception& e)
    {
        set_failure(e.what());
        return false;
    }

    if (devices.size() != devices_.size())
    {
        std::cout << "ConnectionSession: " << devices.size() << " devices reported by " << runtime_->get_name()
                  << std::endl;
    }

    devices_ = std::move(devices);
    class_index_ = ClassIndex::build(devices_);
    ++poll_count_;

    state_.success = true;
    state_.error_message.clear();
    return true;
}

void ConnectionSession::report_failure(const std::string& message)
{
    set_failure(message);
}

const RawDevice* ConnectionSession::resolve(DeviceClass device_class, size_t index) const
{
    auto position = class_index_.resolve(device_class, index);
    if (!position)
    {
        return nullptr;
    }
    return &devices_[*position];
}

std::string ConnectionSession::summary() const
{
    std::ostringstream out;
    for (auto device_class : kAllDeviceClasses)
    {
        out << to_string(device_class) << ": " << class_index_.count(device_class) << "\n";
    }

    for (auto device_class : kAllDeviceClasses)
    {
        const auto& positions = class_index_.devices_of(device_class);
        for (size_t i = 0; i < positions.size(); ++i)
        {
            const auto& descriptor = devices_[positions[i]].descriptor;
            out << "  " << to_string(device_class) << "[" << i << "] " << descriptor.name;
            if (!descriptor.serial.empty())
            {
                out << " (" << descriptor.serial << ")";
            }
            out << "\n";
        }
    }
    return out.str();
}

std::string ConnectionSession::connection_message() const
{
    if (state_.success)
    {
        return summary();
    }
    return "Tracking runtime is not set up correctly. Detailed reason:\n" + state_.error_message +
           "\nCheck the runtime's error code for more information.";
}

void ConnectionSession::set_failure(const std::string& message)
{
    state_.success = false;
    state_.error_message = message;

    // Nothing from a failed poll may be resolved
    devices_.clear();
    class_index_ = ClassIndex();

    std::cerr << "ConnectionSession: " << message << std::endl;
}

} // namespace rigtrack
