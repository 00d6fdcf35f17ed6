// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "device_classifier.hpp"
#include "device_runtime.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace rigtrack
{

struct ConnectionState
{
    bool success = false;
    std::string error_message;
};

// Owns the connect/update cycle against the hardware runtime
// Each update() captures one poll: the device list, every raw pose and controller
// inputs, and the class index built from them. Queries issued before the next
// update() all see that same snapshot.
class ConnectionSession
{
public:
    // Throws std::invalid_argument if runtime is null
    explicit ConnectionSession(std::unique_ptr<IDeviceRuntime> runtime);
    ~ConnectionSession();

    ConnectionSession(const ConnectionSession&) = delete;
    ConnectionSession& operator=(const ConnectionSession&) = delete;

    // Handshake with the runtime. On failure the error is recorded in state() and false is returned.
    bool connect();

    // Refresh the device list and poses for a new poll. Never throws.
    bool update();

    // Record a failure detected outside the runtime (e.g. no runtime installed)
    void report_failure(const std::string& message);

    const ConnectionState& state() const
    {
        return state_;
    }

    // Number of successful update() calls so far
    uint64_t poll_count() const
    {
        return poll_count_;
    }

    const std::vector<RawDevice>& devices() const
    {
        return devices_;
    }

    const ClassIndex& class_index() const
    {
        return class_index_;
    }

    // Device at (class, index) in the current poll, or nullptr
    const RawDevice* resolve(DeviceClass device_class, size_t index) const;

    // Device counts per class followed by one line per classified device
    std::string summary() const;

    // summary() when connected, otherwise an explanation including the recorded error
    std::string connection_message() const;

    std::string_view runtime_name() const
    {
        return runtime_->get_name();
    }

private:
    void set_failure(const std::string& message);

    std::unique_ptr<IDeviceRuntime> runtime_;
    ConnectionState state_;

    std::vector<RawDevice> devices_;
    ClassIndex class_index_;
    uint64_t poll_count_ = 0;
};

} // namespace rigtrack
