// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/deviceio/device_classifier.hpp"

namespace rigtrack
{

std::optional<DeviceClass> classify(RuntimeDeviceKind kind)
{
    switch (kind)
    {
    case RuntimeDeviceKind::HMD:
        return DeviceClass::HMD;
    case RuntimeDeviceKind::Controller:
        return DeviceClass::Controller;
    case RuntimeDeviceKind::TrackingReference:
        return DeviceClass::Lighthouse;
    case RuntimeDeviceKind::GenericTracker:
        return DeviceClass::GenericTracker;
    case RuntimeDeviceKind::Invalid:
    case RuntimeDeviceKind::DisplayRedirect:
    case RuntimeDeviceKind::Unknown:
        break;
    }
    return std::nullopt;
}

ClassIndex ClassIndex::build(const std::vector<RawDevice>& devices)
{
    ClassIndex index;
    for (size_t i = 0; i < devices.size(); ++i)
    {
        auto device_class = classify(devices[i].descriptor.kind);
        if (device_class)
        {
            index.lists_[static_cast<size_t>(*device_class)].push_back(i);
        }
    }
    return index;
}

const std::vector<size_t>& ClassIndex::devices_of(DeviceClass device_class) const
{
    return lists_[static_cast<size_t>(device_class)];
}

std::optional<size_t> ClassIndex::resolve(DeviceClass device_class, size_t index) const
{
    const auto& list = devices_of(device_class);
    if (index >= list.size())
    {
        return std::nullopt;
    }
    return list[index];
}

} // namespace rigtrack
