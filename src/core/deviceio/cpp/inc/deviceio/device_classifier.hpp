// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "device_types.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <vector>

namespace rigtrack
{

// Maps a runtime-reported kind to its role. Kinds without a role yield std::nullopt.
std::optional<DeviceClass> classify(RuntimeDeviceKind kind);

/*!
 * @brief Per-class ordered lists of device positions for one poll.
 *
 * Each entry is a position in the device list the index was built from. Order within a
 * class is the runtime's enumeration order; entry 0 is the first device of that class
 * the runtime reported. The index is rebuilt from scratch every poll and never mutated
 * afterwards, so every query issued against one poll sees the same mapping.
 */
class ClassIndex
{
public:
    ClassIndex() = default;

    static ClassIndex build(const std::vector<RawDevice>& devices);

    const std::vector<size_t>& devices_of(DeviceClass device_class) const;

    size_t count(DeviceClass device_class) const
    {
        return devices_of(device_class).size();
    }

    // Position in the device list for (class, index), or std::nullopt if out of range
    std::optional<size_t> resolve(DeviceClass device_class, size_t index) const;

private:
    std::array<std::vector<size_t>, kAllDeviceClasses.size()> lists_;
};

} // namespace rigtrack
