// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "device_types.hpp"

#include <rig_math/rig_types.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <unordered_map>

namespace rigtrack
{

enum class SlotState
{
    Empty, // never targeted by a query that found a device
    Stale, // holds the frame of the last Fresh transition (possibly none yet)
    Fresh, // last query was tracked and wrote this poll's data
};

constexpr std::string_view to_string(SlotState state)
{
    switch (state)
    {
    case SlotState::Empty:
        return "Empty";
    case SlotState::Stale:
        return "Stale";
    case SlotState::Fresh:
        return "Fresh";
    }
    return "Unknown";
}

struct SlotKey
{
    DeviceClass device_class = DeviceClass::HMD;
    size_t index = 0;

    bool operator==(const SlotKey& other) const = default;
};

struct SlotKeyHash
{
    size_t operator()(const SlotKey& key) const noexcept
    {
        return std::hash<size_t>{}(key.index * kAllDeviceClasses.size() + static_cast<size_t>(key.device_class));
    }
};

// Persistent state for one (class, index). Frame and plane are written together.
struct DeviceSlot
{
    SlotState state = SlotState::Empty;
    std::optional<CoordinateFrame> frame;
    std::optional<DerivedPlane> plane;
    std::optional<ControllerInputs> inputs; // controllers only

    // Calibration origin the frame is expressed relative to, as of the write
    Matrix4 calibration = identity_matrix();

    DeviceHandle last_handle = 0;
    uint64_t last_fresh_poll = 0;
};

// Owns every DeviceSlot. Slots are created lazily and live as long as the cache.
class DeviceSlotCache
{
public:
    const DeviceSlot* find(const SlotKey& key) const;

    bool contains(const SlotKey& key) const
    {
        return find(key) != nullptr;
    }

    // Creates the slot in the Empty state on first use
    DeviceSlot& get_or_create(const SlotKey& key);

    size_t size() const
    {
        return slots_.size();
    }

private:
    std::unordered_map<SlotKey, DeviceSlot, SlotKeyHash> slots_;
};

} // namespace rigtrack
