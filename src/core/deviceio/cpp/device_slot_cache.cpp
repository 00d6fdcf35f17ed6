// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/deviceio/device_slot_cache.hpp"

namespace rigtrack
{

const DeviceSlot* DeviceSlotCache::find(const SlotKey& key) const
{
    auto it = slots_.find(key);
    if (it == slots_.end())
    {
        return nullptr;
    }
    return &it->second;
}

DeviceSlot& DeviceSlotCache::get_or_create(const SlotKey& key)
{
    return slots_[key];
}

} // namespace rigtrack
