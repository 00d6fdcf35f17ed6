// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <openxr/openxr.h>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

// Scriptable state behind the mock OpenXR runtime in mock_openxr.cpp
namespace mock_openxr
{

struct MockXDev
{
    XrXDevIdMNDX id = 0;
    std::string name;
    std::string serial;
    bool can_create_space = true;
    XrPosef pose{ { 0.0f, 0.0f, 0.0f, 1.0f }, { 0.0f, 0.0f, 0.0f } };
    bool tracked = true;
};

struct MockHand
{
    bool active = true;
    float trigger_value = 0.0f;
    bool trigger_click = false;
    XrVector2f trackpad{ 0.0f, 0.0f };
    bool trackpad_click = false;
    bool trackpad_touch = false;
};

struct MockState
{
    std::vector<MockXDev> xdevs;
    uint64_t generation = 1;
    bool xdev_extension_available = true;
    std::array<MockHand, 2> hands; // left, right

    // Non-zero: xrGetXDevPropertiesMNDX fails for this id
    XrXDevIdMNDX failing_properties_id = 0;

    int xdev_lists_created = 0;
    int xdev_lists_destroyed = 0;
    int xdev_spaces_created = 0;
    int sync_calls = 0;
    int attach_calls = 0; // a session accepts only the first, as a conformant runtime does
    std::string suggested_profile;
    std::vector<std::string> suggested_binding_paths;
};

MockState& state();

// Forget every device, handle and counter
void reset();

} // namespace mock_openxr
