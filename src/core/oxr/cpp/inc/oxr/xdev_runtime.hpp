// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <deviceio/device_runtime.hpp>
#include <oxr_utils/oxr_funcs.hpp>
#include <oxr_utils/oxr_session_handles.hpp>
#include <oxr_utils/oxr_time.hpp>

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rigtrack
{

// Maps a case-insensitive keyword found in an xdev name to a runtime device kind
struct KindRule
{
    std::string keyword;
    RuntimeDeviceKind kind;
};

// "tracker", "lighthouse"/"base station", "controller"/"knuckles"/"wand", "hmd"/"head"/"headset"
std::vector<KindRule> default_kind_rules();

// First rule whose keyword occurs in name wins; Unknown if none matches
RuntimeDeviceKind kind_from_name(std::string_view name, const std::vector<KindRule>& rules);

struct XDevRuntimeConfig
{
    std::vector<KindRule> kind_rules = default_kind_rules();
    std::string action_set_name = "rigtrack_inputs";
};

/*!
 * @brief IDeviceRuntime over OpenXR's XR_MNDX_xdev_space.
 *
 * Every xdev that can create a space becomes a device; poses are located in the
 * session's base space at the monotonic time latched by begin_poll(). Controller
 * inputs come from an action set bound to the HTC Vive controller profile, with
 * controllers assigned to /user/hand/left and /user/hand/right.
 *
 * The xdev list is recreated whenever the runtime's generation number changes,
 * which invalidates all previously returned handles.
 */
class XDevRuntime : public IDeviceRuntime
{
public:
    // Extensions the OpenXR instance must enable for this runtime
    static std::vector<std::string> get_required_extensions();

    explicit XDevRuntime(const OpenXRSessionHandles& handles, XDevRuntimeConfig config = {});
    ~XDevRuntime() override;

    XDevRuntime(const XDevRuntime&) = delete;
    XDevRuntime& operator=(const XDevRuntime&) = delete;

    std::string_view get_name() const override
    {
        return "OpenXR XR_MNDX_xdev_space";
    }

    void connect() override;
    bool is_connected() const override
    {
        return connected_;
    }

    void begin_poll() override;
    std::vector<DeviceDescriptor> enumerate_devices() override;
    RawPose get_raw_pose(DeviceHandle handle) override;
    ControllerInputs get_button_state(DeviceHandle handle) override;

private:
    enum class Hand
    {
        Left = 0,
        Right = 1,
    };

    struct XDevEntry
    {
        DeviceDescriptor descriptor;
        XrSpacePtr space;
        std::optional<Hand> hand;
    };

    void create_actions();
    XrAction create_action(XrActionType type, const char* name, const char* localized_name);
    void suggest_bindings();
    void rebuild_device_list();
    void assign_hands();

    const XDevEntry* find_entry(DeviceHandle handle) const;
    bool read_boolean(XrAction action, XrPath subaction_path) const;

    OpenXRSessionHandles handles_;
    XDevRuntimeConfig config_;
    bool connected_ = false;

    OpenXRCoreFunctions core_funcs_{};
    XDevSpaceFunctions xdev_funcs_{};
    std::unique_ptr<XrTimeConverter> time_converter_;
    XrTime sample_time_ = 0;

    XrActionSetPtr action_set_;
    bool action_set_attached_ = false; // a session accepts one attach for its lifetime
    XrAction trigger_value_action_ = XR_NULL_HANDLE;
    XrAction trigger_click_action_ = XR_NULL_HANDLE;
    XrAction trackpad_action_ = XR_NULL_HANDLE;
    XrAction trackpad_click_action_ = XR_NULL_HANDLE;
    XrAction trackpad_touch_action_ = XR_NULL_HANDLE;
    std::array<XrPath, 2> hand_paths_{ XR_NULL_PATH, XR_NULL_PATH };

    XrXDevListPtr xdev_list_;
    uint64_t list_generation_ = 0;
    std::vector<XDevEntry> devices_;
};

} // namespace rigtrack
