// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/oxr/xdev_runtime.hpp"

#include <oxr_utils/pose_conversions.hpp>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace rigtrack
{

namespace
{

std::string to_lower(std::string_view text)
{
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

void check_xr_result(XrResult result, const std::string& what)
{
    if (XR_FAILED(result))
    {
        throw std::runtime_error(what + " failed: " + std::to_string(result));
    }
}

} // anonymous namespace

std::vector<KindRule> default_kind_rules()
{
    // Ordered: "tracker" must be tested before "head" so "Head Tracker" stays a tracker
    return {
        { "tracker", RuntimeDeviceKind::GenericTracker },
        { "lighthouse", RuntimeDeviceKind::TrackingReference },
        { "base station", RuntimeDeviceKind::TrackingReference },
        { "controller", RuntimeDeviceKind::Controller },
        { "knuckles", RuntimeDeviceKind::Controller },
        { "wand", RuntimeDeviceKind::Controller },
        { "hmd", RuntimeDeviceKind::HMD },
        { "headset", RuntimeDeviceKind::HMD },
        { "head", RuntimeDeviceKind::HMD },
    };
}

RuntimeDeviceKind kind_from_name(std::string_view name, const std::vector<KindRule>& rules)
{
    const std::string lowered = to_lower(name);
    for (const auto& rule : rules)
    {
        if (!rule.keyword.empty() && lowered.find(to_lower(rule.keyword)) != std::string::npos)
        {
            return rule.kind;
        }
    }
    return RuntimeDeviceKind::Unknown;
}

std::vector<std::string> XDevRuntime::get_required_extensions()
{
    std::vector<std::string> extensions = { XR_MNDX_XDEV_SPACE_EXTENSION_NAME };
    for (const auto& ext : XrTimeConverter::get_required_extensions())
    {
        extensions.push_back(ext);
    }
    return extensions;
}

XDevRuntime::XDevRuntime(const OpenXRSessionHandles& handles, XDevRuntimeConfig config)
    : handles_(handles), config_(std::move(config))
{
}

XDevRuntime::~XDevRuntime()
{
    // Spaces reference the list, so release them before it
    devices_.clear();
    xdev_list_.reset();
    action_set_.reset();
}

void XDevRuntime::connect()
{
    connected_ = false;

    if (handles_.instance == XR_NULL_HANDLE || handles_.session == XR_NULL_HANDLE ||
        handles_.space == XR_NULL_HANDLE || handles_.xrGetInstanceProcAddr == nullptr)
    {
        throw std::runtime_error("XDevRuntime: OpenXR session handles are incomplete");
    }

    core_funcs_ = OpenXRCoreFunctions::load(handles_.instance, handles_.xrGetInstanceProcAddr);
    xdev_funcs_ = XDevSpaceFunctions::load(handles_.instance, handles_.xrGetInstanceProcAddr);
    time_converter_ = std::make_unique<XrTimeConverter>(handles_);

    // A retry after a failure past the attach keeps the attached action set
    if (!action_set_attached_)
    {
        action_set_.reset();
        create_actions();
        suggest_bindings();

        XrSessionActionSetsAttachInfo attach_info{ XR_TYPE_SESSION_ACTION_SETS_ATTACH_INFO };
        XrActionSet action_set = action_set_.get();
        attach_info.countActionSets = 1;
        attach_info.actionSets = &action_set;
        check_xr_result(
            core_funcs_.xrAttachSessionActionSets(handles_.session, &attach_info), "xrAttachSessionActionSets");
        action_set_attached_ = true;
    }

    rebuild_device_list();

    connected_ = true;
    std::cout << "XDevRuntime: Connected, " << devices_.size() << " xdevs" << std::endl;
}

void XDevRuntime::create_actions()
{
    check_xr_result(core_funcs_.xrStringToPath(handles_.instance, "/user/hand/left", &hand_paths_[0]),
                    "xrStringToPath(/user/hand/left)");
    check_xr_result(core_funcs_.xrStringToPath(handles_.instance, "/user/hand/right", &hand_paths_[1]),
                    "xrStringToPath(/user/hand/right)");

    XrActionSetCreateInfo set_info{ XR_TYPE_ACTION_SET_CREATE_INFO };
    strncpy(set_info.actionSetName, config_.action_set_name.c_str(), XR_MAX_ACTION_SET_NAME_SIZE - 1);
    strncpy(set_info.localizedActionSetName, "Rig Tracking Inputs", XR_MAX_LOCALIZED_ACTION_SET_NAME_SIZE - 1);
    set_info.priority = 0;
    action_set_ = createActionSet(core_funcs_, handles_.instance, set_info);

    trigger_value_action_ = create_action(XR_ACTION_TYPE_FLOAT_INPUT, "trigger_value", "Trigger Value");
    trigger_click_action_ = create_action(XR_ACTION_TYPE_BOOLEAN_INPUT, "trigger_click", "Trigger Click");
    trackpad_action_ = create_action(XR_ACTION_TYPE_VECTOR2F_INPUT, "trackpad", "Trackpad");
    trackpad_click_action_ = create_action(XR_ACTION_TYPE_BOOLEAN_INPUT, "trackpad_click", "Trackpad Click");
    trackpad_touch_action_ = create_action(XR_ACTION_TYPE_BOOLEAN_INPUT, "trackpad_touch", "Trackpad Touch");
}

XrAction XDevRuntime::create_action(XrActionType type, const char* name, const char* localized_name)
{
    XrActionCreateInfo info{ XR_TYPE_ACTION_CREATE_INFO };
    info.actionType = type;
    strncpy(info.actionName, name, XR_MAX_ACTION_NAME_SIZE - 1);
    strncpy(info.localizedActionName, localized_name, XR_MAX_LOCALIZED_ACTION_NAME_SIZE - 1);
    info.countSubactionPaths = static_cast<uint32_t>(hand_paths_.size());
    info.subactionPaths = hand_paths_.data();

    // Actions are destroyed together with their action set
    XrAction action = XR_NULL_HANDLE;
    check_xr_result(
        core_funcs_.xrCreateAction(action_set_.get(), &info, &action), std::string("xrCreateAction(") + name + ")");
    return action;
}

void XDevRuntime::suggest_bindings()
{
    struct ComponentBinding
    {
        XrAction action;
        const char* component;
    };
    const ComponentBinding components[] = {
        { trigger_value_action_, "/input/trigger/value" },   { trigger_click_action_, "/input/trigger/click" },
        { trackpad_action_, "/input/trackpad" },             { trackpad_click_action_, "/input/trackpad/click" },
        { trackpad_touch_action_, "/input/trackpad/touch" },
    };

    std::vector<XrActionSuggestedBinding> bindings;
    for (const char* hand : { "/user/hand/left", "/user/hand/right" })
    {
        for (const auto& component : components)
        {
            const std::string path_string = std::string(hand) + component.component;
            XrPath path = XR_NULL_PATH;
            check_xr_result(core_funcs_.xrStringToPath(handles_.instance, path_string.c_str(), &path),
                            "xrStringToPath(" + path_string + ")");
            bindings.push_back({ component.action, path });
        }
    }

    XrPath profile_path = XR_NULL_PATH;
    check_xr_result(
        core_funcs_.xrStringToPath(handles_.instance, "/interaction_profiles/htc/vive_controller", &profile_path),
        "xrStringToPath(vive_controller)");

    XrInteractionProfileSuggestedBinding suggested{ XR_TYPE_INTERACTION_PROFILE_SUGGESTED_BINDING };
    suggested.interactionProfile = profile_path;
    suggested.countSuggestedBindings = static_cast<uint32_t>(bindings.size());
    suggested.suggestedBindings = bindings.data();
    check_xr_result(core_funcs_.xrSuggestInteractionProfileBindings(handles_.instance, &suggested),
                    "xrSuggestInteractionProfileBindings");
}

void XDevRuntime::rebuild_device_list()
{
    // Build the new list aside; on failure the previous list and generation stay, so the next poll retries
    XrXDevListPtr list = createXDevList(xdev_funcs_, handles_.session);
    uint64_t generation = 0;
    check_xr_result(
        xdev_funcs_.xrGetXDevListGenerationNumberMNDX(list.get(), &generation), "xrGetXDevListGenerationNumberMNDX");

    uint32_t count = 0;
    check_xr_result(xdev_funcs_.xrEnumerateXDevsMNDX(list.get(), 0, &count, nullptr), "xrEnumerateXDevsMNDX");

    std::vector<XrXDevIdMNDX> ids(count);
    if (count > 0)
    {
        check_xr_result(
            xdev_funcs_.xrEnumerateXDevsMNDX(list.get(), count, &count, ids.data()), "xrEnumerateXDevsMNDX");
        ids.resize(count);
    }

    std::vector<XDevEntry> entries;
    entries.reserve(ids.size());
    for (const auto id : ids)
    {
        XrGetXDevInfoMNDX get_info{ XR_TYPE_GET_XDEV_INFO_MNDX };
        get_info.id = id;

        XrXDevPropertiesMNDX properties{ XR_TYPE_XDEV_PROPERTIES_MNDX };
        check_xr_result(xdev_funcs_.xrGetXDevPropertiesMNDX(list.get(), &get_info, &properties),
                        "xrGetXDevPropertiesMNDX(" + std::to_string(id) + ")");

        XDevEntry entry;
        entry.descriptor.handle = static_cast<DeviceHandle>(id);
        entry.descriptor.name = properties.name;
        entry.descriptor.serial = properties.serial;

        if (properties.canCreateSpace)
        {
            entry.descriptor.kind = kind_from_name(entry.descriptor.name, config_.kind_rules);
            entry.space = createXDevSpace(xdev_funcs_, core_funcs_, handles_.session, list.get(), id);
        }
        else
        {
            entry.descriptor.kind = RuntimeDeviceKind::Invalid;
        }

        entries.push_back(std::move(entry));
    }

    // Old spaces go before the list they were created from
    devices_.clear();
    xdev_list_ = std::move(list);
    devices_ = std::move(entries);
    list_generation_ = generation;

    assign_hands();
}

void XDevRuntime::assign_hands()
{
    std::array<bool, 2> taken{ false, false };

    // Explicit "left"/"right" in the name first, then fill remaining hands in enumeration order
    for (auto& entry : devices_)
    {
        if (entry.descriptor.kind != RuntimeDeviceKind::Controller)
        {
            continue;
        }
        const std::string lowered = to_lower(entry.descriptor.name);
        if (lowered.find("left") != std::string::npos && !taken[0])
        {
            entry.hand = Hand::Left;
            taken[0] = true;
        }
        else if (lowered.find("right") != std::string::npos && !taken[1])
        {
            entry.hand = Hand::Right;
            taken[1] = true;
        }
    }

    for (auto& entry : devices_)
    {
        if (entry.descriptor.kind != RuntimeDeviceKind::Controller || entry.hand)
        {
            continue;
        }
        if (!taken[0])
        {
            entry.hand = Hand::Left;
            taken[0] = true;
        }
        else if (!taken[1])
        {
            entry.hand = Hand::Right;
            taken[1] = true;
        }
    }
}

void XDevRuntime::begin_poll()
{
    if (!connected_)
    {
        throw std::runtime_error("XDevRuntime: begin_poll() called before connect()");
    }

    sample_time_ = time_converter_->os_monotonic_now();

    XrActiveActionSet active_set{ action_set_.get(), XR_NULL_PATH };
    XrActionsSyncInfo sync_info{ XR_TYPE_ACTIONS_SYNC_INFO };
    sync_info.countActiveActionSets = 1;
    sync_info.activeActionSets = &active_set;
    check_xr_result(core_funcs_.xrSyncActions(handles_.session, &sync_info), "xrSyncActions");

    uint64_t generation = 0;
    check_xr_result(xdev_funcs_.xrGetXDevListGenerationNumberMNDX(xdev_list_.get(), &generation),
                    "xrGetXDevListGenerationNumberMNDX");
    if (generation != list_generation_)
    {
        std::cout << "XDevRuntime: Device list changed (generation " << list_generation_ << " -> " << generation
                  << "), rebuilding" << std::endl;
        rebuild_device_list();
    }
}

std::vector<DeviceDescriptor> XDevRuntime::enumerate_devices()
{
    std::vector<DeviceDescriptor> descriptors;
    descriptors.reserve(devices_.size());
    for (const auto& entry : devices_)
    {
        descriptors.push_back(entry.descriptor);
    }
    return descriptors;
}

const XDevRuntime::XDevEntry* XDevRuntime::find_entry(DeviceHandle handle) const
{
    for (const auto& entry : devices_)
    {
        if (entry.descriptor.handle == handle)
        {
            return &entry;
        }
    }
    return nullptr;
}

RawPose XDevRuntime::get_raw_pose(DeviceHandle handle)
{
    RawPose pose;

    const XDevEntry* entry = find_entry(handle);
    if (entry == nullptr || !entry->space)
    {
        return pose;
    }

    XrSpaceLocation location{ XR_TYPE_SPACE_LOCATION };
    XrResult result = core_funcs_.xrLocateSpace(entry->space.get(), handles_.space, sample_time_, &location);
    if (XR_FAILED(result))
    {
        return pose;
    }

    const XrSpaceLocationFlags required =
        XR_SPACE_LOCATION_POSITION_VALID_BIT | XR_SPACE_LOCATION_ORIENTATION_VALID_BIT;
    if ((location.locationFlags & required) != required)
    {
        return pose;
    }

    pose.matrix = to_matrix(location.pose);
    pose.valid = true;
    return pose;
}

bool XDevRuntime::read_boolean(XrAction action, XrPath subaction_path) const
{
    XrActionStateGetInfo get_info{ XR_TYPE_ACTION_STATE_GET_INFO };
    get_info.action = action;
    get_info.subactionPath = subaction_path;

    XrActionStateBoolean state{ XR_TYPE_ACTION_STATE_BOOLEAN };
    if (XR_FAILED(core_funcs_.xrGetActionStateBoolean(handles_.session, &get_info, &state)) || !state.isActive)
    {
        return false;
    }
    return state.currentState == XR_TRUE;
}

ControllerInputs XDevRuntime::get_button_state(DeviceHandle handle)
{
    ControllerInputs inputs;

    const XDevEntry* entry = find_entry(handle);
    if (entry == nullptr || !entry->hand)
    {
        return inputs;
    }

    const XrPath hand_path = hand_paths_[static_cast<size_t>(*entry->hand)];

    XrActionStateGetInfo get_info{ XR_TYPE_ACTION_STATE_GET_INFO };
    get_info.subactionPath = hand_path;

    get_info.action = trigger_value_action_;
    XrActionStateFloat trigger{ XR_TYPE_ACTION_STATE_FLOAT };
    if (XR_SUCCEEDED(core_funcs_.xrGetActionStateFloat(handles_.session, &get_info, &trigger)) && trigger.isActive)
    {
        inputs.trigger_value = trigger.currentState;
    }

    get_info.action = trackpad_action_;
    XrActionStateVector2f trackpad{ XR_TYPE_ACTION_STATE_VECTOR2F };
    if (XR_SUCCEEDED(core_funcs_.xrGetActionStateVector2f(handles_.session, &get_info, &trackpad)) &&
        trackpad.isActive)
    {
        inputs.touchpad_x = trackpad.currentState.x;
        inputs.touchpad_y = trackpad.currentState.y;
    }

    inputs.trigger_clicked = read_boolean(trigger_click_action_, hand_path);
    inputs.touchpad_clicked = read_boolean(trackpad_click_action_, hand_path);
    inputs.touchpad_touched = read_boolean(trackpad_touch_action_, hand_path);

    // Pressed is derived from value by the query layer with its configured threshold
    inputs.trigger_pressed = inputs.trigger_clicked;
    return inputs;
}

} // namespace rigtrack
