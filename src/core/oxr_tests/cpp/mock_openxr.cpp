// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "mock_openxr.hpp"

#include <openxr/openxr.h>

#include <cstdint>
#include <cstring>
#include <ctime>
#include <map>
#include <string>
#include <vector>

namespace mock_openxr
{

namespace
{

struct MockList
{
    std::vector<MockXDev> xdevs; // snapshot at creation
};

struct Registry
{
    MockState state;

    uintptr_t next_handle = 0x1000;
    std::map<std::string, XrPath> paths;
    std::map<XrPath, std::string> path_names;
    std::map<XrAction, std::string> actions;
    std::map<XrXDevListMNDX, MockList> lists;
    std::map<XrSpace, XrXDevIdMNDX> spaces;
};

Registry& registry()
{
    static Registry instance;
    return instance;
}

template <typename Handle>
Handle new_handle()
{
    return reinterpret_cast<Handle>(registry().next_handle++);
}

const MockXDev* find_xdev(XrXDevIdMNDX id)
{
    for (const auto& xdev : registry().state.xdevs)
    {
        if (xdev.id == id)
        {
            return &xdev;
        }
    }
    return nullptr;
}

// Hand addressed by a subaction path, or nullptr
const MockHand* find_hand(XrPath subaction_path)
{
    auto it = registry().path_names.find(subaction_path);
    if (it == registry().path_names.end())
    {
        return nullptr;
    }
    if (it->second == "/user/hand/left")
    {
        return &registry().state.hands[0];
    }
    if (it->second == "/user/hand/right")
    {
        return &registry().state.hands[1];
    }
    return nullptr;
}

std::string action_name(XrAction action)
{
    auto it = registry().actions.find(action);
    return it == registry().actions.end() ? std::string() : it->second;
}

// --- Core functions ---

XRAPI_ATTR XrResult XRAPI_CALL mock_xrDestroySpace(XrSpace space)
{
    registry().spaces.erase(space);
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrLocateSpace(XrSpace space, XrSpace baseSpace, XrTime time, XrSpaceLocation* location)
{
    auto it = registry().spaces.find(space);
    if (it == registry().spaces.end())
    {
        return XR_ERROR_HANDLE_INVALID;
    }

    const MockXDev* xdev = find_xdev(it->second);
    if (xdev == nullptr || !xdev->tracked)
    {
        location->locationFlags = 0;
        return XR_SUCCESS;
    }

    location->locationFlags = XR_SPACE_LOCATION_POSITION_VALID_BIT | XR_SPACE_LOCATION_ORIENTATION_VALID_BIT;
    location->pose = xdev->pose;
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrStringToPath(XrInstance instance, const char* pathString, XrPath* path)
{
    auto& reg = registry();
    auto it = reg.paths.find(pathString);
    if (it == reg.paths.end())
    {
        XrPath next = static_cast<XrPath>(reg.paths.size() + 1);
        it = reg.paths.emplace(pathString, next).first;
        reg.path_names[next] = pathString;
    }
    *path = it->second;
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrCreateActionSet(XrInstance instance,
                                                      const XrActionSetCreateInfo* createInfo,
                                                      XrActionSet* actionSet)
{
    *actionSet = new_handle<XrActionSet>();
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrDestroyActionSet(XrActionSet actionSet)
{
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrCreateAction(XrActionSet actionSet,
                                                   const XrActionCreateInfo* createInfo,
                                                   XrAction* action)
{
    *action = new_handle<XrAction>();
    registry().actions[*action] = createInfo->actionName;
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrSuggestInteractionProfileBindings(
    XrInstance instance, const XrInteractionProfileSuggestedBinding* suggestedBindings)
{
    auto& reg = registry();
    reg.state.suggested_profile = reg.path_names[suggestedBindings->interactionProfile];
    for (uint32_t i = 0; i < suggestedBindings->countSuggestedBindings; ++i)
    {
        reg.state.suggested_binding_paths.push_back(reg.path_names[suggestedBindings->suggestedBindings[i].binding]);
    }
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrAttachSessionActionSets(XrSession session,
                                                              const XrSessionActionSetsAttachInfo* attachInfo)
{
    if (registry().state.attach_calls++ > 0)
    {
        return XR_ERROR_ACTIONSETS_ALREADY_ATTACHED;
    }
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrSyncActions(XrSession session, const XrActionsSyncInfo* syncInfo)
{
    ++registry().state.sync_calls;
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrGetActionStateBoolean(XrSession session,
                                                            const XrActionStateGetInfo* getInfo,
                                                            XrActionStateBoolean* state)
{
    const MockHand* hand = find_hand(getInfo->subactionPath);
    state->isActive = (hand && hand->active) ? XR_TRUE : XR_FALSE;
    state->currentState = XR_FALSE;
    if (!state->isActive)
    {
        return XR_SUCCESS;
    }

    const std::string name = action_name(getInfo->action);
    if (name == "trigger_click")
    {
        state->currentState = hand->trigger_click ? XR_TRUE : XR_FALSE;
    }
    else if (name == "trackpad_click")
    {
        state->currentState = hand->trackpad_click ? XR_TRUE : XR_FALSE;
    }
    else if (name == "trackpad_touch")
    {
        state->currentState = hand->trackpad_touch ? XR_TRUE : XR_FALSE;
    }
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrGetActionStateFloat(XrSession session,
                                                          const XrActionStateGetInfo* getInfo,
                                                          XrActionStateFloat* state)
{
    const MockHand* hand = find_hand(getInfo->subactionPath);
    state->isActive = (hand && hand->active) ? XR_TRUE : XR_FALSE;
    state->currentState = state->isActive ? hand->trigger_value : 0.0f;
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrGetActionStateVector2f(XrSession session,
                                                             const XrActionStateGetInfo* getInfo,
                                                             XrActionStateVector2f* state)
{
    const MockHand* hand = find_hand(getInfo->subactionPath);
    state->isActive = (hand && hand->active) ? XR_TRUE : XR_FALSE;
    state->currentState = state->isActive ? hand->trackpad : XrVector2f{ 0.0f, 0.0f };
    return XR_SUCCESS;
}

// --- XR_MNDX_xdev_space ---

XRAPI_ATTR XrResult XRAPI_CALL mock_xrCreateXDevListMNDX(XrSession session,
                                                         const XrCreateXDevListInfoMNDX* info,
                                                         XrXDevListMNDX* xdevList)
{
    auto& reg = registry();
    *xdevList = new_handle<XrXDevListMNDX>();
    reg.lists[*xdevList] = MockList{ reg.state.xdevs };
    ++reg.state.xdev_lists_created;
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrGetXDevListGenerationNumberMNDX(XrXDevListMNDX xdevList,
                                                                      uint64_t* outGeneration)
{
    *outGeneration = registry().state.generation;
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrEnumerateXDevsMNDX(XrXDevListMNDX xdevList,
                                                         uint32_t xdevCapacityInput,
                                                         uint32_t* xdevCountOutput,
                                                         XrXDevIdMNDX* xdevs)
{
    auto it = registry().lists.find(xdevList);
    if (it == registry().lists.end())
    {
        return XR_ERROR_HANDLE_INVALID;
    }

    const auto& snapshot = it->second.xdevs;
    *xdevCountOutput = static_cast<uint32_t>(snapshot.size());
    if (xdevCapacityInput == 0)
    {
        return XR_SUCCESS;
    }
    if (xdevCapacityInput < snapshot.size())
    {
        return XR_ERROR_SIZE_INSUFFICIENT;
    }
    for (size_t i = 0; i < snapshot.size(); ++i)
    {
        xdevs[i] = snapshot[i].id;
    }
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrGetXDevPropertiesMNDX(XrXDevListMNDX xdevList,
                                                            const XrGetXDevInfoMNDX* info,
                                                            XrXDevPropertiesMNDX* properties)
{
    auto it = registry().lists.find(xdevList);
    if (it == registry().lists.end())
    {
        return XR_ERROR_HANDLE_INVALID;
    }
    if (registry().state.failing_properties_id != 0 && info->id == registry().state.failing_properties_id)
    {
        return XR_ERROR_RUNTIME_FAILURE;
    }

    for (const auto& xdev : it->second.xdevs)
    {
        if (xdev.id == info->id)
        {
            strncpy(properties->name, xdev.name.c_str(), sizeof(properties->name) - 1);
            strncpy(properties->serial, xdev.serial.c_str(), sizeof(properties->serial) - 1);
            properties->canCreateSpace = xdev.can_create_space ? XR_TRUE : XR_FALSE;
            return XR_SUCCESS;
        }
    }
    return XR_ERROR_VALIDATION_FAILURE;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrDestroyXDevListMNDX(XrXDevListMNDX xdevList)
{
    registry().lists.erase(xdevList);
    ++registry().state.xdev_lists_destroyed;
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrCreateXDevSpaceMNDX(XrSession session,
                                                          const XrCreateXDevSpaceInfoMNDX* createInfo,
                                                          XrSpace* space)
{
    *space = new_handle<XrSpace>();
    registry().spaces[*space] = createInfo->id;
    ++registry().state.xdev_spaces_created;
    return XR_SUCCESS;
}

// --- XR_KHR_convert_timespec_time ---

XRAPI_ATTR XrResult XRAPI_CALL mock_xrConvertTimespecTimeToTimeKHR(XrInstance instance,
                                                                   const struct timespec* timespecTime,
                                                                   XrTime* time)
{
    *time = static_cast<XrTime>(timespecTime->tv_sec) * 1000000000LL + timespecTime->tv_nsec;
    return XR_SUCCESS;
}

} // anonymous namespace

MockState& state()
{
    return registry().state;
}

void reset()
{
    registry() = Registry{};
}

} // namespace mock_openxr

// --- Loader entry points used by OpenXRSession ---

extern "C"
{

    XRAPI_ATTR XrResult XRAPI_CALL xrCreateInstance(const XrInstanceCreateInfo* createInfo, XrInstance* instance)
    {
        *instance = (XrInstance)0x1;
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrDestroyInstance(XrInstance instance)
    {
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrGetSystem(XrInstance instance, const XrSystemGetInfo* getInfo, XrSystemId* systemId)
    {
        *systemId = 1;
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrCreateSession(XrInstance instance,
                                                   const XrSessionCreateInfo* createInfo,
                                                   XrSession* session)
    {
        *session = (XrSession)0x2;
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrDestroySession(XrSession session)
    {
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrCreateReferenceSpace(XrSession session,
                                                          const XrReferenceSpaceCreateInfo* createInfo,
                                                          XrSpace* space)
    {
        *space = (XrSpace)0x3;
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrDestroySpace(XrSpace space)
    {
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrBeginSession(XrSession session, const XrSessionBeginInfo* beginInfo)
    {
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrGetInstanceProcAddr(XrInstance instance, const char* name, PFN_xrVoidFunction* function)
    {
        using namespace mock_openxr;

        const std::map<std::string, PFN_xrVoidFunction> core = {
            { "xrDestroySpace", (PFN_xrVoidFunction)mock_xrDestroySpace },
            { "xrLocateSpace", (PFN_xrVoidFunction)mock_xrLocateSpace },
            { "xrStringToPath", (PFN_xrVoidFunction)mock_xrStringToPath },
            { "xrCreateActionSet", (PFN_xrVoidFunction)mock_xrCreateActionSet },
            { "xrDestroyActionSet", (PFN_xrVoidFunction)mock_xrDestroyActionSet },
            { "xrCreateAction", (PFN_xrVoidFunction)mock_xrCreateAction },
            { "xrSuggestInteractionProfileBindings", (PFN_xrVoidFunction)mock_xrSuggestInteractionProfileBindings },
            { "xrAttachSessionActionSets", (PFN_xrVoidFunction)mock_xrAttachSessionActionSets },
            { "xrSyncActions", (PFN_xrVoidFunction)mock_xrSyncActions },
            { "xrGetActionStateBoolean", (PFN_xrVoidFunction)mock_xrGetActionStateBoolean },
            { "xrGetActionStateFloat", (PFN_xrVoidFunction)mock_xrGetActionStateFloat },
            { "xrGetActionStateVector2f", (PFN_xrVoidFunction)mock_xrGetActionStateVector2f },
            { "xrConvertTimespecTimeToTimeKHR", (PFN_xrVoidFunction)mock_xrConvertTimespecTimeToTimeKHR },
        };
        const std::map<std::string, PFN_xrVoidFunction> xdev = {
            { "xrCreateXDevListMNDX", (PFN_xrVoidFunction)mock_xrCreateXDevListMNDX },
            { "xrGetXDevListGenerationNumberMNDX", (PFN_xrVoidFunction)mock_xrGetXDevListGenerationNumberMNDX },
            { "xrEnumerateXDevsMNDX", (PFN_xrVoidFunction)mock_xrEnumerateXDevsMNDX },
            { "xrGetXDevPropertiesMNDX", (PFN_xrVoidFunction)mock_xrGetXDevPropertiesMNDX },
            { "xrDestroyXDevListMNDX", (PFN_xrVoidFunction)mock_xrDestroyXDevListMNDX },
            { "xrCreateXDevSpaceMNDX", (PFN_xrVoidFunction)mock_xrCreateXDevSpaceMNDX },
        };

        *function = nullptr;
        if (auto it = core.find(name); it != core.end())
        {
            *function = it->second;
            return XR_SUCCESS;
        }
        if (auto it = xdev.find(name); it != xdev.end() && state().xdev_extension_available)
        {
            *function = it->second;
            return XR_SUCCESS;
        }
        return XR_ERROR_FUNCTION_UNSUPPORTED;
    }

} // extern "C"
