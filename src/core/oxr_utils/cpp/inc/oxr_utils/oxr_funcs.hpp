// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

// Define XR_NO_PROTOTYPES to prevent OpenXR headers from declaring function prototypes
// This forces us to use xrGetInstanceProcAddr for all OpenXR functions
#define XR_NO_PROTOTYPES

#include <openxr/openxr.h>

#include <cassert>
#include <functional>
#include <stdexcept>
#include <string>

namespace rigtrack
{

namespace detail
{

template <typename Func>
bool load_function(XrInstance instance, PFN_xrGetInstanceProcAddr get_proc_addr, const char* name, Func& out)
{
    out = nullptr;
    XrResult result = get_proc_addr(instance, name, reinterpret_cast<PFN_xrVoidFunction*>(&out));
    return XR_SUCCEEDED(result) && out != nullptr;
}

} // namespace detail

// Core OpenXR function pointers used by the device runtime (space location + input actions)
struct OpenXRCoreFunctions
{
    PFN_xrDestroySpace xrDestroySpace;
    PFN_xrLocateSpace xrLocateSpace;

    PFN_xrStringToPath xrStringToPath;
    PFN_xrCreateActionSet xrCreateActionSet;
    PFN_xrDestroyActionSet xrDestroyActionSet;
    PFN_xrCreateAction xrCreateAction;
    PFN_xrSuggestInteractionProfileBindings xrSuggestInteractionProfileBindings;
    PFN_xrAttachSessionActionSets xrAttachSessionActionSets;
    PFN_xrSyncActions xrSyncActions;
    PFN_xrGetActionStateBoolean xrGetActionStateBoolean;
    PFN_xrGetActionStateFloat xrGetActionStateFloat;
    PFN_xrGetActionStateVector2f xrGetActionStateVector2f;

    // Throws std::runtime_error naming the first function that cannot be loaded
    static OpenXRCoreFunctions load(XrInstance instance, PFN_xrGetInstanceProcAddr get_proc_addr)
    {
        assert(get_proc_addr);

        OpenXRCoreFunctions f{};
        auto require = [&](const char* name, auto& func)
        {
            if (!detail::load_function(instance, get_proc_addr, name, func))
            {
                throw std::runtime_error(std::string("Failed to load OpenXR function ") + name);
            }
        };

        require("xrDestroySpace", f.xrDestroySpace);
        require("xrLocateSpace", f.xrLocateSpace);
        require("xrStringToPath", f.xrStringToPath);
        require("xrCreateActionSet", f.xrCreateActionSet);
        require("xrDestroyActionSet", f.xrDestroyActionSet);
        require("xrCreateAction", f.xrCreateAction);
        require("xrSuggestInteractionProfileBindings", f.xrSuggestInteractionProfileBindings);
        require("xrAttachSessionActionSets", f.xrAttachSessionActionSets);
        require("xrSyncActions", f.xrSyncActions);
        require("xrGetActionStateBoolean", f.xrGetActionStateBoolean);
        require("xrGetActionStateFloat", f.xrGetActionStateFloat);
        require("xrGetActionStateVector2f", f.xrGetActionStateVector2f);

        return f;
    }
};

// XR_MNDX_xdev_space entry points - only available when the extension is enabled
struct XDevSpaceFunctions
{
    PFN_xrCreateXDevListMNDX xrCreateXDevListMNDX;
    PFN_xrGetXDevListGenerationNumberMNDX xrGetXDevListGenerationNumberMNDX;
    PFN_xrEnumerateXDevsMNDX xrEnumerateXDevsMNDX;
    PFN_xrGetXDevPropertiesMNDX xrGetXDevPropertiesMNDX;
    PFN_xrDestroyXDevListMNDX xrDestroyXDevListMNDX;
    PFN_xrCreateXDevSpaceMNDX xrCreateXDevSpaceMNDX;

    static XDevSpaceFunctions load(XrInstance instance, PFN_xrGetInstanceProcAddr get_proc_addr)
    {
        assert(get_proc_addr);

        XDevSpaceFunctions f{};
        bool success = true;
        success &= detail::load_function(instance, get_proc_addr, "xrCreateXDevListMNDX", f.xrCreateXDevListMNDX);
        success &= detail::load_function(
            instance, get_proc_addr, "xrGetXDevListGenerationNumberMNDX", f.xrGetXDevListGenerationNumberMNDX);
        success &= detail::load_function(instance, get_proc_addr, "xrEnumerateXDevsMNDX", f.xrEnumerateXDevsMNDX);
        success &= detail::load_function(instance, get_proc_addr, "xrGetXDevPropertiesMNDX", f.xrGetXDevPropertiesMNDX);
        success &= detail::load_function(instance, get_proc_addr, "xrDestroyXDevListMNDX", f.xrDestroyXDevListMNDX);
        success &= detail::load_function(instance, get_proc_addr, "xrCreateXDevSpaceMNDX", f.xrCreateXDevSpaceMNDX);

        if (!success)
        {
            throw std::runtime_error(std::string("Failed to load ") + XR_MNDX_XDEV_SPACE_EXTENSION_NAME +
                                     " functions (is the extension enabled?)");
        }
        return f;
    }
};

// Helper to wrap OpenXR handles in unique_ptr-like semantics
template <typename HandleType>
class OpenXRHandle
{
public:
    OpenXRHandle() : handle_(XR_NULL_HANDLE), deleter_(nullptr)
    {
    }

    OpenXRHandle(HandleType handle, std::function<void(HandleType)> deleter)
        : handle_(handle), deleter_(std::move(deleter))
    {
    }

    ~OpenXRHandle()
    {
        reset();
    }

    OpenXRHandle(OpenXRHandle&& other) noexcept : handle_(other.handle_), deleter_(std::move(other.deleter_))
    {
        other.handle_ = XR_NULL_HANDLE;
    }

    OpenXRHandle& operator=(OpenXRHandle&& other) noexcept
    {
        if (this != &other)
        {
            reset();
            handle_ = other.handle_;
            deleter_ = std::move(other.deleter_);
            other.handle_ = XR_NULL_HANDLE;
        }
        return *this;
    }

    OpenXRHandle(const OpenXRHandle&) = delete;
    OpenXRHandle& operator=(const OpenXRHandle&) = delete;

    HandleType get() const
    {
        return handle_;
    }
    explicit operator bool() const
    {
        return handle_ != XR_NULL_HANDLE;
    }

    void reset()
    {
        if (handle_ != XR_NULL_HANDLE)
        {
            assert(deleter_);
            deleter_(handle_);
            handle_ = XR_NULL_HANDLE;
        }
    }

private:
    HandleType handle_;
    std::function<void(HandleType)> deleter_;
};

using XrActionSetPtr = OpenXRHandle<XrActionSet>;
using XrSpacePtr = OpenXRHandle<XrSpace>;
using XrXDevListPtr = OpenXRHandle<XrXDevListMNDX>;

// Create an action set with automatic cleanup - throws on failure
inline XrActionSetPtr createActionSet(const OpenXRCoreFunctions& funcs,
                                      XrInstance instance,
                                      const XrActionSetCreateInfo& create_info)
{
    XrActionSet action_set = XR_NULL_HANDLE;
    XrResult result = funcs.xrCreateActionSet(instance, &create_info, &action_set);
    if (XR_FAILED(result))
    {
        throw std::runtime_error("Failed to create action set: " + std::to_string(result));
    }

    return XrActionSetPtr(action_set, funcs.xrDestroyActionSet);
}

// Create an xdev list with automatic cleanup - throws on failure
inline XrXDevListPtr createXDevList(const XDevSpaceFunctions& funcs, XrSession session)
{
    XrCreateXDevListInfoMNDX create_info{ XR_TYPE_CREATE_XDEV_LIST_INFO_MNDX };
    XrXDevListMNDX list = XR_NULL_HANDLE;
    XrResult result = funcs.xrCreateXDevListMNDX(session, &create_info, &list);
    if (XR_FAILED(result))
    {
        throw std::runtime_error("Failed to create xdev list: " + std::to_string(result));
    }

    return XrXDevListPtr(list, funcs.xrDestroyXDevListMNDX);
}

// Create a space that follows one xdev, with automatic cleanup - throws on failure
inline XrSpacePtr createXDevSpace(const XDevSpaceFunctions& xdev_funcs,
                                  const OpenXRCoreFunctions& core_funcs,
                                  XrSession session,
                                  XrXDevListMNDX list,
                                  XrXDevIdMNDX id)
{
    XrCreateXDevSpaceInfoMNDX create_info{ XR_TYPE_CREATE_XDEV_SPACE_INFO_MNDX };
    create_info.xdevList = list;
    create_info.id = id;
    create_info.offset.orientation = { 0.0f, 0.0f, 0.0f, 1.0f };
    create_info.offset.position = { 0.0f, 0.0f, 0.0f };

    XrSpace space = XR_NULL_HANDLE;
    XrResult result = xdev_funcs.xrCreateXDevSpaceMNDX(session, &create_info, &space);
    if (XR_FAILED(result))
    {
        throw std::runtime_error("Failed to create space for xdev " + std::to_string(id) + ": " +
                                 std::to_string(result));
    }

    return XrSpacePtr(space, core_funcs.xrDestroySpace);
}

} // namespace rigtrack
