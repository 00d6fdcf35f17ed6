// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/oxr/oxr_session.hpp"

#include <cstring>
#include <iostream>
#include <stdexcept>

namespace rigtrack
{

namespace
{

void check_xr_result(XrResult result, const char* call)
{
    if (XR_FAILED(result))
    {
        throw std::runtime_error(std::string(call) + " failed with XrResult: " + std::to_string(result));
    }
}

} // anonymous namespace

OpenXRSession::~OpenXRSession()
{
    if (space_ != XR_NULL_HANDLE)
    {
        xrDestroySpace(space_);
        space_ = XR_NULL_HANDLE;
    }

    if (session_ != XR_NULL_HANDLE)
    {
        xrDestroySession(session_);
        session_ = XR_NULL_HANDLE;
    }

    if (instance_ != XR_NULL_HANDLE)
    {
        xrDestroyInstance(instance_);
        instance_ = XR_NULL_HANDLE;
    }
}

std::shared_ptr<OpenXRSession> OpenXRSession::Create(const std::string& app_name,
                                                     const std::vector<std::string>& extensions,
                                                     XrReferenceSpaceType space_type)
{
    // Partially created handles are released by the destructor if a step throws
    auto session = std::shared_ptr<OpenXRSession>(new OpenXRSession());

    session->create_instance(app_name, extensions);
    session->create_system();
    session->create_session();
    session->create_reference_space(space_type);
    session->begin();

    return session;
}

OpenXRSessionHandles OpenXRSession::get_handles() const
{
    // This translation unit links the loader, so its xrGetInstanceProcAddr is handed out
    OpenXRSessionHandles handles;
    handles.instance = instance_;
    handles.session = session_;
    handles.space = space_;
    handles.xrGetInstanceProcAddr = ::xrGetInstanceProcAddr;
    return handles;
}

void OpenXRSession::create_instance(const std::string& app_name, const std::vector<std::string>& extensions)
{
    XrInstanceCreateInfo create_info{ XR_TYPE_INSTANCE_CREATE_INFO };
    create_info.applicationInfo.apiVersion = XR_CURRENT_API_VERSION;
    strncpy(create_info.applicationInfo.applicationName, app_name.c_str(), XR_MAX_APPLICATION_NAME_SIZE - 1);
    strncpy(create_info.applicationInfo.engineName, "rigtrack", XR_MAX_ENGINE_NAME_SIZE - 1);

    std::vector<std::string> all_extensions = extensions;
    all_extensions.push_back(XR_MND_HEADLESS_EXTENSION_NAME);

    std::vector<const char*> extension_ptrs;
    for (const auto& ext : all_extensions)
    {
        extension_ptrs.push_back(ext.c_str());
    }

    create_info.enabledExtensionCount = static_cast<uint32_t>(extension_ptrs.size());
    create_info.enabledExtensionNames = extension_ptrs.data();

    check_xr_result(xrCreateInstance(&create_info, &instance_), "xrCreateInstance");
    std::cout << "OpenXRSession: Created instance with " << extension_ptrs.size() << " extensions" << std::endl;
}

void OpenXRSession::create_system()
{
    XrSystemGetInfo system_info{ XR_TYPE_SYSTEM_GET_INFO };
    system_info.formFactor = XR_FORM_FACTOR_HEAD_MOUNTED_DISPLAY;

    check_xr_result(xrGetSystem(instance_, &system_info, &system_id_), "xrGetSystem");
}

void OpenXRSession::create_session()
{
    // Headless: no graphics binding in the chain
    XrSessionCreateInfo create_info{ XR_TYPE_SESSION_CREATE_INFO };
    create_info.systemId = system_id_;

    check_xr_result(xrCreateSession(instance_, &create_info, &session_), "xrCreateSession");
    std::cout << "OpenXRSession: Created headless session" << std::endl;
}

void OpenXRSession::create_reference_space(XrReferenceSpaceType space_type)
{
    XrReferenceSpaceCreateInfo create_info{ XR_TYPE_REFERENCE_SPACE_CREATE_INFO };
    create_info.referenceSpaceType = space_type;
    create_info.poseInReferenceSpace.orientation.w = 1.0f;

    check_xr_result(xrCreateReferenceSpace(session_, &create_info, &space_), "xrCreateReferenceSpace");
}

void OpenXRSession::begin()
{
    XrSessionBeginInfo begin_info{ XR_TYPE_SESSION_BEGIN_INFO };
    begin_info.primaryViewConfigurationType = XR_VIEW_CONFIGURATION_TYPE_PRIMARY_STEREO;

    check_xr_result(xrBeginSession(session_, &begin_info), "xrBeginSession");
}

} // namespace rigtrack
