// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <openxr/openxr.h>
#include <oxr_utils/oxr_session_handles.hpp>

#include <memory>
#include <string>
#include <vector>

namespace rigtrack
{

// Headless OpenXR session with a reference space, owned for the lifetime of the polling loop
class OpenXRSession
{
public:
    ~OpenXRSession();

    OpenXRSession(const OpenXRSession&) = delete;
    OpenXRSession& operator=(const OpenXRSession&) = delete;

    /**
     * @brief Create instance, system, headless session and reference space, then begin the session.
     *
     * XR_MND_headless is always requested in addition to `extensions`.
     *
     * @throws std::runtime_error naming the failing call and its XrResult.
     */
    static std::shared_ptr<OpenXRSession> Create(const std::string& app_name,
                                                 const std::vector<std::string>& extensions = {},
                                                 XrReferenceSpaceType space_type = XR_REFERENCE_SPACE_TYPE_STAGE);

    OpenXRSessionHandles get_handles() const;

private:
    OpenXRSession() = default;

    void create_instance(const std::string& app_name, const std::vector<std::string>& extensions);
    void create_system();
    void create_session();
    void create_reference_space(XrReferenceSpaceType space_type);
    void begin();

    XrInstance instance_ = XR_NULL_HANDLE;
    XrSystemId system_id_ = XR_NULL_SYSTEM_ID;
    XrSession session_ = XR_NULL_HANDLE;
    XrSpace space_ = XR_NULL_HANDLE;
};

} // namespace rigtrack
