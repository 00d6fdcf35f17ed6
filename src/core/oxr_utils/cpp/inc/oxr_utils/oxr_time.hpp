// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "os_time.hpp"
#include "oxr_funcs.hpp"
#include "oxr_session_handles.hpp"

#include <time.h>
// XR_USE_TIMESPEC is defined by the build so the timespec conversion is declared
#include <openxr/openxr_platform.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace rigtrack
{

/*!
 * @brief Converts CLOCK_MONOTONIC to XrTime so poses can be sampled without a frame loop.
 *
 * Requires XR_KHR_convert_timespec_time.
 */
class XrTimeConverter
{
public:
    static std::vector<std::string> get_required_extensions()
    {
        return { XR_KHR_CONVERT_TIMESPEC_TIME_EXTENSION_NAME };
    }

    // Throws std::runtime_error if the extension function is not available
    explicit XrTimeConverter(const OpenXRSessionHandles& handles) : instance_(handles.instance)
    {
        if (!detail::load_function(
                instance_, handles.xrGetInstanceProcAddr, "xrConvertTimespecTimeToTimeKHR", pfn_convert_timespec_))
        {
            throw std::runtime_error("xrConvertTimespecTimeToTimeKHR not available");
        }
    }

    // Throws std::runtime_error if the conversion fails
    XrTime os_monotonic_now() const
    {
        int64_t monotonic_ns = os_monotonic_now_ns();

        struct timespec ts;
        ts.tv_sec = static_cast<time_t>(monotonic_ns / 1000000000LL);
        ts.tv_nsec = static_cast<long>(monotonic_ns % 1000000000LL);

        XrTime time = 0;
        XrResult result = pfn_convert_timespec_(instance_, &ts, &time);
        if (XR_FAILED(result))
        {
            throw std::runtime_error("xrConvertTimespecTimeToTimeKHR failed with code " + std::to_string(result));
        }
        return time;
    }

private:
    XrInstance instance_;
    PFN_xrConvertTimespecTimeToTimeKHR pfn_convert_timespec_{};
};

} // namespace rigtrack
