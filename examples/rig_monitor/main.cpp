// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <deviceio/connection_session.hpp>
#include <deviceio/query_facade.hpp>
#include <oxr/oxr_session.hpp>
#include <oxr/runtime_detection.hpp>
#include <oxr/xdev_runtime.hpp>
#include <rig_math/coordinate_conversion.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

/**
 * Rig Monitor - polls every tracked device of the rig and prints its frame
 *
 * Usage: rig_monitor [polls]
 *   polls: number of polls before exiting (default: run until Ctrl+C)
 *
 * Pipeline configuration comes from RIGTRACK_* environment variables.
 */

namespace
{

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_signal(int)
{
    g_stop_requested = 1;
}

void print_result(rigtrack::DeviceClass device_class, int index, const rigtrack::QueryResult& result)
{
    std::cout << "  " << std::setw(14) << std::left << rigtrack::to_string(device_class) << "[" << index << "] ";
    if (!result.ok())
    {
        std::cout << rigtrack::describe(result.status) << ": " << result.message << std::endl;
        return;
    }

    const auto& snapshot = *result.snapshot;
    if (!snapshot.frame)
    {
        std::cout << rigtrack::to_string(snapshot.state) << " (no frame yet)" << std::endl;
        return;
    }

    const auto& origin = snapshot.frame->origin;
    const auto normal = rigtrack::plane_normal(*snapshot.plane);
    std::cout << std::fixed << std::setprecision(3) << "origin [" << origin.x << ", " << origin.y << ", " << origin.z
              << "] normal [" << normal.x << ", " << normal.y << ", " << normal.z << "]";

    if (snapshot.inputs)
    {
        std::cout << " trigger " << snapshot.inputs->trigger_value
                  << (snapshot.inputs->trigger_pressed ? " (pressed)" : "") << " pad [" << snapshot.inputs->touchpad_x
                  << ", " << snapshot.inputs->touchpad_y << "]";
    }
    std::cout << std::endl;
}

} // anonymous namespace

int main(int argc, char** argv)
{
    long max_polls = -1;
    if (argc > 1)
    {
        char* end = nullptr;
        max_polls = std::strtol(argv[1], &end, 10);
        if (end == argv[1] || *end != '\0' || max_polls <= 0)
        {
            std::cerr << "Usage: " << argv[0] << " [polls]" << std::endl;
            return 1;
        }
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    std::cout << "Rig Monitor" << std::endl;
    std::cout << "===========" << std::endl;

    // The OpenXR session must outlive the runtime that uses its handles
    std::shared_ptr<rigtrack::OpenXRSession> oxr_session;
    rigtrack::OpenXRSessionHandles handles;
    std::string startup_error;

    auto detection = rigtrack::detect_openxr_runtime();
    if (!detection.found)
    {
        startup_error = rigtrack::describe_missing_runtime(detection);
    }
    else
    {
        std::cout << "Using OpenXR runtime: " << detection.manifest_path << std::endl;
        try
        {
            oxr_session =
                rigtrack::OpenXRSession::Create("RigMonitor", rigtrack::XDevRuntime::get_required_extensions());
            handles = oxr_session->get_handles();
        }
        catch (const std::exception& e)
        {
            startup_error = e.what();
        }
    }

    rigtrack::ConnectionSession session(std::make_unique<rigtrack::XDevRuntime>(handles));
    if (startup_error.empty())
    {
        session.connect();
    }
    else
    {
        session.report_failure(startup_error);
    }

    if (!session.state().success)
    {
        std::cerr << session.connection_message() << std::endl;
        return 1;
    }

    rigtrack::QueryFacade facade(rigtrack::TrackingConfig::from_environment());

    for (long poll = 0; !g_stop_requested && (max_polls < 0 || poll < max_polls); ++poll)
    {
        if (!session.update())
        {
            // The runtime may come back; keep polling
            std::this_thread::sleep_for(std::chrono::seconds(1));
            continue;
        }

        if (poll == 0)
        {
            std::cout << session.summary() << std::endl;
        }

        std::cout << "Poll " << session.poll_count() << ":" << std::endl;
        for (auto device_class : rigtrack::kAllDeviceClasses)
        {
            const int count = static_cast<int>(session.class_index().count(device_class));
            for (int index = 0; index < count; ++index)
            {
                print_result(device_class, index, facade.query(&session, device_class, index, true));
            }
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    std::cout << "Rig Monitor stopped after " << session.poll_count() << " polls" << std::endl;
    return 0;
}
