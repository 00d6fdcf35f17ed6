// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/oxr/runtime_detection.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace rigtrack
{

namespace
{

constexpr const char* kManifestSuffix = "openxr/1/active_runtime.json";

std::vector<std::string> candidate_paths()
{
    std::vector<std::string> paths;

    if (const char* explicit_path = std::getenv("XR_RUNTIME_JSON"); explicit_path && *explicit_path)
    {
        paths.emplace_back(explicit_path);
    }

    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    {
        paths.push_back((std::filesystem::path(xdg) / kManifestSuffix).string());
    }

    if (const char* home = std::getenv("HOME"); home && *home)
    {
        paths.push_back((std::filesystem::path(home) / ".config" / kManifestSuffix).string());
    }

    paths.push_back((std::filesystem::path("/etc/xdg") / kManifestSuffix).string());
    return paths;
}

} // anonymous namespace

RuntimeDetection detect_openxr_runtime()
{
    RuntimeDetection detection;

    for (const auto& path : candidate_paths())
    {
        detection.searched.push_back(path);

        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec))
        {
            detection.found = true;
            detection.manifest_path = path;
            break;
        }
    }

    return detection;
}

std::string describe_missing_runtime(const RuntimeDetection& detection)
{
    std::string message = "No active OpenXR runtime found. Start the tracking runtime or set XR_RUNTIME_JSON.";
    if (!detection.searched.empty())
    {
        message += " Searched:";
        for (const auto& path : detection.searched)
        {
            message += " " + path;
        }
    }
    return message;
}

} // namespace rigtrack
