// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <oxr/runtime_detection.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace rigtrack;

namespace
{

// Sets an environment variable for the lifetime of the object, restoring the previous value
class ScopedEnv
{
public:
    ScopedEnv(const char* name, const std::string& value) : name_(name)
    {
        if (const char* previous = std::getenv(name))
        {
            previous_ = previous;
            had_previous_ = true;
        }
        setenv(name, value.c_str(), 1);
    }

    ~ScopedEnv()
    {
        if (had_previous_)
        {
            setenv(name_, previous_.c_str(), 1);
        }
        else
        {
            unsetenv(name_);
        }
    }

private:
    const char* name_;
    std::string previous_;
    bool had_previous_ = false;
};

} // namespace

TEST_CASE("XR_RUNTIME_JSON takes precedence", "[detection]")
{
    const auto dir = std::filesystem::temp_directory_path() / "rigtrack_detection_test";
    std::filesystem::create_directories(dir);
    const auto manifest = dir / "runtime.json";
    std::ofstream(manifest) << "{}";

    ScopedEnv runtime_json("XR_RUNTIME_JSON", manifest.string());

    auto detection = detect_openxr_runtime();
    CHECK(detection.found);
    CHECK(detection.manifest_path == manifest.string());
    REQUIRE(detection.searched.size() == 1);

    std::filesystem::remove_all(dir);
}

TEST_CASE("XDG config home is searched", "[detection]")
{
    const auto dir = std::filesystem::temp_directory_path() / "rigtrack_detection_xdg";
    std::filesystem::create_directories(dir / "openxr" / "1");
    const auto manifest = dir / "openxr" / "1" / "active_runtime.json";
    std::ofstream(manifest) << "{}";

    ScopedEnv runtime_json("XR_RUNTIME_JSON", (dir / "missing.json").string());
    ScopedEnv xdg("XDG_CONFIG_HOME", dir.string());

    auto detection = detect_openxr_runtime();
    CHECK(detection.found);
    CHECK(detection.manifest_path == manifest.string());
    CHECK(detection.searched.size() == 2);

    std::filesystem::remove_all(dir);
}

TEST_CASE("Missing runtime message lists the searched paths", "[detection]")
{
    RuntimeDetection detection;
    detection.searched = { "/nowhere/a.json", "/nowhere/b.json" };

    std::string message = describe_missing_runtime(detection);
    CHECK(message.find("No active OpenXR runtime") != std::string::npos);
    CHECK(message.find("/nowhere/a.json") != std::string::npos);
    CHECK(message.find("/nowhere/b.json") != std::string::npos);
}
