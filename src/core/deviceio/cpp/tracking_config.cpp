// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/deviceio/tracking_config.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace rigtrack
{

namespace
{

const char* get_env(const char* name)
{
    const char* value = std::getenv(name);
    if (value == nullptr || std::string(value).empty())
    {
        return nullptr;
    }
    return value;
}

void warn_invalid(const char* name, const char* value)
{
    std::cerr << "TrackingConfig: Ignoring invalid value '" << value << "' for " << name << std::endl;
}

std::optional<double> parse_double(const char* value)
{
    try
    {
        size_t consumed = 0;
        double result = std::stod(value, &consumed);
        if (consumed != std::string(value).size())
        {
            return std::nullopt;
        }
        return result;
    }
    catch (const std::logic_error&)
    {
        return std::nullopt;
    }
}

} // anonymous namespace

std::optional<DegeneratePosePolicy> parse_degenerate_pose_policy(std::string_view text)
{
    if (text == "pass")
    {
        return DegeneratePosePolicy::PassThrough;
    }
    if (text == "normalize")
    {
        return DegeneratePosePolicy::Orthonormalize;
    }
    if (text == "reject")
    {
        return DegeneratePosePolicy::Reject;
    }
    return std::nullopt;
}

TrackingConfig TrackingConfig::from_environment()
{
    return from_environment(TrackingConfig{});
}

TrackingConfig TrackingConfig::from_environment(const TrackingConfig& base)
{
    TrackingConfig config = base;

    if (const char* value = get_env("RIGTRACK_UNITS_PER_METER"))
    {
        auto parsed = parse_double(value);
        if (parsed && *parsed > 0.0)
        {
            config.units_per_meter = *parsed;
        }
        else
        {
            warn_invalid("RIGTRACK_UNITS_PER_METER", value);
        }
    }

    if (const char* value = get_env("RIGTRACK_Z_UP"))
    {
        std::string text(value);
        if (text == "0" || text == "1")
        {
            config.z_up = (text == "1");
        }
        else
        {
            warn_invalid("RIGTRACK_Z_UP", value);
        }
    }

    if (const char* value = get_env("RIGTRACK_DEGENERATE_POSE"))
    {
        auto policy = parse_degenerate_pose_policy(value);
        if (policy)
        {
            config.degenerate_pose_policy = *policy;
        }
        else
        {
            warn_invalid("RIGTRACK_DEGENERATE_POSE", value);
        }
    }

    if (const char* value = get_env("RIGTRACK_TRIGGER_THRESHOLD"))
    {
        auto parsed = parse_double(value);
        if (parsed && *parsed >= 0.0 && *parsed <= 1.0)
        {
            config.trigger_press_threshold = static_cast<float>(*parsed);
        }
        else
        {
            warn_invalid("RIGTRACK_TRIGGER_THRESHOLD", value);
        }
    }

    return config;
}

} // namespace rigtrack
