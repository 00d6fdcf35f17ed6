// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <deviceio/tracking_config.hpp>

#include <cstdlib>

using namespace rigtrack;

namespace
{

// Sets an environment variable for the lifetime of the object
class ScopedEnv
{
public:
    ScopedEnv(const char* name, const char* value) : name_(name)
    {
        setenv(name, value, 1);
    }

    ~ScopedEnv()
    {
        unsetenv(name_);
    }

private:
    const char* name_;
};

} // namespace

TEST_CASE("Degenerate pose policy names", "[config]")
{
    CHECK(parse_degenerate_pose_policy("pass") == DegeneratePosePolicy::PassThrough);
    CHECK(parse_degenerate_pose_policy("normalize") == DegeneratePosePolicy::Orthonormalize);
    CHECK(parse_degenerate_pose_policy("reject") == DegeneratePosePolicy::Reject);
    CHECK_FALSE(parse_degenerate_pose_policy("clamp").has_value());
    CHECK_FALSE(parse_degenerate_pose_policy("").has_value());
}

TEST_CASE("Defaults", "[config]")
{
    TrackingConfig config;
    CHECK(config.units_per_meter == 1.0);
    CHECK(config.z_up);
    CHECK(config.degenerate_pose_policy == DegeneratePosePolicy::Orthonormalize);
}

TEST_CASE("Environment overrides the base configuration", "[config]")
{
    ScopedEnv units("RIGTRACK_UNITS_PER_METER", "1000");
    ScopedEnv z_up("RIGTRACK_Z_UP", "0");
    ScopedEnv policy("RIGTRACK_DEGENERATE_POSE", "reject");
    ScopedEnv threshold("RIGTRACK_TRIGGER_THRESHOLD", "0.5");

    TrackingConfig config = TrackingConfig::from_environment();
    CHECK(config.units_per_meter == 1000.0);
    CHECK_FALSE(config.z_up);
    CHECK(config.degenerate_pose_policy == DegeneratePosePolicy::Reject);
    CHECK(config.trigger_press_threshold == Catch::Approx(0.5f));
}

TEST_CASE("Invalid environment values are ignored", "[config]")
{
    ScopedEnv units("RIGTRACK_UNITS_PER_METER", "-3");
    ScopedEnv z_up("RIGTRACK_Z_UP", "yes");
    ScopedEnv policy("RIGTRACK_DEGENERATE_POSE", "fix");
    ScopedEnv threshold("RIGTRACK_TRIGGER_THRESHOLD", "0.2abc");

    TrackingConfig base;
    base.units_per_meter = 100.0;
    base.z_up = false;
    base.degenerate_pose_policy = DegeneratePosePolicy::PassThrough;

    TrackingConfig config = TrackingConfig::from_environment(base);
    CHECK(config.units_per_meter == 100.0);
    CHECK_FALSE(config.z_up);
    CHECK(config.degenerate_pose_policy == DegeneratePosePolicy::PassThrough);
    CHECK(config.trigger_press_threshold == Catch::Approx(base.trigger_press_threshold));
}

TEST_CASE("Without environment overrides the defaults are kept", "[config]")
{
    for (const char* name :
         { "RIGTRACK_UNITS_PER_METER", "RIGTRACK_Z_UP", "RIGTRACK_DEGENERATE_POSE", "RIGTRACK_TRIGGER_THRESHOLD" })
    {
        unsetenv(name);
    }

    TrackingConfig defaults;
    TrackingConfig config = TrackingConfig::from_environment();
    CHECK(config.units_per_meter == defaults.units_per_meter);
    CHECK(config.z_up == defaults.z_up);
    CHECK(config.degenerate_pose_policy == defaults.degenerate_pose_policy);
    CHECK(config.orthonormal_tolerance == defaults.orthonormal_tolerance);
    CHECK(config.trigger_press_threshold == defaults.trigger_press_threshold);
}
