// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "fake_runtime.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <deviceio/query_facade.hpp>
#include <rig_math/coordinate_conversion.hpp>

using namespace rigtrack;
using namespace rigtrack::testing;

namespace
{

// Runtime space passed through unchanged, so expected frames can be read off the raw poses
TrackingConfig identity_config()
{
    TrackingConfig config;
    config.z_up = false;
    config.units_per_meter = 1.0;
    return config;
}

// One HMD, two controllers, two base stations and no generic trackers
std::shared_ptr<FakeRig> make_standard_rig()
{
    auto rig = std::make_shared<FakeRig>();
    rig->devices = {
        make_device(100, RuntimeDeviceKind::TrackingReference, "Base Station A", translation_pose(2.0, 2.5, 2.0)),
        make_device(101, RuntimeDeviceKind::HMD, "Headset", translation_pose(0.0, 1.7, 0.0)),
        make_device(102, RuntimeDeviceKind::Controller, "Left Controller", translation_pose(-0.2, 1.0, -0.3)),
        make_device(103, RuntimeDeviceKind::Controller, "Right Controller", translation_pose(0.2, 1.0, -0.3)),
        make_device(104, RuntimeDeviceKind::TrackingReference, "Base Station B", translation_pose(-2.0, 2.5, -2.0)),
    };
    return rig;
}

FakeDevice& device_with_handle(FakeRig& rig, DeviceHandle handle)
{
    for (auto& device : rig.devices)
    {
        if (device.descriptor.handle == handle)
        {
            return device;
        }
    }
    throw std::out_of_range("no fake device with handle " + std::to_string(handle));
}

void check_origin(const QueryResult& result, double x, double y, double z)
{
    REQUIRE(result.snapshot.has_value());
    REQUIRE(result.snapshot->frame.has_value());
    CHECK(result.snapshot->frame->origin.x == Catch::Approx(x).margin(1e-9));
    CHECK(result.snapshot->frame->origin.y == Catch::Approx(y).margin(1e-9));
    CHECK(result.snapshot->frame->origin.z == Catch::Approx(z).margin(1e-9));
}

} // namespace

TEST_CASE("End to end over a standard rig", "[query]")
{
    auto rig = make_standard_rig();
    auto session = make_session(rig);
    REQUIRE(session->update());

    QueryFacade facade(identity_config());

    auto hmd = facade.hmd(session.get());
    REQUIRE(hmd.ok());
    CHECK(hmd.snapshot->state == SlotState::Fresh);
    check_origin(hmd, 0.0, 1.7, 0.0);
    CHECK_FALSE(hmd.snapshot->inputs.has_value());

    auto left = facade.controller(session.get(), 0);
    auto right = facade.controller(session.get(), 1);
    REQUIRE(left.ok());
    REQUIRE(right.ok());
    check_origin(left, -0.2, 1.0, -0.3);
    check_origin(right, 0.2, 1.0, -0.3);
    CHECK(left.snapshot->inputs.has_value());

    auto station_a = facade.lighthouse(session.get(), 0);
    auto station_b = facade.lighthouse(session.get(), 1);
    check_origin(station_a, 2.0, 2.5, 2.0);
    check_origin(station_b, -2.0, 2.5, -2.0);

    CHECK(facade.controller(session.get(), 2).status == QueryStatus::NotFound);
    CHECK(facade.generic_tracker(session.get(), 0).status == QueryStatus::NotFound);
    CHECK(facade.slot_count() == 5);
}

TEST_CASE("Plane is derived from the frame", "[query]")
{
    auto rig = make_standard_rig();
    auto session = make_session(rig);
    REQUIRE(session->update());

    QueryFacade facade(identity_config());
    auto result = facade.hmd(session.get());
    REQUIRE(result.ok());

    const auto& frame = *result.snapshot->frame;
    const auto& plane = *result.snapshot->plane;
    CHECK(plane.origin.y == frame.origin.y);
    CHECK(plane.x_axis.x == frame.x_axis.x);
    CHECK(plane.y_axis.y == frame.y_axis.y);
    CHECK(plane_normal(plane).z == Catch::Approx(frame.z_axis.z));
}

TEST_CASE("Untracked queries freeze the slot", "[query]")
{
    auto rig = make_standard_rig();
    auto session = make_session(rig);
    REQUIRE(session->update());

    QueryFacade facade(identity_config());
    REQUIRE(facade.hmd(session.get(), true).ok());

    // The headset moves, but the caller froze it
    device_with_handle(*rig, 101).pose = translation_pose(1.0, 1.8, -1.0);
    REQUIRE(session->update());

    auto frozen = facade.hmd(session.get(), false);
    REQUIRE(frozen.ok());
    CHECK(frozen.snapshot->state == SlotState::Stale);
    check_origin(frozen, 0.0, 1.7, 0.0);

    SECTION("Freezing repeatedly keeps the same value")
    {
        REQUIRE(session->update());
        auto again = facade.hmd(session.get(), false);
        CHECK(again.snapshot->state == SlotState::Stale);
        check_origin(again, 0.0, 1.7, 0.0);
    }

    SECTION("Tracking again picks up the new pose")
    {
        auto fresh = facade.hmd(session.get(), true);
        REQUIRE(fresh.ok());
        CHECK(fresh.snapshot->state == SlotState::Fresh);
        check_origin(fresh, 1.0, 1.8, -1.0);
    }
}

TEST_CASE("Frozen controllers keep their inputs", "[query]")
{
    auto rig = make_standard_rig();
    device_with_handle(*rig, 102).inputs.trigger_value = 0.9f;
    device_with_handle(*rig, 102).inputs.touchpad_touched = true;
    device_with_handle(*rig, 102).inputs.touchpad_x = -0.5f;

    auto session = make_session(rig);
    REQUIRE(session->update());

    QueryFacade facade(identity_config());
    auto tracked = facade.controller(session.get(), 0);
    REQUIRE(tracked.snapshot->inputs.has_value());
    CHECK(tracked.snapshot->inputs->trigger_pressed);
    CHECK(tracked.snapshot->inputs->touchpad_touched);
    CHECK(tracked.snapshot->inputs->touchpad_x == -0.5f);

    device_with_handle(*rig, 102).inputs = ControllerInputs{};
    REQUIRE(session->update());

    auto frozen = facade.controller(session.get(), 0, false);
    REQUIRE(frozen.snapshot->inputs.has_value());
    CHECK(frozen.snapshot->inputs->trigger_value == 0.9f);
    CHECK(frozen.snapshot->inputs->trigger_pressed);

    auto released = facade.controller(session.get(), 0, true);
    CHECK(released.snapshot->inputs->trigger_value == 0.0f);
    CHECK_FALSE(released.snapshot->inputs->trigger_pressed);
}

TEST_CASE("Trigger press follows the configured threshold", "[query]")
{
    auto rig = make_standard_rig();
    device_with_handle(*rig, 102).inputs.trigger_value = 0.3f;

    auto session = make_session(rig);
    REQUIRE(session->update());

    TrackingConfig config = identity_config();

    config.trigger_press_threshold = 0.2f;
    QueryFacade sensitive(config);
    CHECK(sensitive.controller(session.get(), 0).snapshot->inputs->trigger_pressed);

    config.trigger_press_threshold = 0.5f;
    QueryFacade stiff(config);
    CHECK_FALSE(stiff.controller(session.get(), 0).snapshot->inputs->trigger_pressed);
}

TEST_CASE("Not found leaves the cache untouched", "[query]")
{
    auto rig = make_standard_rig();
    auto session = make_session(rig);
    REQUIRE(session->update());

    QueryFacade facade(identity_config());

    for (bool tracked : { true, false })
    {
        auto result = facade.generic_tracker(session.get(), 0, tracked);
        CHECK(result.status == QueryStatus::NotFound);
        CHECK_FALSE(result.snapshot.has_value());
        CHECK_FALSE(result.message.empty());
    }
    CHECK(facade.slot_count() == 0);
    CHECK_FALSE(facade.peek(DeviceClass::GenericTracker, 0).has_value());
}

TEST_CASE("Missing indices keep no per-key state", "[query]")
{
    auto rig = make_standard_rig();
    auto session = make_session(rig);
    REQUIRE(session->update());

    QueryFacade facade(identity_config());
    for (int index = 2; index < 1000; ++index)
    {
        CHECK(facade.controller(session.get(), index).status == QueryStatus::NotFound);
    }
    CHECK(facade.slot_count() == 0);
    CHECK(facade.failing_count() == 0);
}

TEST_CASE("Failure records clear when a slot recovers", "[query]")
{
    auto rig = make_standard_rig();
    auto session = make_session(rig);
    REQUIRE(session->update());

    QueryFacade facade(identity_config());
    REQUIRE(facade.hmd(session.get()).ok());
    CHECK(facade.failing_count() == 0);

    device_with_handle(*rig, 101).pose.valid = false;
    REQUIRE(session->update());
    CHECK(facade.hmd(session.get()).status == QueryStatus::TrackingLost);
    CHECK(facade.failing_count() == 1);

    device_with_handle(*rig, 101).pose.valid = true;
    REQUIRE(session->update());
    CHECK(facade.hmd(session.get()).ok());
    CHECK(facade.failing_count() == 0);
}

TEST_CASE("A slot survives its device disappearing", "[query]")
{
    auto rig = make_standard_rig();
    auto session = make_session(rig);
    REQUIRE(session->update());

    QueryFacade facade(identity_config());
    REQUIRE(facade.controller(session.get(), 1).ok());

    rig->devices.erase(rig->devices.begin() + 3); // right controller
    REQUIRE(session->update());

    auto result = facade.controller(session.get(), 1);
    CHECK(result.status == QueryStatus::NotFound);
    REQUIRE(result.snapshot.has_value());
    CHECK(result.snapshot->state == SlotState::Fresh);
    check_origin(result, 0.2, 1.0, -0.3);
}

TEST_CASE("Untracked query on a never-filled slot", "[query]")
{
    auto rig = make_standard_rig();
    auto session = make_session(rig);
    REQUIRE(session->update());

    QueryFacade facade(identity_config());
    auto result = facade.lighthouse(session.get(), 1, false);
    REQUIRE(result.ok());
    CHECK(result.snapshot->state == SlotState::Stale);
    CHECK_FALSE(result.snapshot->frame.has_value());
    CHECK_FALSE(result.snapshot->plane.has_value());
    CHECK(facade.slot_count() == 1);
}

TEST_CASE("Invalid input aborts before touching the cache", "[query]")
{
    auto rig = make_standard_rig();
    auto session = make_session(rig);
    REQUIRE(session->update());

    QueryFacade facade(identity_config());

    CHECK(facade.hmd(nullptr).status == QueryStatus::InvalidInput);
    CHECK(facade.controller(session.get(), -1).status == QueryStatus::InvalidInput);
    CHECK(facade.slot_count() == 0);
}

TEST_CASE("Connection failures are reported per query", "[query]")
{
    auto rig = make_standard_rig();
    auto session = make_session(rig);
    REQUIRE(session->update());

    QueryFacade facade(identity_config());
    REQUIRE(facade.hmd(session.get()).ok());

    rig->poll_error = "runtime went away";
    REQUIRE_FALSE(session->update());

    auto result = facade.hmd(session.get());
    CHECK(result.status == QueryStatus::ConnectionFailure);
    CHECK(result.message.find("runtime went away") != std::string::npos);

    // The cached slot is still there for when the session recovers
    auto cached = facade.peek(DeviceClass::HMD, 0);
    REQUIRE(cached.has_value());
    CHECK(cached->state == SlotState::Fresh);
}

TEST_CASE("Lost tracking keeps the last frame", "[query]")
{
    auto rig = make_standard_rig();
    auto session = make_session(rig);
    REQUIRE(session->update());

    QueryFacade facade(identity_config());
    REQUIRE(facade.hmd(session.get()).ok());

    device_with_handle(*rig, 101).pose.valid = false;
    REQUIRE(session->update());

    auto result = facade.hmd(session.get());
    CHECK(result.status == QueryStatus::TrackingLost);
    CHECK(result.snapshot->state == SlotState::Stale);
    check_origin(result, 0.0, 1.7, 0.0);
}

TEST_CASE("Index stability within one poll", "[query]")
{
    auto rig = make_standard_rig();
    auto session = make_session(rig);
    REQUIRE(session->update());

    QueryFacade facade(identity_config());
    auto first = facade.controller(session.get(), 1);
    auto second = facade.controller(session.get(), 1);
    REQUIRE(first.ok());
    REQUIRE(second.ok());
    CHECK(first.snapshot->frame->origin.x == second.snapshot->frame->origin.x);

    SECTION("A new device changes indices only after the next update")
    {
        rig->devices.insert(rig->devices.begin(),
                            make_device(200, RuntimeDeviceKind::Controller, "Spare Controller",
                                        translation_pose(5.0, 5.0, 5.0)));
        check_origin(facade.controller(session.get(), 0), -0.2, 1.0, -0.3);

        REQUIRE(session->update());
        check_origin(facade.controller(session.get(), 0), 5.0, 5.0, 5.0);
    }
}

TEST_CASE("Generic trackers are corrected end to end", "[query]")
{
    auto rig = std::make_shared<FakeRig>();
    rig->devices = { make_device(7, RuntimeDeviceKind::GenericTracker, "Puck", translation_pose(1.0, 0.0, 0.0)) };
    auto session = make_session(rig);
    REQUIRE(session->update());

    QueryFacade facade(identity_config());
    auto result = facade.generic_tracker(session.get(), 0);
    REQUIRE(result.ok());

    const auto& frame = *result.snapshot->frame;
    CHECK(frame.y_axis.z == -1.0);
    CHECK(frame.z_axis.y == 1.0);
    CHECK(frame.origin.x == 1.0);
}

TEST_CASE("Degenerate pose policies", "[query]")
{
    auto rig = std::make_shared<FakeRig>();
    RawPose skewed = translation_pose(0.0, 1.0, 0.0);
    skewed.matrix[0] = 2.0; // X axis stretched
    skewed.matrix[1] = 0.5; // Y axis leaning into X
    rig->devices = { make_device(1, RuntimeDeviceKind::HMD, "Headset", skewed) };

    auto session = make_session(rig);
    REQUIRE(session->update());

    TrackingConfig config = identity_config();

    SECTION("Orthonormalize repairs the frame")
    {
        config.degenerate_pose_policy = DegeneratePosePolicy::Orthonormalize;
        QueryFacade facade(config);
        auto result = facade.hmd(session.get());
        REQUIRE(result.ok());
        CHECK(is_orthonormal(*result.snapshot->frame, 1e-9));
        CHECK(result.snapshot->frame->origin.y == Catch::Approx(1.0));
    }

    SECTION("Pass-through keeps the skew")
    {
        config.degenerate_pose_policy = DegeneratePosePolicy::PassThrough;
        QueryFacade facade(config);
        auto result = facade.hmd(session.get());
        REQUIRE(result.ok());
        CHECK(result.snapshot->frame->x_axis.x == 2.0);
        CHECK_FALSE(is_orthonormal(*result.snapshot->frame, 1e-4));
    }

    SECTION("Reject reports a malformed pose and writes nothing")
    {
        config.degenerate_pose_policy = DegeneratePosePolicy::Reject;
        QueryFacade facade(config);
        auto result = facade.hmd(session.get());
        CHECK(result.status == QueryStatus::MalformedPose);
        REQUIRE(result.snapshot.has_value());
        CHECK_FALSE(result.snapshot->frame.has_value());
    }
}

TEST_CASE("Calibration re-expresses frames relative to a plane", "[query]")
{
    auto rig = make_standard_rig();
    auto session = make_session(rig);
    REQUIRE(session->update());

    QueryFacade facade(identity_config());

    DerivedPlane origin;
    origin.origin = { 0.0, 1.0, 0.0 };
    REQUIRE(facade.set_calibration_plane(origin));
    CHECK(facade.calibration()[7] == 1.0);

    check_origin(facade.hmd(session.get()), 0.0, 0.7, 0.0);

    SECTION("Degenerate planes are refused")
    {
        DerivedPlane flat;
        flat.x_axis = { 1.0, 0.0, 0.0 };
        flat.y_axis = { 3.0, 0.0, 0.0 };
        CHECK_FALSE(facade.set_calibration_plane(flat));
        CHECK(facade.calibration()[7] == 1.0);
    }

    SECTION("Clearing restores application space")
    {
        facade.clear_calibration();
        CHECK(facade.calibration() == identity_matrix());
        check_origin(facade.hmd(session.get()), 0.0, 1.7, 0.0);
    }

    SECTION("Calibrating from a device makes it the origin")
    {
        REQUIRE(facade.lighthouse(session.get(), 0).ok());
        auto calibrated = facade.calibrate_origin_from(DeviceClass::Lighthouse, 0);
        REQUIRE(calibrated.ok());
        CHECK(facade.calibration()[3] == Catch::Approx(2.0));
        CHECK(facade.calibration()[7] == Catch::Approx(2.5));

        check_origin(facade.lighthouse(session.get(), 0), 0.0, 0.0, 0.0);
        check_origin(facade.hmd(session.get()), -2.0, -0.8, -2.0);
    }

    SECTION("Calibrating twice from the same cached frame is idempotent")
    {
        REQUIRE(facade.lighthouse(session.get(), 0).ok());
        REQUIRE(facade.calibrate_origin_from(DeviceClass::Lighthouse, 0).ok());
        REQUIRE(facade.calibrate_origin_from(DeviceClass::Lighthouse, 0).ok());
        CHECK(facade.calibration()[3] == Catch::Approx(2.0));
        CHECK(facade.calibration()[7] == Catch::Approx(2.5));
        CHECK(facade.calibration()[11] == Catch::Approx(2.0));
    }

    SECTION("A frozen frame keeps the calibration it was written under")
    {
        REQUIRE(facade.lighthouse(session.get(), 0).ok());
        facade.clear_calibration();

        // The cached frame is still relative to (0, 1, 0)
        check_origin(facade.lighthouse(session.get(), 0, false), 2.0, 1.5, 2.0);
        REQUIRE(facade.calibrate_origin_from(DeviceClass::Lighthouse, 0).ok());
        CHECK(facade.calibration()[3] == Catch::Approx(2.0));
        CHECK(facade.calibration()[7] == Catch::Approx(2.5));
        CHECK(facade.calibration()[11] == Catch::Approx(2.0));
    }

    SECTION("Calibrating from an empty slot fails")
    {
        CHECK(facade.calibrate_origin_from(DeviceClass::GenericTracker, 0).status == QueryStatus::NotFound);
    }
}
