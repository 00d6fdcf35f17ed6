// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "fake_runtime.hpp"

#include <catch2/catch_test_macros.hpp>
#include <deviceio/connection_session.hpp>

#include <stdexcept>
#include <string>

using namespace rigtrack;
using namespace rigtrack::testing;

TEST_CASE("ConnectionSession rejects a null runtime", "[session]")
{
    CHECK_THROWS_AS(ConnectionSession(nullptr), std::invalid_argument);
}

TEST_CASE("Connect failure is recorded, not thrown", "[session]")
{
    auto rig = std::make_shared<FakeRig>();
    rig->connect_error = "runtime service not running";

    ConnectionSession session(std::make_unique<FakeRuntime>(rig));
    CHECK_FALSE(session.connect());
    CHECK_FALSE(session.state().success);
    CHECK(session.state().error_message == "runtime service not running");

    SECTION("update() keeps the connect error")
    {
        CHECK_FALSE(session.update());
        CHECK(session.state().error_message == "runtime service not running");
        CHECK(rig->begin_poll_calls == 0);
    }

    SECTION("connection_message() explains the failure")
    {
        std::string message = session.connection_message();
        CHECK(message.find("not set up correctly") != std::string::npos);
        CHECK(message.find("runtime service not running") != std::string::npos);
    }

    SECTION("A later connect() can succeed")
    {
        rig->connect_error.clear();
        CHECK(session.connect());
        CHECK(session.state().success);
        CHECK(session.state().error_message.empty());
    }
}

TEST_CASE("update() captures one poll", "[session]")
{
    auto rig = std::make_shared<FakeRig>();
    rig->devices = {
        make_device(1, RuntimeDeviceKind::HMD, "Headset", translation_pose(0.0, 1.7, 0.0)),
        make_device(2, RuntimeDeviceKind::Controller, "Left Controller", translation_pose(-0.2, 1.0, -0.3)),
        make_device(3, RuntimeDeviceKind::TrackingReference, "Base Station", translation_pose(2.0, 2.5, 2.0)),
    };
    rig->devices[1].inputs.trigger_value = 0.75f;

    auto session = make_session(rig);
    REQUIRE(session->state().success);
    CHECK(session->poll_count() == 0);

    REQUIRE(session->update());
    CHECK(session->poll_count() == 1);
    CHECK(session->devices().size() == 3);
    CHECK(rig->button_state_calls == 1);

    const RawDevice* controller = session->resolve(DeviceClass::Controller, 0);
    REQUIRE(controller != nullptr);
    CHECK(controller->descriptor.handle == 2);
    CHECK(controller->inputs.trigger_value == 0.75f);
    CHECK(controller->pose.valid);

    CHECK(session->resolve(DeviceClass::Controller, 1) == nullptr);
    CHECK(session->resolve(DeviceClass::GenericTracker, 0) == nullptr);

    SECTION("The snapshot does not follow the runtime until the next update()")
    {
        rig->devices.clear();
        CHECK(session->resolve(DeviceClass::HMD, 0) != nullptr);

        REQUIRE(session->update());
        CHECK(session->resolve(DeviceClass::HMD, 0) == nullptr);
        CHECK(session->poll_count() == 2);
    }
}

TEST_CASE("A failed poll clears the device list", "[session]")
{
    auto rig = std::make_shared<FakeRig>();
    rig->devices = { make_device(1, RuntimeDeviceKind::HMD, "Headset", translation_pose(0.0, 1.7, 0.0)) };

    auto session = make_session(rig);
    REQUIRE(session->update());
    REQUIRE(session->resolve(DeviceClass::HMD, 0) != nullptr);

    rig->poll_error = "session lost";
    CHECK_FALSE(session->update());
    CHECK_FALSE(session->state().success);
    CHECK(session->state().error_message == "session lost");
    CHECK(session->resolve(DeviceClass::HMD, 0) == nullptr);
    CHECK(session->poll_count() == 1);

    rig->poll_error.clear();
    CHECK(session->update());
    CHECK(session->state().success);
    CHECK(session->resolve(DeviceClass::HMD, 0) != nullptr);
}

TEST_CASE("report_failure() marks the session as failed", "[session]")
{
    auto rig = std::make_shared<FakeRig>();
    auto session = make_session(rig);
    REQUIRE(session->state().success);

    session->report_failure("No active OpenXR runtime found");
    CHECK_FALSE(session->state().success);
    CHECK(session->state().error_message == "No active OpenXR runtime found");
}

TEST_CASE("summary() lists counts and devices per class", "[session]")
{
    auto rig = std::make_shared<FakeRig>();
    rig->devices = {
        make_device(1, RuntimeDeviceKind::HMD, "Headset", translation_pose(0.0, 1.7, 0.0)),
        make_device(2, RuntimeDeviceKind::Controller, "Left Controller"),
        make_device(3, RuntimeDeviceKind::Controller, "Right Controller"),
        make_device(4, RuntimeDeviceKind::Unknown, "Mystery Device"),
    };

    auto session = make_session(rig);
    REQUIRE(session->update());

    std::string summary = session->summary();
    CHECK(summary.find("HMD: 1") != std::string::npos);
    CHECK(summary.find("Controller: 2") != std::string::npos);
    CHECK(summary.find("Lighthouse: 0") != std::string::npos);
    CHECK(summary.find("GenericTracker: 0") != std::string::npos);
    CHECK(summary.find("Controller[1] Right Controller (SN-3)") != std::string::npos);
    CHECK(summary.find("Mystery Device") == std::string::npos);

    CHECK(session->connection_message() == summary);
}
