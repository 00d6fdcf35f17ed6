// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/deviceio/query_facade.hpp"

#include "inc/deviceio/pose_corrector.hpp"

#include <rig_math/coordinate_conversion.hpp>
#include <rig_math/transform_math.hpp>

#include <iostream>

namespace rigtrack
{

std::string_view describe(QueryStatus status)
{
    switch (status)
    {
    case QueryStatus::Ok:
        return "ok";
    case QueryStatus::NotFound:
        return "device not found";
    case QueryStatus::InvalidInput:
        return "invalid input";
    case QueryStatus::ConnectionFailure:
        return "connection failure";
    case QueryStatus::TrackingLost:
        return "tracking lost";
    case QueryStatus::MalformedPose:
        return "malformed pose";
    }
    return "unknown";
}

QueryFacade::QueryFacade(const TrackingConfig& config)
    : config_(config), calibration_(identity_matrix()), calibration_inverse_(identity_matrix())
{
}

QueryResult QueryFacade::query(const ConnectionSession* session, DeviceClass device_class, int index, bool tracked)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (session == nullptr)
    {
        return { QueryStatus::InvalidInput, std::nullopt, "No tracking session supplied" };
    }
    if (index < 0)
    {
        return { QueryStatus::InvalidInput, std::nullopt,
                 "Invalid " + std::string(to_string(device_class)) + " index " + std::to_string(index) };
    }
    if (!session->state().success)
    {
        return { QueryStatus::ConnectionFailure, std::nullopt,
                 "Tracking session is not connected: " + session->state().error_message };
    }

    const SlotKey key{ device_class, static_cast<size_t>(index) };
    const RawDevice* device = session->resolve(device_class, key.index);
    if (device == nullptr)
    {
        // The slot is neither created nor touched
        return finish(key, QueryStatus::NotFound,
                      "No " + std::string(to_string(device_class)) + " detected at index " + std::to_string(index),
                      slots_.find(key));
    }

    DeviceSlot& slot = slots_.get_or_create(key);

    if (!tracked)
    {
        slot.state = SlotState::Stale;
        return finish(key, QueryStatus::Ok, {}, &slot);
    }

    if (!device->pose.valid)
    {
        if (slot.state == SlotState::Empty || slot.state == SlotState::Fresh)
        {
            slot.state = SlotState::Stale;
        }
        return finish(key, QueryStatus::TrackingLost,
                      std::string(to_string(device_class)) + " " + std::to_string(index) + " (" +
                          device->descriptor.name + ") has no valid pose",
                      &slot);
    }

    Matrix4 m = to_application_space(device->pose.matrix, config_);
    m = correct(m, device_class);
    m = multiply(calibration_inverse_, m);

    std::string message;
    auto frame = apply_degenerate_policy(matrix_to_frame(m, kBasisInColumns), message);
    if (!frame)
    {
        slot.state = SlotState::Stale;
        return finish(key, QueryStatus::MalformedPose, message, &slot);
    }

    // Frame, plane and inputs are only ever written together
    slot.frame = *frame;
    slot.plane = frame_to_plane(*frame);
    if (device_class == DeviceClass::Controller)
    {
        ControllerInputs inputs = device->inputs;
        inputs.trigger_pressed = inputs.trigger_clicked || inputs.trigger_value > config_.trigger_press_threshold;
        slot.inputs = inputs;
    }
    slot.calibration = calibration_;
    slot.state = SlotState::Fresh;
    slot.last_handle = device->descriptor.handle;
    slot.last_fresh_poll = session->poll_count();

    return finish(key, QueryStatus::Ok, std::move(message), &slot);
}

bool QueryFacade::set_calibration_plane(const DerivedPlane& plane)
{
    auto frame = orthonormalize(plane_to_frame(plane));
    if (!frame)
    {
        std::cerr << "QueryFacade: Calibration plane axes are degenerate, calibration unchanged" << std::endl;
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    calibration_ = frame_to_matrix(*frame, kBasisInColumns);
    calibration_inverse_ = rigid_inverse(calibration_);
    std::cout << "QueryFacade: Calibration origin set to (" << frame->origin.x << ", " << frame->origin.y << ", "
              << frame->origin.z << ")" << std::endl;
    return true;
}

QueryResult QueryFacade::calibrate_origin_from(DeviceClass device_class, int index)
{
    if (index < 0)
    {
        return { QueryStatus::InvalidInput, std::nullopt,
                 "Invalid " + std::string(to_string(device_class)) + " index " + std::to_string(index) };
    }

    std::optional<DeviceSnapshot> snapshot;
    Matrix4 origin{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const DeviceSlot* slot = slots_.find({ device_class, static_cast<size_t>(index) });
        if (slot != nullptr)
        {
            snapshot = snapshot_of(*slot);
            if (slot->frame)
            {
                // Back to application space through the calibration the frame was written under
                origin = multiply(slot->calibration, frame_to_matrix(*slot->frame, kBasisInColumns));
            }
        }
    }

    if (!snapshot || !snapshot->frame)
    {
        return { QueryStatus::NotFound, snapshot,
                 "No tracked " + std::string(to_string(device_class)) + " frame at index " + std::to_string(index) };
    }

    if (!set_calibration_plane(frame_to_plane(matrix_to_frame(origin, kBasisInColumns))))
    {
        return { QueryStatus::MalformedPose, snapshot, "Cached frame cannot be used as calibration origin" };
    }
    return { QueryStatus::Ok, snapshot, {} };
}

void QueryFacade::clear_calibration()
{
    std::lock_guard<std::mutex> lock(mutex_);
    calibration_ = identity_matrix();
    calibration_inverse_ = identity_matrix();
}

Matrix4 QueryFacade::calibration() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return calibration_;
}

std::optional<DeviceSnapshot> QueryFacade::peek(DeviceClass device_class, int index) const
{
    if (index < 0)
    {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const DeviceSlot* slot = slots_.find({ device_class, static_cast<size_t>(index) });
    if (slot == nullptr)
    {
        return std::nullopt;
    }
    return snapshot_of(*slot);
}

size_t QueryFacade::slot_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

size_t QueryFacade::failing_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return last_status_.size();
}

QueryResult QueryFacade::finish(const SlotKey& key, QueryStatus status, std::string message, const DeviceSlot* slot)
{
    // Only keys with a slot are remembered, and only while a failure is outstanding.
    // A miss on an index that never had a slot is reported through the result alone.
    auto it = last_status_.find(key);
    const bool tracked_key = slot != nullptr || it != last_status_.end();
    const QueryStatus previous = it == last_status_.end() ? QueryStatus::Ok : it->second;
    if (tracked_key && status != previous)
    {
        if (status == QueryStatus::Ok)
        {
            std::cout << "QueryFacade: " << to_string(key.device_class) << "[" << key.index << "] recovered"
                      << std::endl;
        }
        else
        {
            std::cerr << "QueryFacade: " << to_string(key.device_class) << "[" << key.index
                      << "]: " << describe(status) << " - " << message << std::endl;
        }
    }

    if (status == QueryStatus::Ok)
    {
        if (it != last_status_.end())
        {
            last_status_.erase(it);
        }
    }
    else if (tracked_key)
    {
        last_status_[key] = status;
    }

    QueryResult result;
    result.status = status;
    result.message = std::move(message);
    if (slot != nullptr)
    {
        result.snapshot = snapshot_of(*slot);
    }
    return result;
}

std::optional<CoordinateFrame> QueryFacade::apply_degenerate_policy(const CoordinateFrame& frame,
                                                                    std::string& message) const
{
    if (config_.degenerate_pose_policy == DegeneratePosePolicy::PassThrough ||
        is_orthonormal(frame, config_.orthonormal_tolerance))
    {
        return frame;
    }

    if (config_.degenerate_pose_policy == DegeneratePosePolicy::Reject)
    {
        message = "Pose is not a rigid transform";
        return std::nullopt;
    }

    auto repaired = orthonormalize(frame);
    if (!repaired)
    {
        message = "Pose is not a rigid transform and cannot be orthonormalized";
        return std::nullopt;
    }
    message = "Pose was re-orthonormalized";
    return repaired;
}

DeviceSnapshot QueryFacade::snapshot_of(const DeviceSlot& slot)
{
    DeviceSnapshot snapshot;
    snapshot.state = slot.state;
    snapshot.frame = slot.frame;
    snapshot.plane = slot.plane;
    snapshot.inputs = slot.inputs;
    return snapshot;
}

} // namespace rigtrack
