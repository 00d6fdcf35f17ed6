// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "connection_session.hpp"
#include "device_slot_cache.hpp"
#include "tracking_config.hpp"

#include <rig_math/rig_types.hpp>

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace rigtrack
{

enum class QueryStatus
{
    Ok,
    NotFound, // no device classified at (class, index) this poll
    InvalidInput, // no session supplied, or a negative index
    ConnectionFailure, // the session's last connect/update failed
    TrackingLost, // the device exists but the runtime reported no valid pose
    MalformedPose, // the corrected pose was degenerate and the policy refused it
};

std::string_view describe(QueryStatus status);

// Everything a slot holds, copied out so callers never see a half-written slot
struct DeviceSnapshot
{
    SlotState state = SlotState::Empty;
    std::optional<CoordinateFrame> frame;
    std::optional<DerivedPlane> plane;
    std::optional<ControllerInputs> inputs;
};

struct QueryResult
{
    QueryStatus status = QueryStatus::Ok;
    std::optional<DeviceSnapshot> snapshot;
    std::string message;

    bool ok() const
    {
        return status == QueryStatus::Ok;
    }
};

/*!
 * @brief Per-role device queries over a ConnectionSession.
 *
 * The facade is the context object the host owns for the lifetime of its polling loop:
 * it holds the DeviceSlotCache and the calibration. Every query resolves (class, index)
 * against the session's current poll. A tracked query recomputes the slot from the raw
 * pose; an untracked query leaves the slot frozen and returns its last value.
 *
 * Queries never throw. All failures come back as a QueryStatus.
 */
class QueryFacade
{
public:
    explicit QueryFacade(const TrackingConfig& config = {});

    QueryResult query(const ConnectionSession* session, DeviceClass device_class, int index, bool tracked);

    QueryResult hmd(const ConnectionSession* session, bool tracked = true)
    {
        return query(session, DeviceClass::HMD, 0, tracked);
    }

    QueryResult controller(const ConnectionSession* session, int index, bool tracked = true)
    {
        return query(session, DeviceClass::Controller, index, tracked);
    }

    QueryResult lighthouse(const ConnectionSession* session, int index, bool tracked = true)
    {
        return query(session, DeviceClass::Lighthouse, index, tracked);
    }

    QueryResult generic_tracker(const ConnectionSession* session, int index, bool tracked = true)
    {
        return query(session, DeviceClass::GenericTracker, index, tracked);
    }

    /**
     * @brief Make a plane (in application space) the origin of all later tracked frames.
     *
     * The plane's axes are orthonormalized first. Slots keep their cached frames until
     * their next tracked query.
     *
     * @return false if the plane's axes cannot span a frame; the calibration is unchanged.
     */
    bool set_calibration_plane(const DerivedPlane& plane);

    // Use the cached frame of a filled slot as the new origin
    QueryResult calibrate_origin_from(DeviceClass device_class, int index);

    void clear_calibration();

    // Calibration origin in application space, column-vector convention
    Matrix4 calibration() const;

    // Copy of a slot's contents, or std::nullopt if the slot does not exist
    std::optional<DeviceSnapshot> peek(DeviceClass device_class, int index) const;

    size_t slot_count() const;

    // Keys whose last query failed and has not recovered yet
    size_t failing_count() const;

    const TrackingConfig& config() const
    {
        return config_;
    }

private:
    QueryResult finish(const SlotKey& key, QueryStatus status, std::string message, const DeviceSlot* slot);
    std::optional<CoordinateFrame> apply_degenerate_policy(const CoordinateFrame& frame, std::string& message) const;

    static DeviceSnapshot snapshot_of(const DeviceSlot& slot);

    const TrackingConfig config_;

    mutable std::mutex mutex_;
    DeviceSlotCache slots_;
    Matrix4 calibration_;
    Matrix4 calibration_inverse_;

    // Outstanding failure per slot key, so a polling loop only logs changes
    std::unordered_map<SlotKey, QueryStatus, SlotKeyHash> last_status_;
};

} // namespace rigtrack
