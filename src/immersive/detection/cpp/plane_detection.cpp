// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/detection/plane_detection.hpp"

#include <oxr_utils/pose_conversions.hpp>

namespace immersive
{

// ============================================================================
// Plane
// ============================================================================

Plane::Plane(uint64_t id, DeviceId device_id) : device_id_(device_id)
{
    state_.id = id;
}

std::optional<Pose> Plane::pose() const
{
    if (!state_.is_pose_valid || !state_.pose)
    {
        return std::nullopt;
    }
    return *state_.pose;
}

bool Plane::update(const PlaneRecord& record)
{
    state_.is_pose_valid = record.pose.has_value();
    if (record.pose)
    {
        state_.pose = std::make_unique<Pose>(to_pose(*record.pose));
    }
    state_.orientation = record.orientation;

    const bool changed = record.last_changed_time != state_.last_changed_time;
    if (changed || !populated_)
    {
        state_.last_changed_time = record.last_changed_time;
        state_.label = record.label;
        state_.polygon.clear();
        state_.polygon.reserve(record.polygon.size());
        for (const auto& point : record.polygon)
        {
            state_.polygon.push_back(to_point(point));
        }
        populated_ = true;
    }
    return changed;
}

// ============================================================================
// PlaneDetection
// ============================================================================

std::vector<PlaneRecord> PlaneDetection::collect(const IFrame& frame)
{
    return frame.detected_planes();
}

DeviceId PlaneDetection::key_of(const PlaneRecord& record) const
{
    return record.id;
}

PlaneDetection::EntityPtr PlaneDetection::create_entity(const PlaneRecord& record)
{
    return std::make_shared<Plane>(next_local_id(), record.id);
}

bool PlaneDetection::update_entity(Plane& plane, const PlaneRecord& record)
{
    return plane.update(record);
}

void PlaneDetection::teardown_entity(Plane& plane)
{
    plane.tracked_ = false;
    plane.state_.is_pose_valid = false;
}

void PlaneDetection::serialize(flatbuffers::FlatBufferBuilder& builder, const Timestamp& timestamp) const
{
    std::vector<flatbuffers::Offset<PlaneState>> planes;
    for (const auto& plane : list())
    {
        planes.push_back(PlaneState::Pack(builder, &plane->state()));
    }
    auto planes_offset = builder.CreateVector(planes);

    PlaneDetectionRecordBuilder record_builder(builder);
    record_builder.add_planes(planes_offset);
    record_builder.add_timestamp(&timestamp);
    builder.Finish(record_builder.Finish());
}

} // namespace immersive
