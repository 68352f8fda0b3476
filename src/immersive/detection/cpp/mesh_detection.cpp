// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/detection/mesh_detection.hpp"

#include <oxr_utils/pose_conversions.hpp>

namespace immersive
{

Mesh::Mesh(uint64_t id, DeviceId device_id) : device_id_(device_id)
{
    state_.id = id;
}

std::optional<Pose> Mesh::pose() const
{
    if (!state_.is_pose_valid || !state_.pose)
    {
        return std::nullopt;
    }
    return *state_.pose;
}

bool Mesh::update(const MeshRecord& record)
{
    state_.is_pose_valid = record.pose.has_value();
    if (record.pose)
    {
        state_.pose = std::make_unique<Pose>(to_pose(*record.pose));
    }

    // Geometry is only copied when the device says it changed
    const bool changed = record.last_changed_time != state_.last_changed_time;
    if (changed || !populated_)
    {
        state_.last_changed_time = record.last_changed_time;
        state_.label = record.label;
        state_.vertices.clear();
        state_.vertices.reserve(record.vertices.size());
        for (const auto& vertex : record.vertices)
        {
            state_.vertices.push_back(to_point(vertex));
        }
        state_.indices = record.indices;
        populated_ = true;
    }
    return changed;
}

void MeshDetection::serialize(flatbuffers::FlatBufferBuilder& builder, const Timestamp& timestamp) const
{
    std::vector<flatbuffers::Offset<MeshState>> meshes;
    for (const auto& mesh : list())
    {
        meshes.push_back(MeshState::Pack(builder, &mesh->state()));
    }
    auto meshes_offset = builder.CreateVector(meshes);

    MeshDetectionRecordBuilder record_builder(builder);
    record_builder.add_meshes(meshes_offset);
    record_builder.add_timestamp(&timestamp);
    builder.Finish(record_builder.Finish());
}

} // namespace immersive
