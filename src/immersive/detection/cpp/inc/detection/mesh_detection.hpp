// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "detection_subsystem.hpp"

#include <schema/mesh_bfbs_generated.h>
#include <schema/mesh_generated.h>

#include <optional>
#include <string>
#include <vector>

namespace immersive
{

// Reconstructed geometry of a real-world object (returns MeshStateT from FlatBuffer schema)
class Mesh
{
public:
    Mesh(uint64_t id, DeviceId device_id);

    uint64_t id() const
    {
        return state_.id;
    }

    DeviceId device_id() const
    {
        return device_id_;
    }

    std::optional<Pose> pose() const;
    const std::vector<Point>& vertices() const
    {
        return state_.vertices;
    }
    const std::vector<uint32_t>& indices() const
    {
        return state_.indices;
    }
    const std::string& label() const
    {
        return state_.label;
    }
    int64_t last_changed_time() const
    {
        return state_.last_changed_time;
    }
    bool tracked() const
    {
        return tracked_;
    }

    const MeshStateT& state() const
    {
        return state_;
    }

private:
    friend class MeshDetection;

    bool update(const MeshRecord& record);

    DeviceId device_id_;
    MeshStateT state_;
    bool populated_ = false;
    bool tracked_ = true;
};

class MeshDetection : public ReconcilingSubsystem<Mesh, MeshRecord, DeviceId>
{
public:
    explicit MeshDetection(bool supported) : ReconcilingSubsystem(supported)
    {
    }

    std::string_view get_name() const override
    {
        return "MeshDetection";
    }

    Feature get_feature() const override
    {
        return Feature::MeshDetection;
    }

    std::string_view get_schema_name() const override
    {
        return "immersive.MeshDetectionRecord";
    }

    std::string_view get_schema_text() const override
    {
        return std::string_view(reinterpret_cast<const char*>(MeshDetectionRecordBinarySchema::data()),
                                MeshDetectionRecordBinarySchema::size());
    }

    std::string_view get_record_channel() const override
    {
        return "meshes";
    }

    void serialize(flatbuffers::FlatBufferBuilder& builder, const Timestamp& timestamp) const override;

private:
    std::vector<MeshRecord> collect(const IFrame& frame) override
    {
        return frame.detected_meshes();
    }

    DeviceId key_of(const MeshRecord& record) const override
    {
        return record.id;
    }

    EntityPtr create_entity(const MeshRecord& record) override
    {
        return std::make_shared<Mesh>(next_local_id(), record.id);
    }

    bool update_entity(Mesh& mesh, const MeshRecord& record) override
    {
        return mesh.update(record);
    }

    void teardown_entity(Mesh& mesh) override
    {
        mesh.tracked_ = false;
        mesh.state_.is_pose_valid = false;
    }
};

} // namespace immersive
