// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "detection_subsystem.hpp"

#include <schema/plane_bfbs_generated.h>
#include <schema/plane_generated.h>

#include <optional>
#include <string>
#include <vector>

namespace immersive
{

// A real-world surface reported by the device (returns PlaneStateT from FlatBuffer schema)
class Plane
{
public:
    Plane(uint64_t id, DeviceId device_id);

    uint64_t id() const
    {
        return state_.id;
    }

    DeviceId device_id() const
    {
        return device_id_;
    }

    // Pose in the session reference space, std::nullopt when it could not be located this frame
    std::optional<Pose> pose() const;
    PlaneOrientation orientation() const
    {
        return state_.orientation;
    }
    const std::vector<Point>& polygon() const
    {
        return state_.polygon;
    }
    const std::string& label() const
    {
        return state_.label;
    }
    int64_t last_changed_time() const
    {
        return state_.last_changed_time;
    }

    // False once the device stopped reporting the plane
    bool tracked() const
    {
        return tracked_;
    }

    const PlaneStateT& state() const
    {
        return state_;
    }

private:
    friend class PlaneDetection;

    // Returns true if the device's last-changed time moved
    bool update(const PlaneRecord& record);

    DeviceId device_id_;
    PlaneStateT state_;
    bool populated_ = false;
    bool tracked_ = true;
};

class PlaneDetection : public ReconcilingSubsystem<Plane, PlaneRecord, DeviceId>
{
public:
    explicit PlaneDetection(bool supported) : ReconcilingSubsystem(supported)
    {
    }

    std::string_view get_name() const override
    {
        return NAME;
    }

    Feature get_feature() const override
    {
        return Feature::PlaneDetection;
    }

    std::string_view get_schema_name() const override
    {
        return SCHEMA_NAME;
    }

    std::string_view get_schema_text() const override
    {
        return std::string_view(reinterpret_cast<const char*>(PlaneDetectionRecordBinarySchema::data()),
                                PlaneDetectionRecordBinarySchema::size());
    }

    std::string_view get_record_channel() const override
    {
        return "planes";
    }

    void serialize(flatbuffers::FlatBufferBuilder& builder, const Timestamp& timestamp) const override;

private:
    static constexpr const char* NAME = "PlaneDetection";
    static constexpr const char* SCHEMA_NAME = "immersive.PlaneDetectionRecord";

    std::vector<PlaneRecord> collect(const IFrame& frame) override;
    DeviceId key_of(const PlaneRecord& record) const override;
    EntityPtr create_entity(const PlaneRecord& record) override;
    bool update_entity(Plane& plane, const PlaneRecord& record) override;
    void teardown_entity(Plane& plane) override;
};

} // namespace immersive
