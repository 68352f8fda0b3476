// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "detection_subsystem.hpp"

#include <schema/depth_bfbs_generated.h>
#include <schema/depth_generated.h>

#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

namespace immersive
{

struct DepthResized
{
    uint32_t width;
    uint32_t height;
};

/**
 * @brief Per-frame depth buffer of an AR session.
 *
 * Available while frames carry depth information; SubsystemUnavailable fires
 * when they stop and when the session ends.
 */
class DepthSensing : public DetectionSubsystem
{
public:
    using Event = std::variant<SubsystemAvailable, SubsystemUnavailable, DepthResized, SubsystemError>;

    explicit DepthSensing(bool supported) : DetectionSubsystem(supported)
    {
    }

    std::string_view get_name() const override
    {
        return "DepthSensing";
    }

    Feature get_feature() const override
    {
        return Feature::DepthSensing;
    }

    EventSource<Event>& events()
    {
        return emitter_;
    }

    /**
     * @brief Depth in metres at normalised buffer coordinates.
     *
     * @param u Horizontal coordinate in [0, 1], left to right.
     * @param v Vertical coordinate in [0, 1], top to bottom.
     * @return std::nullopt without a CPU depth buffer or outside [0, 1].
     */
    std::optional<float> depth_at(float u, float v) const;

    // Usage and format the device granted, empty outside a depth sensing session
    std::optional<DepthUsage> usage() const;
    std::optional<DepthFormat> data_format() const;

    uint32_t width() const
    {
        return state_.width;
    }
    uint32_t height() const
    {
        return state_.height;
    }
    float raw_value_to_meters() const
    {
        return state_.raw_value_to_meters;
    }

    void on_session_start(const SessionContext& context) override;
    void on_session_end() override;
    bool update(const IFrame& frame) override;

    std::string_view get_schema_name() const override
    {
        return "immersive.DepthSensingRecord";
    }

    std::string_view get_schema_text() const override
    {
        return std::string_view(reinterpret_cast<const char*>(DepthSensingRecordBinarySchema::data()),
                                DepthSensingRecordBinarySchema::size());
    }

    std::string_view get_record_channel() const override
    {
        return "depth";
    }

    void serialize(flatbuffers::FlatBufferBuilder& builder, const Timestamp& timestamp) const override;

private:
    EventEmitter<Event> emitter_;
    bool active_ = false;
    DepthStateT state_;
    std::vector<uint8_t> data_;
};

} // namespace immersive
