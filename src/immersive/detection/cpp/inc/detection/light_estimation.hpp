// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "detection_subsystem.hpp"

#include <schema/light_estimate_bfbs_generated.h>
#include <schema/light_estimate_generated.h>

#include <array>
#include <optional>
#include <variant>

namespace immersive
{

/**
 * @brief Estimates the dominant real-world light of an AR session.
 *
 * Supported once a running AR session exposes light probes. Nothing is
 * estimated until start() was called; values stay empty until the first
 * estimate arrives, at which point SubsystemAvailable fires.
 */
class LightEstimation : public DetectionSubsystem
{
public:
    using Event = std::variant<SubsystemAvailable, SubsystemError>;

    LightEstimation() : DetectionSubsystem(false)
    {
    }

    std::string_view get_name() const override
    {
        return "LightEstimation";
    }

    Feature get_feature() const override
    {
        return Feature::LightEstimation;
    }

    EventSource<Event>& events()
    {
        return emitter_;
    }

    // Requests a light probe. Returns false (and emits SubsystemError) if estimation cannot start.
    bool start();

    // Drops the probe; start() may be called again
    void end();

    // Brightness of the primary light, at least 1
    std::optional<float> intensity() const;
    // Primary light colour normalised by intensity
    std::optional<Color> color() const;
    // Orientation of a directional light shining along the estimated light direction
    std::optional<Quaternion> rotation() const;
    // 9 RGB spherical harmonics coefficients
    std::optional<std::array<float, 27>> spherical_harmonics() const;

    void on_session_start(const SessionContext& context) override;
    void on_session_end() override;
    bool update(const IFrame& frame) override;

    std::string_view get_schema_name() const override
    {
        return "immersive.LightEstimationRecord";
    }

    std::string_view get_schema_text() const override
    {
        return std::string_view(reinterpret_cast<const char*>(LightEstimationRecordBinarySchema::data()),
                                LightEstimationRecordBinarySchema::size());
    }

    std::string_view get_record_channel() const override
    {
        return "light";
    }

    void serialize(flatbuffers::FlatBufferBuilder& builder, const Timestamp& timestamp) const override;

private:
    void report_error(const std::string& message);

    EventEmitter<Event> emitter_;
    std::shared_ptr<IDeviceSession> session_;
    SessionType session_type_ = SessionType::AR;
    bool probe_requested_ = false;
    std::optional<DeviceId> probe_;
    LightEstimateStateT state_;
};

} // namespace immersive
