// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/detection/light_estimation.hpp"

#include <oxr_utils/pose_conversions.hpp>
#include <oxr_utils/pose_math.hpp>

#include <algorithm>

namespace immersive
{

bool LightEstimation::start()
{
    std::string error;
    if (!session_)
    {
        error = "XR session is not running";
    }
    else if (session_type_ != SessionType::AR)
    {
        error = "XR session type is not AR";
    }
    else if (!supported_)
    {
        error = "light-estimation is not supported";
    }
    else if (probe_ || probe_requested_)
    {
        error = "light estimation is already requested";
    }

    if (!error.empty())
    {
        report_error(error);
        return false;
    }

    probe_requested_ = true;
    std::weak_ptr<IDeviceSession> requested_for = session_;
    std::weak_ptr<bool> alive = alive_;
    session_->request_light_probe(
        [this, alive, requested_for](DeviceId probe)
        {
            if (alive.expired())
            {
                return;
            }
            const bool was_requested = probe_requested_;
            probe_requested_ = false;
            if (requested_for.lock() != session_ || !session_)
            {
                report_error("XR session is not active");
                return;
            }
            // end() in the meantime cancels the request
            if (was_requested)
            {
                probe_ = probe;
            }
        },
        [this, alive](const std::string& message)
        {
            if (alive.expired())
            {
                return;
            }
            probe_requested_ = false;
            report_error(message);
        });
    return true;
}

void LightEstimation::end()
{
    probe_requested_ = false;
    probe_.reset();
    available_ = false;
    state_ = LightEstimateStateT();
}

std::optional<float> LightEstimation::intensity() const
{
    if (!available_)
    {
        return std::nullopt;
    }
    return state_.intensity;
}

std::optional<Color> LightEstimation::color() const
{
    if (!available_ || !state_.color)
    {
        return std::nullopt;
    }
    return *state_.color;
}

std::optional<Quaternion> LightEstimation::rotation() const
{
    if (!available_ || !state_.rotation)
    {
        return std::nullopt;
    }
    return *state_.rotation;
}

std::optional<std::array<float, 27>> LightEstimation::spherical_harmonics() const
{
    if (!available_ || state_.spherical_harmonics.size() != 27)
    {
        return std::nullopt;
    }
    std::array<float, 27> result{};
    std::copy(state_.spherical_harmonics.begin(), state_.spherical_harmonics.end(), result.begin());
    return result;
}

void LightEstimation::on_session_start(const SessionContext& context)
{
    session_ = context.session;
    session_type_ = context.type;
    supported_ = session_ && session_->supports_light_probe();
}

void LightEstimation::on_session_end()
{
    end();
    supported_ = false;
    session_.reset();
}

bool LightEstimation::update(const IFrame& frame)
{
    if (!probe_)
    {
        return true;
    }

    try
    {
        auto estimate = frame.light_estimate(*probe_);
        if (!estimate)
        {
            return true;
        }

        if (!available_)
        {
            available_ = true;
            emitter_.emit(SubsystemAvailable{});
        }

        const XrVector3f& pli = estimate->primary_light_intensity;
        const float intensity = std::max(1.0f, std::max({ pli.x, pli.y, pli.z }));
        state_.intensity = intensity;
        state_.color = std::make_unique<Color>(pli.x / intensity, pli.y / intensity, pli.z / intensity);

        // A directional light shines along its local -Y, hence the quarter turn about X
        const XrQuaternionf look = look_rotation(estimate->primary_light_direction);
        const XrQuaternionf rotation =
            multiply_quaternions(look, axis_angle_quaternion(XrVector3f{ 1.0f, 0.0f, 0.0f }, 90.0f));
        state_.rotation = std::make_unique<Quaternion>(to_quaternion(rotation));

        state_.spherical_harmonics.assign(
            estimate->spherical_harmonics_coefficients.begin(), estimate->spherical_harmonics_coefficients.end());
        state_.is_valid = true;
    }
    catch (const std::exception& e)
    {
        report_error(e.what());
        return false;
    }
    return true;
}

void LightEstimation::report_error(const std::string& message)
{
    std::cerr << "LightEstimation: " << message << std::endl;
    emitter_.emit(SubsystemError{ message });
}

void LightEstimation::serialize(flatbuffers::FlatBufferBuilder& builder, const Timestamp& timestamp) const
{
    auto data = LightEstimateState::Pack(builder, &state_);

    LightEstimationRecordBuilder record_builder(builder);
    record_builder.add_data(data);
    record_builder.add_timestamp(&timestamp);
    builder.Finish(record_builder.Finish());
}

} // namespace immersive
