// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/detection/depth_sensing.hpp"

#include <algorithm>
#include <cstring>

namespace immersive
{

std::optional<float> DepthSensing::depth_at(float u, float v) const
{
    if (!available_ || state_.usage != DepthUsage_CPU || data_.empty())
    {
        return std::nullopt;
    }
    if (u < 0.0f || u > 1.0f || v < 0.0f || v > 1.0f || state_.width == 0 || state_.height == 0)
    {
        return std::nullopt;
    }

    const uint32_t x = std::min(static_cast<uint32_t>(u * state_.width), state_.width - 1);
    const uint32_t y = std::min(static_cast<uint32_t>(v * state_.height), state_.height - 1);
    const size_t index = static_cast<size_t>(y) * state_.width + x;

    if (state_.data_format == DepthFormat_Float32)
    {
        if ((index + 1) * sizeof(float) > data_.size())
        {
            return std::nullopt;
        }
        float raw = 0.0f;
        std::memcpy(&raw, data_.data() + index * sizeof(float), sizeof(float));
        return raw * state_.raw_value_to_meters;
    }

    if ((index + 1) * 2 > data_.size())
    {
        return std::nullopt;
    }
    const uint16_t raw = static_cast<uint16_t>(data_[index * 2] | (data_[index * 2 + 1] << 8));
    return static_cast<float>(raw) * state_.raw_value_to_meters;
}

std::optional<DepthUsage> DepthSensing::usage() const
{
    if (!active_)
    {
        return std::nullopt;
    }
    return state_.usage;
}

std::optional<DepthFormat> DepthSensing::data_format() const
{
    if (!active_)
    {
        return std::nullopt;
    }
    return state_.data_format;
}

void DepthSensing::on_session_start(const SessionContext& context)
{
    if (!supported_ || !context.session || context.type != SessionType::AR ||
        !context.session->has_feature(Feature::DepthSensing))
    {
        return;
    }
    active_ = true;
    state_.usage = context.session->depth_usage();
    state_.data_format = context.session->depth_data_format();
}

void DepthSensing::on_session_end()
{
    active_ = false;
    data_.clear();
    state_ = DepthStateT();
    if (available_)
    {
        available_ = false;
        emitter_.emit(SubsystemUnavailable{});
    }
}

bool DepthSensing::update(const IFrame& frame)
{
    if (!active_)
    {
        return true;
    }

    try
    {
        auto info = frame.depth_information();
        if (!info)
        {
            if (available_)
            {
                available_ = false;
                state_.is_valid = false;
                data_.clear();
                emitter_.emit(SubsystemUnavailable{});
            }
            return true;
        }

        if (!available_)
        {
            available_ = true;
            emitter_.emit(SubsystemAvailable{});
        }

        const bool resized = info->width != state_.width || info->height != state_.height;
        state_.width = info->width;
        state_.height = info->height;
        state_.raw_value_to_meters = info->raw_value_to_meters;
        state_.is_valid = true;
        data_ = std::move(info->data);

        if (resized)
        {
            emitter_.emit(DepthResized{ state_.width, state_.height });
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "DepthSensing: " << e.what() << std::endl;
        emitter_.emit(SubsystemError{ e.what() });
        return false;
    }
    return true;
}

void DepthSensing::serialize(flatbuffers::FlatBufferBuilder& builder, const Timestamp& timestamp) const
{
    auto data = DepthState::Pack(builder, &state_);

    DepthSensingRecordBuilder record_builder(builder);
    record_builder.add_data(data);
    record_builder.add_timestamp(&timestamp);
    builder.Finish(record_builder.Finish());
}

} // namespace immersive
