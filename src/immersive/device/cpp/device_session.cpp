// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/device/device_api.hpp"

#include <algorithm>

namespace immersive
{

bool IDeviceSession::has_feature(Feature feature) const
{
    const auto features = enabled_features();
    return std::find(features.begin(), features.end(), feature) != features.end();
}

void IDeviceSession::request_hit_test_source(const HitTestOptions& /*options*/,
                                             std::function<void(DeviceId)> /*on_success*/,
                                             FailureCallback on_failure)
{
    on_failure("hit test is not supported by this session");
}

void IDeviceSession::cancel_hit_test_source(DeviceId /*source*/)
{
}

bool IDeviceSession::supports_light_probe() const
{
    return false;
}

void IDeviceSession::request_light_probe(std::function<void(DeviceId)> /*on_success*/, FailureCallback on_failure)
{
    on_failure("light probes are not supported by this session");
}

void IDeviceSession::tracked_image_scores(std::function<void(std::vector<bool>)> /*on_success*/,
                                          FailureCallback on_failure)
{
    on_failure("image tracking is not supported by this session");
}

void IDeviceSession::delete_anchor(DeviceId /*anchor*/)
{
}

bool IDeviceSession::supports_anchor_persistence() const
{
    return false;
}

void IDeviceSession::persist_anchor(DeviceId /*anchor*/,
                                    std::function<void(const std::string&)> /*on_success*/,
                                    FailureCallback on_failure)
{
    on_failure("anchor persistence is not supported by this session");
}

void IDeviceSession::restore_anchor(const std::string& /*uuid*/,
                                    std::function<void(DeviceId)> /*on_success*/,
                                    FailureCallback on_failure)
{
    on_failure("anchor persistence is not supported by this session");
}

void IDeviceSession::forget_anchor(const std::string& /*uuid*/, DoneCallback /*on_success*/, FailureCallback on_failure)
{
    on_failure("anchor persistence is not supported by this session");
}

std::vector<std::string> IDeviceSession::persistent_anchor_uuids() const
{
    return {};
}

DepthUsage IDeviceSession::depth_usage() const
{
    return DepthUsage_CPU;
}

DepthFormat IDeviceSession::depth_data_format() const
{
    return DepthFormat_LuminanceAlpha;
}

bool IDeviceSession::supports_room_capture() const
{
    return false;
}

void IDeviceSession::initiate_room_capture(DoneCallback /*on_success*/, FailureCallback on_failure)
{
    on_failure("room capture is not supported by this session");
}

} // namespace immersive
